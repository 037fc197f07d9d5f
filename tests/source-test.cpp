#include <gtest/gtest.h>

#include "test-helpers.h"


static skp_ulong count_rows(const skp_hit_source & source, size_t * batches = nullptr) {
    auto reader = source.open();
    std::vector<skp_hit> batch;

    skp_ulong rows = 0;
    size_t n = 0;

    while (reader.next_batch(batch)) {
        EXPECT_LE(batch.size(), source.get_batch_size());
        rows += batch.size();
        ++ n;
    }

    if (batches != nullptr)
        *batches = n;

    return rows;
}


TEST(HitSource, ReadsRequiredColumnsByName) {
    auto source = memory_source(sample_data);
    auto reader = source.open();

    std::vector<skp_hit> batch;
    ASSERT_TRUE(reader.next_batch(batch));
    ASSERT_EQ(4u, batch.size());

    EXPECT_EQ("67.98.123.1", batch[0].ip);
    EXPECT_EQ("", batch[0].event_list);
    EXPECT_EQ("", batch[0].product_list);
    EXPECT_EQ("http://www.google.com/search?q=Ipod", batch[0].referrer);

    EXPECT_EQ("23.8.61.21", batch[2].ip);
    EXPECT_EQ("1", batch[2].event_list);
    EXPECT_EQ("Electronics;Zune - 32GB;1;250;", batch[2].product_list);

    EXPECT_FALSE(reader.next_batch(batch));
    EXPECT_TRUE(batch.empty());
}

TEST(HitSource, SplitsIntoBatches) {
    size_t batches;

    EXPECT_EQ(4u, count_rows(memory_source(sample_data, 3), &batches));
    EXPECT_EQ(2u, batches);

    EXPECT_EQ(4u, count_rows(memory_source(sample_data, 1), &batches));
    EXPECT_EQ(4u, batches);

    EXPECT_EQ(4u, count_rows(memory_source(sample_data, 4), &batches));
    EXPECT_EQ(1u, batches);
}

TEST(HitSource, EachOpenStartsFromTheTop) {
    auto source = memory_source(sample_data, 2);

    EXPECT_EQ(4u, count_rows(source));
    EXPECT_EQ(4u, count_rows(source));
}

TEST(HitSource, SkipsBlankLinesAndCarriageReturns) {
    auto source = memory_source("ip\treferrer\tevent_list\tproduct_list\r\n\r\n1.1.1.1\thttp://bing.com/?q=a\t1\tA;B;1;5;\r\n\n2.2.2.2\t\t\t\r\n");
    auto reader = source.open();

    std::vector<skp_hit> batch;
    ASSERT_TRUE(reader.next_batch(batch));
    ASSERT_EQ(2u, batch.size());

    EXPECT_EQ("1.1.1.1", batch[0].ip);
    EXPECT_EQ("A;B;1;5;", batch[0].product_list);
    EXPECT_EQ("2.2.2.2", batch[1].ip);
    EXPECT_EQ("", batch[1].product_list);
}

TEST(HitSource, ShortRowsGetEmptyFields) {
    auto source = memory_source("referrer\tip\textra\tevent_list\tproduct_list\nhttp://x.com/\t1.1.1.1\n\t\t\t1\tA;B;1;5;\tmore\tfields\n");
    auto reader = source.open();

    std::vector<skp_hit> batch;
    ASSERT_TRUE(reader.next_batch(batch));
    ASSERT_EQ(2u, batch.size());

    EXPECT_EQ("1.1.1.1", batch[0].ip);
    EXPECT_EQ("http://x.com/", batch[0].referrer);
    EXPECT_EQ("", batch[0].event_list);
    EXPECT_EQ("", batch[0].product_list);

    EXPECT_EQ("", batch[1].ip);
    EXPECT_EQ("1", batch[1].event_list);
    EXPECT_EQ("A;B;1;5;", batch[1].product_list);
}

TEST(HitSource, MissingColumnIsFatal) {
    auto source = memory_source("ip\treferrer\tevent_list\n1.1.1.1\t\t1\n");

    try {
        source.open();
        FAIL() << "Expected skp_input_error";
    } catch (const skp_input_error & e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("product_list"));
    }
}

TEST(HitSource, EmptyInputIsFatal) {
    EXPECT_THROW(memory_source("").open(), skp_input_error);
    EXPECT_THROW(memory_source("\n\n").open(), skp_input_error);
}

TEST(HitSource, MissingFileIsFatal) {
    EXPECT_THROW(skp_hit_source::from_file("/nonexistent/hits.tsv").open(), skp_input_error);
}

TEST(HitSource, ZeroBatchSizeIsRejected) {
    EXPECT_THROW(memory_source(sample_data, 0), std::invalid_argument);
}

TEST(HitSource, ReadsPlainAndGzipFiles) {
    temp_file plain(".tsv"), compressed(".tsv.gz");

    plain.write(sample_data);
    compressed.write(sample_data);

    EXPECT_EQ(4u, count_rows(skp_hit_source::from_file(plain.name, 3)));
    EXPECT_EQ(4u, count_rows(skp_hit_source::from_file(compressed.name, 3)));
}
