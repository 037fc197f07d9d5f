#include <gtest/gtest.h>

#include "test-helpers.h"


TEST(Materialize, SortsByRevenueThenDomainThenKeyword) {
    skp_revenue_accumulator revenue;

    revenue.add(skp_referral_key { "www.bing.com", "zune" }, 50.0);
    revenue.add(skp_referral_key { "www.google.com", "ipod" }, 290.0);
    revenue.add(skp_referral_key { "bing.com", "zune" }, 50.0);
    revenue.add(skp_referral_key { "bing.com", "ipod" }, 50.0);

    skp_stats stats;
    auto table = skp_materialize(revenue, stats);

    ASSERT_EQ(4u, table.size());

    EXPECT_EQ("www.google.com", table[0].domain);
    EXPECT_EQ("bing.com", table[1].domain);
    EXPECT_EQ("ipod", table[1].keyword);
    EXPECT_EQ("bing.com", table[2].domain);
    EXPECT_EQ("zune", table[2].keyword);
    EXPECT_EQ("www.bing.com", table[3].domain);

    EXPECT_EQ(4u, stats.unique_keywords);
    EXPECT_DOUBLE_EQ(440.0, stats.total_revenue);
}

TEST(Materialize, EmptyAccumulator) {
    skp_revenue_accumulator revenue;
    skp_stats stats;

    auto table = skp_materialize(revenue, stats);

    EXPECT_TRUE(table.empty());
    EXPECT_EQ(0u, stats.unique_keywords);
    EXPECT_EQ(0.0, stats.total_revenue);
}


TEST(ResultWriter, FormatsRevenueWithTwoDecimals) {
    skp_result_table table;
    table.push_back(skp_result_row { "www.google.com", "ipod", 290.0 });
    table.push_back(skp_result_row { "www.bing.com", "zune hd", 19.999 });
    table.push_back(skp_result_row { "msn.com", "", 0.5 });

    std::ostringstream out;
    skp_write_result_table(out, table);

    EXPECT_EQ("Search Engine Domain\tSearch Keyword\tRevenue\n"
              "www.google.com\tipod\t290.00\n"
              "www.bing.com\tzune hd\t20.00\n"
              "msn.com\t\t0.50\n", out.str());
}

TEST(ResultWriter, EmptyTableIsHeaderOnly) {
    std::ostringstream out;
    skp_write_result_table(out, skp_result_table());

    EXPECT_EQ("Search Engine Domain\tSearch Keyword\tRevenue\n", out.str());
}

TEST(ResultWriter, WritesPlainAndGzipFiles) {
    skp_stats stats;
    auto table = skp_process(memory_source(sample_data), stats);

    const std::string expected =
        "Search Engine Domain\tSearch Keyword\tRevenue\n"
        "www.google.com\tipod\t290.00\n"
        "www.bing.com\tzune\t250.00\n";

    temp_file plain(".tab"), compressed(".tab.gz");

    skp_write_result_table(plain.name, table);
    skp_write_result_table(compressed.name, table);

    EXPECT_EQ(expected, plain.read());
    EXPECT_EQ(expected, compressed.read());
}

TEST(ResultWriter, UnwritableOutputIsFatal) {
    EXPECT_THROW(skp_write_result_table("/nonexistent/dir/out.tab", skp_result_table()), skp_output_error);
}

TEST(ResultWriter, RepeatedRunsGiveIdenticalOutput) {
    auto source = memory_source(sample_data, 1);

    std::ostringstream first, second;
    skp_stats stats;

    skp_write_result_table(first, skp_process(source, stats));
    skp_write_result_table(second, skp_process(source, stats));

    EXPECT_EQ(first.str(), second.str());
    EXPECT_EQ(4u, stats.rows_processed);
}


TEST(StatsWriter, NameValueLines) {
    skp_stats stats;
    skp_process(memory_source(sample_data), stats);

    std::ostringstream out;
    skp_write_stats(out, stats);

    EXPECT_EQ("rows_processed\t4\n"
              "purchases_found\t2\n"
              "unique_keywords\t2\n"
              "total_revenue\t540.00\n"
              "rows_skipped\t0\n"
              "referred_visitors\t2\n", out.str());
}
