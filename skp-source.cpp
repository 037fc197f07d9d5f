#include "skp.h"


static size_t find_column(const std::vector<std::string> & header, const std::string & name) {
    for (size_t i = 0; i < header.size(); ++ i)
        if (header[i] == name)
            return i;

    throw skp_input_error(std::string("Missing required column '") + name + "' in input header");
}

static tsv_file open_tsv(std::unique_ptr<std::istream> stream) {
    try {
        return tsv_file(std::move(stream));
    } catch (const std::runtime_error & e) {
        throw skp_input_error(e.what());
    }
}

// Takes field value from the row, leaving swapped-out buffer in the row for reuse
static void take_field(std::vector<std::string> & row, size_t col, std::string & field) {
    if (col < row.size())
        field.swap(row[col]);
    else
        field.clear();
}


skp_hit_reader::skp_hit_reader(std::unique_ptr<std::istream> stream, skp_ulong batch_size):
    file(open_tsv(std::move(stream))), batch_size(batch_size)
{
    if (file.header.empty())
        throw skp_input_error("Input has no header row");

    ip_col = find_column(file.header, "ip");
    referrer_col = find_column(file.header, "referrer");
    event_list_col = find_column(file.header, "event_list");
    product_list_col = find_column(file.header, "product_list");
}

bool skp_hit_reader::next_batch(std::vector<skp_hit> & batch) {
    size_t n = 0;

    while (n < batch_size) {
        bool has_row;

        try {
            has_row = file.getrow(row);
        } catch (const std::runtime_error & e) {
            throw skp_input_error(e.what());
        }

        if (!has_row)
            break;

        if (n == batch.size())
            batch.emplace_back();

        auto & hit = batch[n ++];

        take_field(row, ip_col, hit.ip);
        take_field(row, referrer_col, hit.referrer);
        take_field(row, event_list_col, hit.event_list);
        take_field(row, product_list_col, hit.product_list);
    }

    batch.resize(n);

    return n > 0;
}


skp_hit_source::skp_hit_source(skp_stream_factory factory, skp_ulong batch_size): factory(factory), batch_size(batch_size) {
    if (batch_size == 0)
        throw std::invalid_argument("Batch size must be positive");
}

skp_hit_source skp_hit_source::from_file(const std::string & file_name, skp_ulong batch_size) {
    return skp_hit_source([file_name]() { return open_input_file(file_name); }, batch_size);
}

skp_hit_reader skp_hit_source::open() const {
    std::unique_ptr<std::istream> stream;

    try {
        stream = factory();
    } catch (const std::runtime_error & e) {
        throw skp_input_error(e.what());
    }

    return skp_hit_reader(std::move(stream), batch_size);
}
