#include <algorithm>
#include <iomanip>
#include <iostream>

#include "skp.h"


// Revenue descending, then domain and keyword ascending
static bool result_row_order(const skp_result_row & a, const skp_result_row & b) {
    if (a.revenue != b.revenue)
        return a.revenue > b.revenue;

    if (a.domain != b.domain)
        return a.domain < b.domain;

    return a.keyword < b.keyword;
}


skp_result_table skp_materialize(const skp_revenue_accumulator & revenue, skp_stats & stats) {
    skp_result_table table;
    table.reserve(revenue.size());

    for (auto it = revenue.begin(); it != revenue.end(); ++ it) {
        if (!(it->second > 0))
            continue;

        skp_result_row row;
        row.domain = it->first.domain;
        row.keyword = it->first.keyword;
        row.revenue = it->second;

        table.push_back(std::move(row));
    }

    std::sort(table.begin(), table.end(), result_row_order);

    stats.unique_keywords = table.size();
    stats.total_revenue = 0.0;

    for (auto it = table.begin(); it != table.end(); ++ it)
        stats.total_revenue += it->revenue;

    return table;
}


void skp_write_result_table(std::ostream & out, const skp_result_table & table) {
    out << "Search Engine Domain\tSearch Keyword\tRevenue\n";
    out << std::fixed << std::setprecision(2);

    for (auto it = table.begin(); it != table.end(); ++ it)
        out << it->domain << "\t" << it->keyword << "\t" << it->revenue << "\n";
}

void skp_write_result_table(const std::string & file_name, const skp_result_table & table) {
    try {
        output_file file(file_name);
        skp_write_result_table(file.stream(), table);
        file.finish();
    } catch (const std::runtime_error & e) {
        throw skp_output_error(e.what());
    }
}


void skp_write_stats(std::ostream & out, const skp_stats & stats) {
    out << "rows_processed\t" << stats.rows_processed << "\n"
        << "purchases_found\t" << stats.purchases_found << "\n"
        << "unique_keywords\t" << stats.unique_keywords << "\n"
        << "total_revenue\t" << std::fixed << std::setprecision(2) << stats.total_revenue << "\n"
        << "rows_skipped\t" << stats.rows_skipped << "\n"
        << "referred_visitors\t" << stats.referred_visitors << "\n";
}

void skp_write_stats(const std::string & file_name, const skp_stats & stats) {
    try {
        output_file file(file_name);
        skp_write_stats(file.stream(), stats);
        file.finish();
    } catch (const std::runtime_error & e) {
        throw skp_output_error(e.what());
    }
}


skp_result_table skp_process(const skp_hit_source & source, skp_stats & stats, const skp_options & opts) {
    // Both state stores are owned by this run and dropped when it ends
    skp_referral_index index;
    skp_revenue_accumulator revenue;

    stats = skp_stats();

    skp_build_referral_index(source, index, opts);
    stats.referred_visitors = index.size();

    skp_aggregate_revenue(source, index, revenue, stats, opts);

    return skp_materialize(revenue, stats);
}
