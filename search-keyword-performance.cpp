#include "skp.h"
#include "program-options.h"

#include <iomanip>
#include <iostream>
#include <sstream>


// 1234567.891 -> 1,234,567.89
std::string format_money(skp_double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;

    std::string s = ss.str();
    auto int_end = s.find('.');

    for (int pos = int(int_end) - 3; pos > 0; pos -= 3)
        s.insert(pos, ",");

    return s;
}

void print_table(const skp_result_table & table) {
    using namespace std;

    size_t domain_width = 20, keyword_width = 14;

    for (auto it = table.begin(); it != table.end(); ++ it) {
        domain_width = max(domain_width, it->domain.size());
        keyword_width = max(keyword_width, it->keyword.size());
    }

    cout << left << setw(domain_width) << "Search Engine Domain" << "  "
         << setw(keyword_width) << "Search Keyword" << "  "
         << right << setw(12) << "Revenue" << endl;

    for (auto it = table.begin(); it != table.end(); ++ it)
        cout << left << setw(domain_width) << it->domain << "  "
             << setw(keyword_width) << it->keyword << "  "
             << right << setw(12) << fixed << setprecision(2) << it->revenue << endl;
}


int main(int ac, char* av[]) {
    using namespace std;

    try {
        program_options opts(ac, av);

        skp_options run_opts;
        run_opts.n_threads = opts.n_threads;
        run_opts.verbose = true;

        auto source = skp_hit_source::from_file(opts.input_file_name, opts.batch_size);

        skp_stats stats;
        auto table = skp_process(source, stats, run_opts);

        skp_write_result_table(opts.output_file_name, table);

        if (!opts.stats_file_name.empty())
            skp_write_stats(opts.stats_file_name, stats);

        cout << endl << string(50, '=') << endl;
        print_table(table);

        cout << endl << "Rows processed: " << stats.rows_processed
             << ", purchases: " << stats.purchases_found
             << ", keywords: " << stats.unique_keywords << endl;
        cout << "Total Revenue: $" << format_money(stats.total_revenue) << endl;
        cout << "Output: " << opts.output_file_name << endl;
    } catch (const boost::program_options::error & e) {
        cerr << "Error: " << e.what() << endl;
        cerr << "Try --help for the list of options" << endl;
        return 2;
    } catch (const exception & e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
