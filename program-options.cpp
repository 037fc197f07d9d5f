#include "program-options.h"

#include <cstdlib>
#include <ctime>
#include <iostream>


program_options::program_options(int ac, char* av[]):
    desc("Allowed options"), batch_size(skp_default_batch_size), n_threads(4)
{
    using namespace boost::program_options;

    // Parsed as signed, unsigned parsing would silently wrap -1 around
    long long batch_size_arg = batch_size;
    int n_threads_arg = n_threads;

    desc.add_options()
        ("help", "print this help")
        ("input", value<std::string>(&input_file_name)->required(), "input hit log, tab separated (.gz allowed)")
        ("output,o", value<std::string>(&output_file_name), "output file (default YYYY-MM-DD_SearchKeywordPerformance.tab)")
        ("stats", value<std::string>(&stats_file_name), "file to save run statistics")
        ("batch-size", value<long long>(&batch_size_arg), "records per batch (default 500000)")
        ("threads", value<int>(&n_threads_arg), "number of extraction threads (default 4)")
    ;

    positional_options_description pos;
    pos.add("input", 1);

    variables_map vm;
    store(command_line_parser(ac, av).options(desc).positional(pos).run(), vm);

    if (vm.count("help") > 0) {
        std::cout << "Usage: " << av[0] << " [options] <input>" << std::endl;
        std::cout << desc << std::endl;
        exit(0);
    }

    notify(vm);

    if (batch_size_arg <= 0)
        throw error("batch-size must be positive");

    if (n_threads_arg <= 0)
        throw error("threads must be positive");

    batch_size = batch_size_arg;
    n_threads = n_threads_arg;

    if (output_file_name.empty())
        output_file_name = default_output_file_name();
}

std::string program_options::default_output_file_name() {
    time_t now = time(nullptr);

    char date[16];
    strftime(date, sizeof(date), "%Y-%m-%d", localtime(&now));

    return std::string(date) + "_SearchKeywordPerformance.tab";
}
