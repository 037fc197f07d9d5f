#pragma once

#include <string>

#include <boost/program_options.hpp>

#include "skp.h"


class program_options {
    boost::program_options::options_description desc;
public:
    std::string input_file_name;
    std::string output_file_name;
    std::string stats_file_name;

    skp_ulong batch_size;
    uint n_threads;
public:
    // Throws boost::program_options::error on invalid command line, exits on --help
    program_options(int ac, char* av[]);
private:
    static std::string default_output_file_name();
};
