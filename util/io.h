#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>


const std::streamsize io_buffer_size = 1024*1024;


inline bool ends_with(const std::string & s, const std::string & suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Splits keeping empty fields, "a\t\tb" gives three items. Reuses string buffers already in elems.
inline void split(const std::string & s, char delim, std::vector<std::string> & elems) {
    std::string::size_type start = 0;
    size_t n = 0;

    for (;;) {
        auto end = s.find(delim, start);
        auto len = (end == std::string::npos ? s.size() : end) - start;

        if (n < elems.size())
            elems[n].assign(s, start, len);
        else
            elems.push_back(s.substr(start, len));

        ++ n;

        if (end == std::string::npos)
            break;

        start = end + 1;
    }

    elems.resize(n);
}

inline std::vector<std::string> split(const std::string & s, char delim) {
    std::vector<std::string> elems;
    split(s, delim, elems);
    return elems;
}


// Opens file for reading, gzip-decompressed on the fly if the name ends in .gz
inline std::unique_ptr<std::istream> open_input_file(const std::string & name) {
    using namespace boost::iostreams;

    file_source source(name, std::ios_base::in | std::ios_base::binary);

    if (!source.is_open())
        throw std::runtime_error(std::string("Can't open file ") + name);

    std::unique_ptr<filtering_istream> in(new filtering_istream());

    if (ends_with(name, ".gz"))
        in->push(gzip_decompressor(), io_buffer_size, io_buffer_size);

    in->push(source, io_buffer_size, io_buffer_size);

    return std::move(in);
}


// Output file, gzip-compressed if the name ends in .gz
class output_file {
    std::string name;
    std::ofstream file;
    boost::iostreams::filtering_ostream out;
public:
    output_file(const std::string & name): name(name), file(name, std::ios_base::out | std::ios_base::binary) {
        if (!file)
            throw std::runtime_error(std::string("Can't open file ") + name + " for writing");

        if (ends_with(name, ".gz"))
            out.push(boost::iostreams::gzip_compressor(), io_buffer_size, io_buffer_size);

        out.push(file, io_buffer_size, io_buffer_size);
    }

    std::ostream & stream() {
        return out;
    }

    // Flushes the filter chain (writing the gzip trailer) and closes the file
    void finish() {
        out.reset();
        file.close();

        if (!file)
            throw std::runtime_error(std::string("Error writing file ") + name);
    }
};


// Tab separated file with a header row
class tsv_file {
    std::unique_ptr<std::istream> in;
    std::string line;
public:
    std::vector<std::string> header;
public:
    tsv_file(std::unique_ptr<std::istream> stream): in(std::move(stream)) {
        if (!in || !*in)
            throw std::runtime_error("Can't read input stream");

        getrow(header);
    }

    bool getline(std::string & res) {
        if (!std::getline(*in, res))
            return false;

        if (!res.empty() && res.back() == '\r')
            res.pop_back();

        return true;
    }

    // Reads next non-blank row, returns false at the end of the stream
    bool getrow(std::vector<std::string> & row) {
        while (getline(line)) {
            if (line.empty())
                continue;

            split(line, '\t', row);
            return true;
        }

        if (in->bad())
            throw std::runtime_error("Error reading input stream");

        return false;
    }
};
