// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOparsefiles.hpp"

#include <zlib.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <regex>
#include <stdexcept>
#include <vector>

// Functions that are used to simplify the parsing of input and data files

//*****************************************************************************/
// Remove leading and trailing whitespace (including carriage returns) from "line"
std::string trimWhitespace(const std::string line) {
    std::size_t start = line.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    std::size_t end = line.find_last_not_of(" \t\r\n");
    return line.substr(start, end - start + 1);
}

// Replace each run of spaces or tabs in "line" with a single space
std::string collapseSpaces(std::string line) {
    std::regex r("[ \\t]+");
    return std::regex_replace(line, r, " ");
}

// Split "line" at runs of whitespace, ignoring leading and trailing whitespace
std::vector<std::string> splitWhitespace(const std::string line) {
    std::istringstream ss(line);
    std::vector<std::string> parsed_line{std::istream_iterator<std::string>(ss), std::istream_iterator<std::string>()};
    return parsed_line;
}

// Convert string "val_input" to a double, throwing an error naming "context" if the whole string is not a number
double getInputDouble(const std::string val_input, const std::string context) {
    std::string val = trimWhitespace(val_input);
    std::size_t num_parsed = 0;
    double DoubleFromString;
    try {
        DoubleFromString = std::stod(val, &num_parsed);
    }
    catch (const std::exception &) {
        throw std::runtime_error("Error: Could not parse \"" + val_input + "\" as a number (" + context + ")");
    }
    if (num_parsed != val.size())
        throw std::runtime_error("Error: Could not parse \"" + val_input + "\" as a number (" + context + ")");
    return DoubleFromString;
}

// Convert string "val_input" to a base 10 integer, throwing an error naming "context" on failure
long getInputLong(const std::string val_input, const std::string context) {
    std::string val = trimWhitespace(val_input);
    std::size_t num_parsed = 0;
    long LongFromString;
    try {
        LongFromString = std::stol(val, &num_parsed, 10);
    }
    catch (const std::exception &) {
        throw std::runtime_error("Error: Could not parse \"" + val_input + "\" as an integer (" + context + ")");
    }
    if (num_parsed != val.size())
        throw std::runtime_error("Error: Could not parse \"" + val_input + "\" as an integer (" + context + ")");
    return LongFromString;
}

bool checkFileExists(const std::string path, const int id, const bool error) {
    std::ifstream stream;
    stream.open(path);
    if (!(stream.is_open())) {
        stream.close();
        if (error)
            throw std::runtime_error("Could not locate/open \"" + path + "\"");
        else
            return false;
    }
    stream.close();
    if (id == 0)
        std::cout << "Opened \"" << path << "\"" << std::endl;
    return true;
}

// A file containing zero bytes is a valid shard with no particles in it
bool checkFileEmpty(const std::string path) {
    std::ifstream stream(path, std::ios::binary | std::ios::ate);
    if (!(stream.is_open()))
        throw std::runtime_error("Could not locate/open \"" + path + "\"");
    return (stream.tellg() == 0);
}

// Decompress a zlib (or gzip) stream held in memory
std::string inflateData(const std::string &compressed_data, const std::string filename) {

    z_stream strm = {};
    // windowBits of 15 + 32 detects either zlib or gzip headers
    if (inflateInit2(&strm, 15 + 32) != Z_OK)
        throw std::runtime_error("Error: Failed to initialize zlib inflate for \"" + filename + "\"");
    strm.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed_data.data()));
    strm.avail_in = static_cast<uInt>(compressed_data.size());

    std::string decompressed_data;
    std::vector<char> outbuf(256 * 1024);
    int ret;
    do {
        strm.next_out = reinterpret_cast<Bytef *>(outbuf.data());
        strm.avail_out = static_cast<uInt>(outbuf.size());
        ret = inflate(&strm, Z_NO_FLUSH);
        if ((ret == Z_STREAM_ERROR) || (ret == Z_DATA_ERROR) || (ret == Z_MEM_ERROR) || (ret == Z_NEED_DICT)) {
            inflateEnd(&strm);
            throw std::runtime_error("Error: Could not decompress \"" + filename + "\" (zlib error code " +
                                     std::to_string(ret) + ")");
        }
        decompressed_data.append(outbuf.data(), outbuf.size() - strm.avail_out);
        // No progress and no more input means a truncated stream
        if ((ret == Z_BUF_ERROR) || ((strm.avail_in == 0) && (strm.avail_out != 0) && (ret != Z_STREAM_END))) {
            inflateEnd(&strm);
            throw std::runtime_error("Error: Compressed data in \"" + filename + "\" is truncated");
        }
    } while (ret != Z_STREAM_END);
    inflateEnd(&strm);
    return decompressed_data;
}

// Read all of "path" into a string, inflating it first if the data is compressed
std::string readFileContents(const std::string path, const bool compressed) {
    std::ifstream input_data_stream(path, std::ios::binary);
    if (!(input_data_stream.is_open()))
        throw std::runtime_error("Could not locate/open \"" + path + "\"");
    std::ostringstream contents;
    contents << input_data_stream.rdbuf();
    input_data_stream.close();
    if (compressed)
        return inflateData(contents.str(), path);
    else
        return contents.str();
}
