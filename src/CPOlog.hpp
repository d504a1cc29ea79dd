// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_LOG_HPP
#define CPOANALYZER_LOG_HPP

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// Progress messages of one MPI rank. Each message is written as a whole line prefixed with the rank, so lines from
// concurrent writers are never interleaved
class ProgressLog {
    int id;
    std::ostream &stream;
    std::mutex write_mutex;

  public:
    ProgressLog(const int mpi_id, std::ostream &stream_input = std::cout)
        : id(mpi_id)
        , stream(stream_input) {}

    void print(const std::string message) {
        std::stringstream line;
        line << "[rank " << id << "] " << message << "\n";
        std::lock_guard<std::mutex> lock(write_mutex);
        stream << line.str() << std::flush;
    }

    void printWarning(const std::string message) { print("Warning: " + message); }
};

#endif
