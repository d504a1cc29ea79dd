// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOtimeresolver.hpp"
#include "CPOparsefiles.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

// Lines of the statistics file are "<timestep> <time> ... <output file name>", with a "#" comment block at the top
// describing the columns. Only lines naming a particle orientation output file are kept
std::vector<double> readTimestepTimes(const std::string time_data_file, const std::string marker) {

    std::ifstream time_data_stream(time_data_file);
    if (!(time_data_stream.is_open()))
        throw std::runtime_error("Error: Could not locate/open time data file \"" + time_data_file + "\"");

    std::vector<double> times;
    std::string read_line;
    int line_number = 0;
    while (std::getline(time_data_stream, read_line)) {
        line_number++;
        std::string line = collapseSpaces(trimWhitespace(read_line));
        if ((line.empty()) || (line[0] == '#'))
            continue;
        if (line.find(marker) == std::string::npos)
            continue;
        std::vector<std::string> parsed_line = splitWhitespace(line);
        if (parsed_line.size() < 2)
            throw std::runtime_error("Error: Line " + std::to_string(line_number) + " of time data file \"" +
                                     time_data_file + "\" does not contain a time value");
        times.push_back(getInputDouble(parsed_line[1], "time data file \"" + time_data_file + "\", line " +
                                                           std::to_string(line_number)));
    }
    time_data_stream.close();
    return times;
}

// Times are assumed to be in ascending order. Equal distances to the timesteps before and after the requested time
// resolve to the earlier timestep
int resolveTimestep(const std::vector<double> &times, const double requested_time) {

    const int num_times = times.size();
    if (num_times == 0)
        throw std::runtime_error("Error: No timesteps are available to resolve time " + std::to_string(requested_time));

    int after = num_times - 1;
    for (int n = 0; n < num_times; n++) {
        if (times[n] > requested_time) {
            after = n;
            break;
        }
    }
    const int before = (after > 0) ? after - 1 : 0;
    if (std::abs(times[before] - requested_time) <= std::abs(times[after] - requested_time))
        return before;
    else
        return after;
}
