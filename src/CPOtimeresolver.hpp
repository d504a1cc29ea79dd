// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_TIMERESOLVER_HPP
#define CPOANALYZER_TIMERESOLVER_HPP

#include <string>
#include <vector>

// Read the physical times of the timesteps at which particle orientation output was written, in timestep order
std::vector<double> readTimestepTimes(const std::string time_data_file, const std::string marker = "particle_LPO");
// Index of the recorded timestep closest to "requested_time"
int resolveTimestep(const std::vector<double> &times, const double requested_time);

#endif
