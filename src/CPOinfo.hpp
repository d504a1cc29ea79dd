// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_INFO_HPP
#define CPOANALYZER_INFO_HPP

#include "CPOconfig.hpp"

#include <string>

// Build information, printed at startup and stored in the run log
std::string version();
std::string gitCommitHash();
std::string kokkosVersion();
std::string buildSummary();

#endif
