// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOinfo.hpp"

#include <string>

std::string version() { return CPOAnalyzer_VERSION; }

std::string gitCommitHash() { return CPOAnalyzer_GIT_COMMIT_HASH; }

std::string kokkosVersion() { return CPOAnalyzer_Kokkos_VERSION_STRING; }

// Multi-line banner with the version, commit and Kokkos version
std::string buildSummary() {
    return "CPOAnalyzer version: " + version() + "\nCPOAnalyzer commit:  " + gitCommitHash() +
           "\nKokkos version: " + kokkosVersion();
}
