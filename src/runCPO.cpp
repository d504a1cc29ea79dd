// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOAnalyzer.hpp"
#include "runCPO.hpp"

#include "mpi.h"

#include <string>

int runCPOAnalyzer(int id, int np, std::string input_file) {

    // Run on the default space.
    using memory_space = Kokkos::DefaultExecutionSpace::memory_space;

    // Create timers
    Timers timers(id);
    timers.startInit();

    // Read input file
    Inputs inputs(id, input_file);

    return runExperiments<memory_space>(id, np, inputs, timers);
}
