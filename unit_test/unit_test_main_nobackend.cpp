// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>

#include <mpi.h>

// Same as unit_test_main, but does not initialize Kokkos: tests using it only read and parse files on the host
int main(int argc, char *argv[]) {
    MPI_Init(&argc, &argv);
    ::testing::InitGoogleTest(&argc, argv);
    int return_val = RUN_ALL_TESTS();
    MPI_Finalize();
    return return_val;
}
