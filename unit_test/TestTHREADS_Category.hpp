// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_TEST_THREADS_CATEGORY_HPP
#define CPOANALYZER_TEST_THREADS_CATEGORY_HPP

#define TEST_CATEGORY threads
#define TEST_EXECSPACE Kokkos::Threads
#define TEST_MEMSPACE Kokkos::HostSpace
#define TEST_DEVICE Kokkos::Device<Kokkos::Threads, Kokkos::HostSpace>

#endif
