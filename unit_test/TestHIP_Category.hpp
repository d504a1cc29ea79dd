// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_TEST_HIP_CATEGORY_HPP
#define CPOANALYZER_TEST_HIP_CATEGORY_HPP

#define TEST_CATEGORY hip
#define TEST_EXECSPACE Kokkos::HIP
#define TEST_MEMSPACE Kokkos::HIPSpace
#define TEST_DEVICE Kokkos::Device<Kokkos::HIP, Kokkos::HIPSpace>

#endif
