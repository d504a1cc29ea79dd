// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_TEST_NOBACKEND_CATEGORY_HPP
#define CPOANALYZER_TEST_NOBACKEND_CATEGORY_HPP

// Host-only tests that do not use Kokkos
#define TEST_CATEGORY nobackend

#endif
