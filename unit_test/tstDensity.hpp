// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "CPOdensity.hpp"
#include "CPOlambert.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Helper: fill a view with the given unit vectors
//---------------------------------------------------------------------------//
template <typename ViewType>
ViewType makeVectors(const std::vector<std::vector<double>> &vectors_input) {
    const int n = vectors_input.size();
    ViewType vectors("vectors", n, 3);
    auto vectors_host = Kokkos::create_mirror_view(vectors);
    for (int v = 0; v < n; v++) {
        for (int comp = 0; comp < 3; comp++)
            vectors_host(v, comp) = vectors_input[v][comp];
    }
    Kokkos::deep_copy(vectors, vectors_host);
    return vectors;
}

//---------------------------------------------------------------------------//
// density_tests
//---------------------------------------------------------------------------//
void testConcentrationParameter() {
    EXPECT_DOUBLE_EQ(concentrationParameter(9), 4.0);
    EXPECT_DOUBLE_EQ(concentrationParameter(18), 6.0);
    // Capped for large numbers of points: 2 (1 + n / 9) reaches 100 at n = 441
    EXPECT_DOUBLE_EQ(concentrationParameter(441), 100.0);
    EXPECT_DOUBLE_EQ(concentrationParameter(10000), 100.0);
    EXPECT_DOUBLE_EQ(countsStandardDeviation(9, 4.0), std::sqrt(9.0 * 1.0 / 16.0));
}

void testPeakAtOrientation() {

    using memory_space = TEST_MEMSPACE;
    using view_type_double_2d = Kokkos::View<double **, memory_space>;

    const int sphere_points = 21;
    LambertGrid<memory_space> lambert(sphere_points, Upper);
    // All grains share the pole orientation
    std::vector<std::vector<double>> pole_vectors(5, std::vector<double>{0.0, 1.0, 0.0});
    view_type_double_2d vectors = makeVectors<view_type_double_2d>(pole_vectors);
    view_type_double_2d counts = gaussianOrientationCounts(vectors, lambert.sphere_point_grid, sphere_points);
    EXPECT_EQ(counts.extent(0), sphere_points);
    EXPECT_EQ(counts.extent(1), sphere_points);
    auto counts_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), counts);

    // Counts are non-negative, and largest at the center of the grid among the cells inside the projected disk
    auto mask_host = lambert.maskHost();
    const int center = (sphere_points - 1) / 2;
    double max_count = 0.0;
    int max_i = -1, max_j = -1;
    for (int i = 0; i < sphere_points; i++) {
        for (int j = 0; j < sphere_points; j++) {
            EXPECT_GE(counts_host(i, j), 0.0);
            if ((validCell(mask_host(i, j))) && (counts_host(i, j) > max_count)) {
                max_count = counts_host(i, j);
                max_i = i;
                max_j = j;
            }
        }
    }
    EXPECT_EQ(max_i, center);
    EXPECT_EQ(max_j, center);

    // Value at the peak: n exp(0) / (3 sigma)
    const int n = 5;
    const double k = concentrationParameter(n);
    const double expected_peak = n / (standard_deviations_per_count * countsStandardDeviation(n, k));
    EXPECT_NEAR(counts_host(center, center), expected_peak, 1e-10);
    // Sharp peak: the count at the disk edge is much smaller
    EXPECT_LT(counts_host(0, center), 0.5 * expected_peak);
}

// Many identical and antiparallel vectors: capped concentration gives a narrow peak at the pole and near-zero counts
// at the equator
void testCappedPeak() {

    using memory_space = TEST_MEMSPACE;
    using view_type_double_2d = Kokkos::View<double **, memory_space>;

    const int sphere_points = 21;
    LambertGrid<memory_space> lambert(sphere_points, Upper);
    const int n = 450;
    std::vector<std::vector<double>> pole_vectors;
    for (int v = 0; v < n; v++) {
        if (v % 2 == 0)
            pole_vectors.push_back({0.0, 1.0, 0.0});
        else
            pole_vectors.push_back({0.0, -1.0, 0.0});
    }
    EXPECT_DOUBLE_EQ(concentrationParameter(n), max_concentration_parameter);
    view_type_double_2d vectors = makeVectors<view_type_double_2d>(pole_vectors);
    auto counts_host = Kokkos::create_mirror_view_and_copy(
        Kokkos::HostSpace(), gaussianOrientationCounts(vectors, lambert.sphere_point_grid, sphere_points));

    const int center = (sphere_points - 1) / 2;
    const double expected_peak =
        n / (standard_deviations_per_count * countsStandardDeviation(n, max_concentration_parameter));
    EXPECT_NEAR(counts_host(center, center), expected_peak, 1e-9 * expected_peak);
    // Edge midpoints of the grid map onto the equator
    EXPECT_LT(counts_host(0, center), 1e-6 * expected_peak);
    EXPECT_LT(counts_host(sphere_points - 1, center), 1e-6 * expected_peak);
    EXPECT_LT(counts_host(center, 0), 1e-6 * expected_peak);
    EXPECT_LT(counts_host(center, sphere_points - 1), 1e-6 * expected_peak);
}

// Axial data: a vector and its opposite give identical counts
void testAntipodalSymmetry() {

    using memory_space = TEST_MEMSPACE;
    using view_type_double_2d = Kokkos::View<double **, memory_space>;

    const int sphere_points = 9;
    LambertGrid<memory_space> lambert(sphere_points, Lower);
    const double a = 1.0 / std::sqrt(3.0);
    view_type_double_2d vectors = makeVectors<view_type_double_2d>({{a, a, a}, {0.6, 0.0, 0.8}});
    view_type_double_2d flipped = makeVectors<view_type_double_2d>({{-a, -a, -a}, {-0.6, 0.0, -0.8}});
    auto counts_host = Kokkos::create_mirror_view_and_copy(
        Kokkos::HostSpace(), gaussianOrientationCounts(vectors, lambert.sphere_point_grid, sphere_points));
    auto flipped_host = Kokkos::create_mirror_view_and_copy(
        Kokkos::HostSpace(), gaussianOrientationCounts(flipped, lambert.sphere_point_grid, sphere_points));
    for (int i = 0; i < sphere_points; i++) {
        for (int j = 0; j < sphere_points; j++)
            EXPECT_DOUBLE_EQ(counts_host(i, j), flipped_host(i, j));
    }
}

// Single grid point evaluated against a hand-computed sum of kernel weights
void testNormalization() {

    using memory_space = TEST_MEMSPACE;
    using view_type_double_2d = Kokkos::View<double **, memory_space>;

    std::vector<std::vector<double>> vectors_input = {{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.6, 0.8}};
    view_type_double_2d vectors = makeVectors<view_type_double_2d>(vectors_input);
    // 2 x 2 sampling grid with all points along Y
    view_type_double_2d sphere_point_grid =
        makeVectors<view_type_double_2d>({{0.0, 1.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, -1.0, 0.0}});
    auto counts_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(),
                                                           gaussianOrientationCounts(vectors, sphere_point_grid, 2));

    const double k = 2.0 * (1.0 + 3.0 / 9.0);
    const double sigma = std::sqrt(3.0 * (k / 2.0 - 1.0) / (k * k));
    const double expected = (std::exp(-k) + 1.0 + std::exp(k * (0.6 - 1.0))) / (3.0 * sigma);
    EXPECT_NEAR(counts_host(0, 0), expected, 1e-12);
    EXPECT_NEAR(counts_host(0, 1), expected, 1e-12);
    EXPECT_NEAR(counts_host(1, 0), expected, 1e-12);
    EXPECT_NEAR(counts_host(1, 1), expected, 1e-12);
}

void testDensityErrors() {

    using memory_space = TEST_MEMSPACE;
    using view_type_double_2d = Kokkos::View<double **, memory_space>;

    LambertGrid<memory_space> lambert(5, Upper);
    view_type_double_2d no_vectors("no_vectors", 0, 3);
    EXPECT_THROW(gaussianOrientationCounts(no_vectors, lambert.sphere_point_grid, 5), std::runtime_error);
    view_type_double_2d vectors = makeVectors<view_type_double_2d>({{0.0, 0.0, 1.0}});
    EXPECT_THROW(gaussianOrientationCounts(vectors, lambert.sphere_point_grid, 4), std::runtime_error);
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, orientation_density) {
    testConcentrationParameter();
    testPeakAtOrientation();
    testCappedPeak();
    testAntipodalSymmetry();
    testNormalization();
    testDensityErrors();
}
} // end namespace Test
