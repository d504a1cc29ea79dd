// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_DENSITY_HPP
#define CPOANALYZER_DENSITY_HPP

#include <Kokkos_Core.hpp>

#include <stdexcept>
#include <string>

// Empirical constants of the Gaussian-kernel counting method (Robin and Jowett, 1986)
constexpr double max_concentration_parameter = 100.0;
constexpr double standard_deviations_per_count = 3.0;

// Concentration parameter of the kernel for n data points, capped at 100
KOKKOS_INLINE_FUNCTION double concentrationParameter(const int n) {
    return Kokkos::fmin(max_concentration_parameter, 2.0 * (1.0 + static_cast<double>(n) / 9.0));
}

// Standard deviation of the counts expected for a uniform distribution of n points
KOKKOS_INLINE_FUNCTION double countsStandardDeviation(const int n, const double k) {
    return Kokkos::sqrt(static_cast<double>(n) * (k / 2.0 - 1.0) / (k * k));
}

// Density of the orientations "vectors" (n x 3 unit vectors, axial data) evaluated at each point of
// "sphere_point_grid" (sphere_points^2 x 3), returned as a sphere_points x sphere_points matrix in the memory space
// of the inputs. Every grid point is evaluated, including those outside of the projected disk
template <typename ViewType2D>
ViewType2D gaussianOrientationCounts(const ViewType2D vectors, const ViewType2D sphere_point_grid,
                                     const int sphere_points) {

    using execution_space = typename ViewType2D::execution_space;

    const int n = vectors.extent(0);
    if (n < 1)
        throw std::runtime_error("Error: at least one orientation is required to compute a density field");
    const int num_points = sphere_points * sphere_points;
    if (static_cast<int>(sphere_point_grid.extent(0)) != num_points)
        throw std::runtime_error("Error: sampling grid has " + std::to_string(sphere_point_grid.extent(0)) +
                                 " points, expected " + std::to_string(num_points));

    const double k = concentrationParameter(n);
    const double std_dev = countsStandardDeviation(n, k);
    const double normalization = standard_deviations_per_count * std_dev;

    ViewType2D counts(Kokkos::ViewAllocateWithoutInitializing("counts"), sphere_points, sphere_points);
    Kokkos::parallel_for(
        "GaussianOrientationCounts", Kokkos::RangePolicy<execution_space>(0, num_points),
        KOKKOS_LAMBDA(const int point) {
            double weight_sum = 0.0;
            for (int v = 0; v < n; v++) {
                const double cos_alpha = Kokkos::abs(vectors(v, 0) * sphere_point_grid(point, 0) +
                                                     vectors(v, 1) * sphere_point_grid(point, 1) +
                                                     vectors(v, 2) * sphere_point_grid(point, 2));
                weight_sum += Kokkos::exp(k * (cos_alpha - 1.0));
            }
            counts(point / sphere_points, point % sphere_points) = weight_sum / normalization;
        });
    Kokkos::fence();
    return counts;
}

#endif
