// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_LAMBERT_HPP
#define CPOANALYZER_LAMBERT_HPP

#include "CPOtypes.hpp"

#include <Kokkos_Core.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

// Square sampling grid in a Lambert equal-area projection, mapped onto unit vectors on one hemisphere of the sphere.
// Point (i, j) of the planar grid is stored at index i * sphere_points + j of the flattened point grid
template <typename MemorySpace>
struct LambertGrid {

    using memory_space = MemorySpace;
    using execution_space = typename memory_space::execution_space;
    using view_type_double_2d = Kokkos::View<double **, memory_space>;
    using view_type_double_2d_host = typename view_type_double_2d::HostMirror;

    // Planar coordinates run from -sqrt(2) to sqrt(2), cells with a planar radius at or beyond this value are outside
    // of the projected disk
    static constexpr double mask_radius_tolerance = 0.001;

    int sphere_points;
    Hemisphere hemisphere;
    // Planar coordinates (X varies along columns, Z decreases from the top row to the bottom row) and validity mask (1
    // inside the projected disk, NaN outside)
    view_type_double_2d x_plane, z_plane, mask;
    // Hemisphere unit vector for each planar grid point (sphere_points^2 x 3)
    view_type_double_2d sphere_point_grid;

    LambertGrid(const int sphere_points_input, const Hemisphere hemisphere_input)
        : sphere_points(sphere_points_input)
        , hemisphere(hemisphere_input) {

        if (sphere_points < 2)
            throw std::runtime_error("Error: the number of sphere points must be at least 2, not " +
                                     std::to_string(sphere_points));
        x_plane = view_type_double_2d(Kokkos::ViewAllocateWithoutInitializing("x_plane"), sphere_points, sphere_points);
        z_plane = view_type_double_2d(Kokkos::ViewAllocateWithoutInitializing("z_plane"), sphere_points, sphere_points);
        mask = view_type_double_2d(Kokkos::ViewAllocateWithoutInitializing("mask"), sphere_points, sphere_points);
        sphere_point_grid = view_type_double_2d(Kokkos::ViewAllocateWithoutInitializing("sphere_point_grid"),
                                                sphere_points * sphere_points, 3);
        buildGrid();
    }

    void buildGrid() {

        // Local copies for the device lambda
        const int n = sphere_points;
        const bool upper = (hemisphere == Upper);
        const double max_planar = Kokkos::sqrt(2.0);
        const double spacing = 2.0 * max_planar / static_cast<double>(n - 1);
        const double mask_radius = max_planar + mask_radius_tolerance;
        const double nan_value = std::numeric_limits<double>::quiet_NaN();
        auto x_plane_local = x_plane;
        auto z_plane_local = z_plane;
        auto mask_local = mask;
        auto sphere_point_grid_local = sphere_point_grid;

        auto policy = Kokkos::MDRangePolicy<execution_space, Kokkos::Rank<2>>({0, 0}, {n, n});
        Kokkos::parallel_for(
            "LambertGridInit", policy, KOKKOS_LAMBDA(const int i, const int j) {
                // Planar coordinates: linspace value j along columns, linspace value n - 1 - i along rows. The last
                // point is set directly to land exactly on sqrt(2)
                const double x_planar = (j == n - 1) ? max_planar : -max_planar + j * spacing;
                const double z_planar = (i == 0) ? max_planar : -max_planar + (n - 1 - i) * spacing;
                const double r_squared = x_planar * x_planar + z_planar * z_planar;
                const double scale = Kokkos::sqrt(Kokkos::fmax(0.0, 1.0 - r_squared / 4.0));

                double x = scale * x_planar;
                double y, z;
                if (upper) {
                    y = 1.0 - r_squared / 2.0;
                    z = scale * z_planar;
                }
                else {
                    y = -(1.0 - r_squared / 2.0);
                    z = scale * (-z_planar);
                }
                const double norm = Kokkos::sqrt(x * x + y * y + z * z);
                const int point = i * n + j;
                sphere_point_grid_local(point, 0) = x / norm;
                sphere_point_grid_local(point, 1) = y / norm;
                sphere_point_grid_local(point, 2) = z / norm;

                x_plane_local(i, j) = x_planar;
                z_plane_local(i, j) = z_planar;
                if (Kokkos::sqrt(r_squared) >= mask_radius)
                    mask_local(i, j) = nan_value;
                else
                    mask_local(i, j) = 1.0;
            });
        Kokkos::fence();
    }

    int numPoints() const { return sphere_points * sphere_points; }

    view_type_double_2d_host maskHost() const { return Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), mask); }

    view_type_double_2d_host spherePointGridHost() const {
        return Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), sphere_point_grid);
    }

    view_type_double_2d_host xPlaneHost() const {
        return Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), x_plane);
    }

    view_type_double_2d_host zPlaneHost() const {
        return Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), z_plane);
    }
};

// Is this cell inside the projected disk?
KOKKOS_INLINE_FUNCTION bool validCell(const double mask_value) { return (mask_value == 1.0); }

#endif
