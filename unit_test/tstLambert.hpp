// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "CPOlambert.hpp"
#include "CPOtypes.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

namespace Test {
//---------------------------------------------------------------------------//
// lambert_grid_tests
//---------------------------------------------------------------------------//
void testLambertGrid(const Hemisphere hemisphere) {

    using memory_space = TEST_MEMSPACE;

    const int sphere_points = 11;
    LambertGrid<memory_space> lambert(sphere_points, hemisphere);
    EXPECT_EQ(lambert.numPoints(), sphere_points * sphere_points);
    EXPECT_EQ(lambert.sphere_point_grid.extent(0), sphere_points * sphere_points);
    EXPECT_EQ(lambert.sphere_point_grid.extent(1), 3);

    auto sphere_point_grid_host = lambert.spherePointGridHost();
    auto mask_host = lambert.maskHost();
    auto x_plane_host = lambert.xPlaneHost();
    auto z_plane_host = lambert.zPlaneHost();

    // Planar coordinates span [-sqrt(2), sqrt(2)] exactly at the grid edges
    EXPECT_DOUBLE_EQ(x_plane_host(0, 0), -std::sqrt(2.0));
    EXPECT_DOUBLE_EQ(x_plane_host(0, sphere_points - 1), std::sqrt(2.0));
    EXPECT_DOUBLE_EQ(z_plane_host(0, 0), std::sqrt(2.0));
    EXPECT_DOUBLE_EQ(z_plane_host(sphere_points - 1, 0), -std::sqrt(2.0));

    const double sign = (hemisphere == Upper) ? 1.0 : -1.0;
    int num_valid = 0;
    for (int i = 0; i < sphere_points; i++) {
        for (int j = 0; j < sphere_points; j++) {
            const int point = i * sphere_points + j;
            const double x = sphere_point_grid_host(point, 0);
            const double y = sphere_point_grid_host(point, 1);
            const double z = sphere_point_grid_host(point, 2);
            // Every grid point is a unit vector
            EXPECT_NEAR(x * x + y * y + z * z, 1.0, 1e-12);
            // Points inside the projected disk are on the requested hemisphere
            const double radius =
                std::sqrt(x_plane_host(i, j) * x_plane_host(i, j) + z_plane_host(i, j) * z_plane_host(i, j));
            if (radius < std::sqrt(2.0)) {
                EXPECT_GE(sign * y, -1e-12);
                EXPECT_TRUE(validCell(mask_host(i, j)));
                num_valid++;
            }
            else if (radius >= std::sqrt(2.0) + 0.001) {
                EXPECT_TRUE(std::isnan(mask_host(i, j)));
                EXPECT_FALSE(validCell(mask_host(i, j)));
            }
        }
    }
    EXPECT_GT(num_valid, 0);

    // Corners are outside of the disk, center of an odd-sized grid is the pole
    EXPECT_TRUE(std::isnan(mask_host(0, 0)));
    EXPECT_TRUE(std::isnan(mask_host(sphere_points - 1, sphere_points - 1)));
    const int center = (sphere_points - 1) / 2;
    const int center_point = center * sphere_points + center;
    EXPECT_TRUE(validCell(mask_host(center, center)));
    EXPECT_NEAR(sphere_point_grid_host(center_point, 0), 0.0, 1e-12);
    EXPECT_NEAR(sphere_point_grid_host(center_point, 1), sign, 1e-12);
    EXPECT_NEAR(sphere_point_grid_host(center_point, 2), 0.0, 1e-12);

    // Edge midpoints of the grid lie on the disk boundary, projected onto the equator
    const int top_center_point = center;
    EXPECT_NEAR(sphere_point_grid_host(top_center_point, 1), 0.0, 1e-12);
    EXPECT_NEAR(std::abs(sphere_point_grid_host(top_center_point, 2)), 1.0, 1e-12);
}

void testLambertGridHemispheres() {

    using memory_space = TEST_MEMSPACE;

    const int sphere_points = 7;
    LambertGrid<memory_space> upper(sphere_points, Upper);
    LambertGrid<memory_space> lower(sphere_points, Lower);
    auto upper_host = upper.spherePointGridHost();
    auto lower_host = lower.spherePointGridHost();
    // The lower hemisphere grid mirrors the upper one through Y and Z
    for (int point = 0; point < sphere_points * sphere_points; point++) {
        EXPECT_NEAR(lower_host(point, 0), upper_host(point, 0), 1e-14);
        EXPECT_NEAR(lower_host(point, 1), -upper_host(point, 1), 1e-14);
        EXPECT_NEAR(lower_host(point, 2), -upper_host(point, 2), 1e-14);
    }
}

void testLambertGridSize() {

    using memory_space = TEST_MEMSPACE;

    EXPECT_THROW(LambertGrid<memory_space>(1, Upper), std::runtime_error);
    EXPECT_THROW(LambertGrid<memory_space>(0, Lower), std::runtime_error);
    // Smallest grid has only corner points, all outside of the disk
    LambertGrid<memory_space> smallest(2, Upper);
    auto mask_host = smallest.maskHost();
    for (int i = 0; i < 2; i++) {
        for (int j = 0; j < 2; j++)
            EXPECT_FALSE(validCell(mask_host(i, j)));
    }
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, lambert_grid) {
    testLambertGrid(Upper);
    testLambertGrid(Lower);
    testLambertGridHemispheres();
    testLambertGridSize();
}
} // end namespace Test
