// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "CPOorientation.hpp"
#include "CPOrecords.hpp"
#include "CPOtypes.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Helper: grain with the given olivine angles (degrees), and enstatite angles if requested
//---------------------------------------------------------------------------//
GrainRecord makeGrain(const long id, const double phi1, const double theta, const double phi2,
                      const bool with_enstatite) {
    GrainRecord grain;
    grain.id = id;
    grain.has_mineral[Olivine] = true;
    grain.euler_angles_deg[Olivine][0] = phi1;
    grain.euler_angles_deg[Olivine][1] = theta;
    grain.euler_angles_deg[Olivine][2] = phi2;
    grain.has_mineral[Enstatite] = with_enstatite;
    // Enstatite rotated by 90 degrees about X relative to olivine
    grain.euler_angles_deg[Enstatite][0] = 0.0;
    grain.euler_angles_deg[Enstatite][1] = 90.0;
    grain.euler_angles_deg[Enstatite][2] = 0.0;
    return grain;
}

//---------------------------------------------------------------------------//
// orientation_tests
//---------------------------------------------------------------------------//
void testOrientationAxes() {

    using memory_space = TEST_MEMSPACE;

    std::vector<GrainRecord> grains = {makeGrain(1, 0.0, 0.0, 0.0, true), makeGrain(1, 90.0, 0.0, 0.0, true)};
    Orientation<memory_space> orientation(grains);
    EXPECT_EQ(orientation.n_grains, 2);
    EXPECT_TRUE(orientation.mineralAvailable(Olivine));
    EXPECT_TRUE(orientation.mineralAvailable(Enstatite));
    EXPECT_EQ(orientation.grain_unit_vector.extent(0), 18);
    EXPECT_EQ(orientation.grain_unit_vector.extent(1), num_minerals);

    // Axes of the olivine grains: rows of the rotation matrices
    auto a_axis = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), orientation.axisVectors(AAxis, Olivine));
    auto b_axis = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), orientation.axisVectors(BAxis, Olivine));
    auto c_axis = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), orientation.axisVectors(CAxis, Olivine));
    ASSERT_EQ(a_axis.extent(0), 2);
    ASSERT_EQ(a_axis.extent(1), 3);
    const double expected_a[2][3] = {{1.0, 0.0, 0.0}, {0.0, -1.0, 0.0}};
    const double expected_b[2][3] = {{0.0, 1.0, 0.0}, {1.0, 0.0, 0.0}};
    for (int n = 0; n < 2; n++) {
        for (int comp = 0; comp < 3; comp++) {
            EXPECT_NEAR(a_axis(n, comp), expected_a[n][comp], 1e-14);
            EXPECT_NEAR(b_axis(n, comp), expected_b[n][comp], 1e-14);
            EXPECT_NEAR(c_axis(n, comp), (comp == 2) ? 1.0 : 0.0, 1e-14);
        }
    }

    // Enstatite C axis of both grains is rotated onto the sample -Y direction
    auto c_axis_ens =
        Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), orientation.axisVectors(CAxis, Enstatite));
    for (int n = 0; n < 2; n++) {
        EXPECT_NEAR(c_axis_ens(n, 0), 0.0, 1e-14);
        EXPECT_NEAR(c_axis_ens(n, 1), -1.0, 1e-14);
        EXPECT_NEAR(c_axis_ens(n, 2), 0.0, 1e-14);
    }
}

void testOrientationUnitVectors() {

    using memory_space = TEST_MEMSPACE;

    std::vector<GrainRecord> grains = {makeGrain(3, 10.0, 20.0, 30.0, false), makeGrain(3, 311.1, 47.7, 72.0, false),
                                       makeGrain(3, 180.0, 180.0, 45.0, false)};
    Orientation<memory_space> orientation(grains);
    EXPECT_FALSE(orientation.mineralAvailable(Enstatite));
    EXPECT_THROW(orientation.axisVectors(AAxis, Enstatite), std::runtime_error);
    for (int axis = 0; axis < num_crystal_axes; axis++) {
        auto axis_vectors = Kokkos::create_mirror_view_and_copy(
            Kokkos::HostSpace(), orientation.axisVectors(static_cast<CrystalAxis>(axis), Olivine));
        for (int n = 0; n < 3; n++) {
            double norm_squared = 0.0;
            for (int comp = 0; comp < 3; comp++)
                norm_squared += axis_vectors(n, comp) * axis_vectors(n, comp);
            EXPECT_NEAR(norm_squared, 1.0, 1e-12);
        }
    }
}

void testOrientationNoGrains() {

    using memory_space = TEST_MEMSPACE;

    std::vector<GrainRecord> grains;
    EXPECT_THROW(Orientation<memory_space> orientation(grains), std::runtime_error);
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, orientation) {
    testOrientationAxes();
    testOrientationUnitVectors();
    testOrientationNoGrains();
}
} // end namespace Test
