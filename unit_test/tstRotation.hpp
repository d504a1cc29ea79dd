// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "CPOrotation.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// rotation_tests
//---------------------------------------------------------------------------//
RotationMatrix makeRotation(const double values[3][3]) {
    RotationMatrix rotation;
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++)
            rotation(i, j) = values[i][j];
    }
    return rotation;
}

void expectRotationNear(const RotationMatrix &rotation, const RotationMatrix &expected, const double tolerance) {
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++)
            EXPECT_NEAR(rotation(i, j), expected(i, j), tolerance);
    }
}

void testEulerToRotation() {
    // Identity
    RotationMatrix identity = eulerToRotation(0.0, 0.0, 0.0);
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++)
            EXPECT_NEAR(identity(i, j), (i == j) ? 1.0 : 0.0, 1e-15);
    }

    // 90 degree rotation about Z through phi1: rows are the crystal axes in the sample frame
    RotationMatrix rotation_z = eulerToRotation(M_PI / 2.0, 0.0, 0.0);
    const double expected_z[3][3] = {{0.0, -1.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 0.0, 1.0}};
    expectRotationNear(rotation_z, makeRotation(expected_z), 1e-15);

    // Rows are orthonormal with determinant +1 for arbitrary angles
    RotationMatrix rotation = eulerToRotation(0.3, 1.1, 4.0);
    for (int i = 0; i < 3; i++) {
        for (int k = 0; k < 3; k++) {
            double dot = 0.0;
            for (int j = 0; j < 3; j++)
                dot += rotation(i, j) * rotation(k, j);
            EXPECT_NEAR(dot, (i == k) ? 1.0 : 0.0, 1e-14);
        }
    }
    double determinant = rotation(0, 0) * (rotation(1, 1) * rotation(2, 2) - rotation(1, 2) * rotation(2, 1)) -
                         rotation(0, 1) * (rotation(1, 0) * rotation(2, 2) - rotation(1, 2) * rotation(2, 0)) +
                         rotation(0, 2) * (rotation(1, 0) * rotation(2, 1) - rotation(1, 1) * rotation(2, 0));
    EXPECT_NEAR(determinant, 1.0, 1e-14);

    EXPECT_DOUBLE_EQ(degreesToRadians(180.0), M_PI);
    EXPECT_DOUBLE_EQ(degreesToRadians(-90.0), -M_PI / 2.0);
}

void testAngleHelpers() {
    EXPECT_DOUBLE_EQ(wrapAngle(0.5), 0.5);
    EXPECT_NEAR(wrapAngle(-M_PI / 2.0), 1.5 * M_PI, 1e-14);
    EXPECT_NEAR(wrapAngle(5.0 * M_PI), M_PI, 1e-14);
    EXPECT_EQ(classifyTheta(0.0), ThetaZero);
    EXPECT_EQ(classifyTheta(M_PI), ThetaPi);
    EXPECT_EQ(classifyTheta(1.0), ThetaGeneric);
}

void testRotationRoundTripReference() {
    // Rotation matrix whose angles are recovered and recomposed twice
    const double rot_values[3][3] = {{0.36, 0.48, -0.8}, {-0.8, 0.6, 0.0}, {0.48, 0.64, 0.6}};
    RotationMatrix rot = makeRotation(rot_values);
    EulerAngles angles = rotationToEuler(rot);
    RotationMatrix rot_2 = eulerToRotation(angles);
    expectRotationNear(rot_2, rot, 1e-8);
    EulerAngles angles_2 = rotationToEuler(rot_2);
    RotationMatrix rot_3 = eulerToRotation(angles_2);
    expectRotationNear(rot_3, rot, 1e-8);
    EXPECT_NEAR(angles.theta, std::acos(0.6), 1e-12);
    EXPECT_NEAR(angles.phi2, M_PI / 2.0, 1e-12);

    // Matrix with a zeroed last row: theta is pi/2, and the signed zeros of the last row give phi1 = pi
    const double zero_row_values[3][3] = {{0.36, 0.48, -0.8}, {-0.8, 0.6, 0.0}, {0.0, 0.0, 0.0}};
    RotationMatrix zero_row = makeRotation(zero_row_values);
    EulerAngles zero_row_angles = rotationToEuler(zero_row);
    EXPECT_NEAR(zero_row_angles.phi1, M_PI, 1e-12);
    EXPECT_NEAR(zero_row_angles.theta, M_PI / 2.0, 1e-12);
    EXPECT_NEAR(zero_row_angles.phi2, M_PI / 2.0, 1e-12);
    const double expected_values[3][3] = {{0.0, 0.0, -1.0}, {-1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}};
    expectRotationNear(eulerToRotation(zero_row_angles), makeRotation(expected_values), 1e-8);
}

// Round trip of matrices built from many angle triples, including theta = 0 and theta = pi, computed in a kernel
void testRotationRoundTripKernel() {

    using memory_space = TEST_MEMSPACE;
    using execution_space = typename memory_space::execution_space;
    using view_type_double_2d = Kokkos::View<double **, memory_space>;

    std::vector<std::vector<double>> angle_sets = {
        {0.1, 0.2, 0.3},  {1.0, 2.0, 3.0},   {5.5, 0.01, 6.2},  {4.0, 3.1, 0.7}, {0.0, 0.0, 0.0},
        {0.7, 0.0, 1.9},  {5.0, 0.0, 4.0},   {0.7, M_PI, 1.9},  {2.0, M_PI, 5.5}, {3.0, M_PI / 2.0, 3.0},
        {-1.0, 0.5, -2.0}, {10.0, 2.5, 8.0}, {6.0, 1.0e-3, 0.2}};
    const int num_sets = angle_sets.size();

    view_type_double_2d angles("angles", num_sets, 3);
    auto angles_host = Kokkos::create_mirror_view(angles);
    for (int n = 0; n < num_sets; n++) {
        for (int comp = 0; comp < 3; comp++)
            angles_host(n, comp) = angle_sets[n][comp];
    }
    Kokkos::deep_copy(angles, angles_host);

    // Original and recomposed matrices (9 values each), and recovered angles
    view_type_double_2d original("original", num_sets, 9);
    view_type_double_2d recomposed("recomposed", num_sets, 9);
    view_type_double_2d recovered("recovered", num_sets, 3);
    Kokkos::parallel_for(
        "RotationRoundTrip", Kokkos::RangePolicy<execution_space>(0, num_sets), KOKKOS_LAMBDA(const int n) {
            RotationMatrix rotation = eulerToRotation(angles(n, 0), angles(n, 1), angles(n, 2));
            EulerAngles euler = rotationToEuler(rotation);
            RotationMatrix rotation_2 = eulerToRotation(euler);
            for (int i = 0; i < 3; i++) {
                for (int j = 0; j < 3; j++) {
                    original(n, 3 * i + j) = rotation(i, j);
                    recomposed(n, 3 * i + j) = rotation_2(i, j);
                }
            }
            recovered(n, 0) = euler.phi1;
            recovered(n, 1) = euler.theta;
            recovered(n, 2) = euler.phi2;
        });
    auto original_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), original);
    auto recomposed_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), recomposed);
    auto recovered_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), recovered);
    for (int n = 0; n < num_sets; n++) {
        for (int comp = 0; comp < 9; comp++)
            EXPECT_NEAR(recomposed_host(n, comp), original_host(n, comp), 1e-8);
        // All angles are in [0, 2 pi)
        for (int comp = 0; comp < 3; comp++) {
            EXPECT_GE(recovered_host(n, comp), 0.0);
            EXPECT_LT(recovered_host(n, comp), 2.0 * M_PI);
        }
    }
    // Degenerate cases put the whole rotation about Z into phi2
    EXPECT_DOUBLE_EQ(recovered_host(5, 0), 0.0);
    EXPECT_NEAR(recovered_host(5, 2), 0.7 + 1.9, 1e-12);
    EXPECT_DOUBLE_EQ(recovered_host(7, 0), 0.0);
    EXPECT_NEAR(recovered_host(7, 1), M_PI, 1e-12);
    EXPECT_NEAR(recovered_host(7, 2), 1.9 - 0.7, 1e-12);
}

// Rounding of R22 slightly beyond 1 does not produce NaN
void testRotationClamp() {
    const double values[3][3] = {{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0 + 1e-15}};
    EulerAngles angles = rotationToEuler(makeRotation(values));
    EXPECT_FALSE(std::isnan(angles.theta));
    EXPECT_DOUBLE_EQ(angles.theta, 0.0);
    EXPECT_DOUBLE_EQ(angles.phi2, 0.0);
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, rotation) {
    testEulerToRotation();
    testAngleHelpers();
    testRotationRoundTripReference();
    testRotationRoundTripKernel();
    testRotationClamp();
}
} // end namespace Test
