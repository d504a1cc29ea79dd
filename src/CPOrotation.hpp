// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_ROTATION_HPP
#define CPOANALYZER_ROTATION_HPP

#include <Kokkos_Core.hpp>

#include <cmath>

// 3x3 rotation matrix whose rows are the crystal A, B, and C axes in the sample reference frame
struct RotationMatrix {
    double values[3][3];

    KOKKOS_INLINE_FUNCTION
    double &operator()(const int i, const int j) { return values[i][j]; }
    KOKKOS_INLINE_FUNCTION
    double operator()(const int i, const int j) const { return values[i][j]; }
};

// Proper Euler angles (Z-X-Z), in radians
struct EulerAngles {
    double phi1;
    double theta;
    double phi2;
};

// Classification of the middle Euler angle - for theta of 0 or pi, phi1 and phi2 rotate about the same axis and only
// their sum (or difference) can be recovered from a rotation matrix
enum ThetaClass { ThetaZero = 0, ThetaPi = 1, ThetaGeneric = 2 };

KOKKOS_INLINE_FUNCTION double degreesToRadians(const double angle) { return angle * M_PI / 180.0; }

// Wrap an angle into [0, 2 pi)
KOKKOS_INLINE_FUNCTION double wrapAngle(const double angle) {
    return angle - 2.0 * M_PI * Kokkos::floor(angle / (2.0 * M_PI));
}

// Rotation matrix from Z-X-Z Euler angles (phi1, theta, phi2)
KOKKOS_INLINE_FUNCTION RotationMatrix eulerToRotation(const double phi1, const double theta, const double phi2) {
    const double cos_phi1 = Kokkos::cos(phi1);
    const double sin_phi1 = Kokkos::sin(phi1);
    const double cos_theta = Kokkos::cos(theta);
    const double sin_theta = Kokkos::sin(theta);
    const double cos_phi2 = Kokkos::cos(phi2);
    const double sin_phi2 = Kokkos::sin(phi2);

    RotationMatrix rotation;
    rotation(0, 0) = cos_phi2 * cos_phi1 - cos_theta * sin_phi1 * sin_phi2;
    rotation(0, 1) = -cos_phi2 * sin_phi1 - cos_theta * cos_phi1 * sin_phi2;
    rotation(0, 2) = -sin_phi2 * sin_theta;

    rotation(1, 0) = sin_phi2 * cos_phi1 + cos_theta * sin_phi1 * cos_phi2;
    rotation(1, 1) = -sin_phi2 * sin_phi1 + cos_theta * cos_phi1 * cos_phi2;
    rotation(1, 2) = cos_phi2 * sin_theta;

    rotation(2, 0) = -sin_theta * sin_phi1;
    rotation(2, 1) = -sin_theta * cos_phi1;
    rotation(2, 2) = cos_theta;
    return rotation;
}

KOKKOS_INLINE_FUNCTION RotationMatrix eulerToRotation(const EulerAngles angles) {
    return eulerToRotation(angles.phi1, angles.theta, angles.phi2);
}

KOKKOS_INLINE_FUNCTION ThetaClass classifyTheta(const double theta) {
    if (theta == 0.0)
        return ThetaZero;
    else if (theta == M_PI)
        return ThetaPi;
    else
        return ThetaGeneric;
}

// Z-X-Z Euler angles from a rotation matrix, each wrapped into [0, 2 pi). When theta is 0 or pi, phi1 is set to 0 and
// phi2 carries the whole rotation about the Z axis, so that the recomposed matrix matches the input
KOKKOS_INLINE_FUNCTION EulerAngles rotationToEuler(const RotationMatrix &rotation) {
    // Clamp to avoid NaN from round-off just outside [-1, 1]
    const double cos_theta = Kokkos::fmin(1.0, Kokkos::fmax(-1.0, rotation(2, 2)));
    const double theta = Kokkos::acos(cos_theta);
    double phi1 = 0.0;
    double phi2 = 0.0;

    switch (classifyTheta(theta)) {
    case ThetaZero:
        phi2 = -phi1 - Kokkos::atan2(rotation(0, 1), rotation(0, 0));
        break;
    case ThetaPi:
        phi2 = phi1 + Kokkos::atan2(rotation(0, 1), rotation(0, 0));
        break;
    case ThetaGeneric: {
        const double sin_theta = Kokkos::sin(theta);
        phi1 = Kokkos::atan2(rotation(2, 0) / -sin_theta, rotation(2, 1) / -sin_theta);
        phi2 = Kokkos::atan2(rotation(0, 2) / -sin_theta, rotation(1, 2) / sin_theta);
        break;
    }
    }

    EulerAngles angles;
    angles.phi1 = wrapAngle(phi1);
    angles.theta = wrapAngle(theta);
    angles.phi2 = wrapAngle(phi2);
    return angles;
}

#endif
