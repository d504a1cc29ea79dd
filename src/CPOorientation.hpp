// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_ORIENTATION_HPP
#define CPOANALYZER_ORIENTATION_HPP

#include "CPOrecords.hpp"
#include "CPOrotation.hpp"
#include "CPOtypes.hpp"

#include <Kokkos_Core.hpp>

#include <stdexcept>
#include <string>
#include <vector>

// Crystal axis unit vectors of the grains of one particle
template <typename MemorySpace>
struct Orientation {

    using memory_space = MemorySpace;
    using view_type_double_2d = Kokkos::View<double **, memory_space>;
    using view_type_double_2d_host = typename view_type_double_2d::HostMirror;

    // Using the default exec space for this memory space.
    using execution_space = typename memory_space::execution_space;

    int n_grains;
    // Rotation matrices of each grain (9 vals per grain, row major, rows are the A, B, and C axes), one column per
    // mineral. Stored on the device, no host copy is maintained in the struct
    view_type_double_2d grain_unit_vector;
    bool mineral_available[num_minerals];

    Orientation(const std::vector<GrainRecord> &grains)
        : n_grains(grains.size()) {

        if (n_grains == 0)
            throw std::runtime_error("Error: Cannot compute orientations without any grains");
        for (int m = 0; m < num_minerals; m++)
            mineral_available[m] = grains[0].has_mineral[m];

        // Rotation matrices computed from the Euler angles (degrees) on the host, then copied to the device
        view_type_double_2d_host grain_unit_vector_host(
            Kokkos::ViewAllocateWithoutInitializing("grain_unit_vector_host"), 9 * n_grains, num_minerals);
        for (int n = 0; n < n_grains; n++) {
            for (int m = 0; m < num_minerals; m++) {
                if (mineral_available[m]) {
                    RotationMatrix rotation = eulerToRotation(degreesToRadians(grains[n].euler_angles_deg[m][0]),
                                                              degreesToRadians(grains[n].euler_angles_deg[m][1]),
                                                              degreesToRadians(grains[n].euler_angles_deg[m][2]));
                    for (int i = 0; i < 3; i++) {
                        for (int j = 0; j < 3; j++)
                            grain_unit_vector_host(9 * n + 3 * i + j, m) = rotation(i, j);
                    }
                }
                else {
                    for (int comp = 0; comp < 9; comp++)
                        grain_unit_vector_host(9 * n + comp, m) = 0.0;
                }
            }
        }
        grain_unit_vector = Kokkos::create_mirror_view_and_copy(memory_space(), grain_unit_vector_host);
    }

    bool mineralAvailable(const Mineral mineral) const { return mineral_available[mineral]; }

    // Unit vectors (n_grains x 3) of the given crystal axis for each grain of the given mineral
    view_type_double_2d axisVectors(const CrystalAxis axis, const Mineral mineral) const {

        if (!mineralAvailable(mineral))
            throw std::runtime_error("Error: No orientation data is available for mineral " + mineralName(mineral));
        view_type_double_2d axis_vectors(Kokkos::ViewAllocateWithoutInitializing("axis_vectors"), n_grains, 3);
        auto grain_unit_vector_local = grain_unit_vector;
        const int row = axis;
        const int column = mineral;
        Kokkos::parallel_for(
            "AxisVectors", Kokkos::RangePolicy<execution_space>(0, n_grains), KOKKOS_LAMBDA(const int n) {
                for (int comp = 0; comp < 3; comp++)
                    axis_vectors(n, comp) = grain_unit_vector_local(9 * n + 3 * row + comp, column);
            });
        Kokkos::fence();
        return axis_vectors;
    }
};

#endif
