// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_POLEFIGURE_HPP
#define CPOANALYZER_POLEFIGURE_HPP

#include "CPOdensity.hpp"
#include "CPOlambert.hpp"
#include "CPOorientation.hpp"
#include "CPOtypes.hpp"

#include <Kokkos_Core.hpp>

#include <cstddef>
#include <string>
#include <vector>

using view_type_double_2d_host = Kokkos::View<double **, Kokkos::HostSpace>;

// Host copy of a 2D view from any memory space, in the default host layout
template <typename ViewType>
view_type_double_2d_host copyToHost(const ViewType view) {
    auto view_mirror = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), view);
    view_type_double_2d_host view_host(Kokkos::ViewAllocateWithoutInitializing(view.label() + "_host"),
                                       view.extent(0), view.extent(1));
    for (std::size_t i = 0; i < view.extent(0); i++) {
        for (std::size_t j = 0; j < view.extent(1); j++)
            view_host(i, j) = view_mirror(i, j);
    }
    return view_host;
}

// Orientation density of one crystal axis of one mineral
struct PoleFigure {
    CrystalAxis crystal_axis;
    Mineral mineral;
    view_type_double_2d_host counts;
    // Maximum over the cells inside the projected disk, replaced with the maximum shared by all pole figures of the
    // same mineral once the grid is assembled
    double max_count;

    PoleFigure(const CrystalAxis crystal_axis_input, const Mineral mineral_input,
               const view_type_double_2d_host counts_input);
};

// Pole figures indexed [axis][mineral], in the order the axes and minerals were requested
using PoleFigureGrid = std::vector<std::vector<PoleFigure>>;

double maxValidCount(const view_type_double_2d_host counts, const view_type_double_2d_host mask);
void shareMaxCountPerMineral(PoleFigureGrid &pole_figures);
double colorScaleMaxCount(const double max_count, const std::string max_count_method);

// Compute the density field of each requested (axis, mineral) pair on the sampling grid. The grid is only returned
// once every density field has been computed
template <typename MemorySpace>
PoleFigureGrid assemblePoleFigures(const Orientation<MemorySpace> &orientation,
                                   const LambertGrid<MemorySpace> &lambert, const std::vector<CrystalAxis> &axes,
                                   const std::vector<Mineral> &minerals) {

    view_type_double_2d_host mask_host = copyToHost(lambert.mask);
    PoleFigureGrid pole_figures;
    for (auto axis : axes) {
        std::vector<PoleFigure> pole_figures_axis;
        for (auto mineral : minerals) {
            auto axis_vectors = orientation.axisVectors(axis, mineral);
            auto counts = gaussianOrientationCounts(axis_vectors, lambert.sphere_point_grid, lambert.sphere_points);
            view_type_double_2d_host counts_host = copyToHost(counts);
            PoleFigure pole_figure(axis, mineral, counts_host);
            pole_figure.max_count = maxValidCount(counts_host, mask_host);
            pole_figures_axis.push_back(pole_figure);
        }
        pole_figures.push_back(pole_figures_axis);
    }
    shareMaxCountPerMineral(pole_figures);
    return pole_figures;
}

#endif
