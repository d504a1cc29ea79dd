// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOpolefigure.hpp"

#include <stdexcept>

PoleFigure::PoleFigure(const CrystalAxis crystal_axis_input, const Mineral mineral_input,
                       const view_type_double_2d_host counts_input)
    : crystal_axis(crystal_axis_input)
    , mineral(mineral_input)
    , counts(counts_input)
    , max_count(0.0) {}

// Maximum of "counts" over the cells where "mask" is 1. Returns 0 if no cell of the grid is inside the projected disk
double maxValidCount(const view_type_double_2d_host counts, const view_type_double_2d_host mask) {

    const int nrows = counts.extent(0);
    const int ncols = counts.extent(1);
    if ((static_cast<int>(mask.extent(0)) != nrows) || (static_cast<int>(mask.extent(1)) != ncols))
        throw std::runtime_error("Error: Pole figure and mask dimensions do not match");

    double max_count = 0.0;
    int num_valid = 0;
    auto policy = Kokkos::MDRangePolicy<Kokkos::DefaultHostExecutionSpace, Kokkos::Rank<2>>({0, 0}, {nrows, ncols});
    Kokkos::parallel_reduce(
        "MaxValidCount", policy,
        KOKKOS_LAMBDA(const int i, const int j, double &update) {
            if ((validCell(mask(i, j))) && (counts(i, j) > update))
                update = counts(i, j);
        },
        Kokkos::Max<double>(max_count));
    Kokkos::parallel_reduce(
        "NumValidCells", policy,
        KOKKOS_LAMBDA(const int i, const int j, int &update) {
            if (validCell(mask(i, j)))
                update++;
        },
        num_valid);
    if (num_valid == 0)
        max_count = 0.0;
    return max_count;
}

// Each pole figure of a mineral is drawn with the same color scale, so the maximum is shared across the axes
void shareMaxCountPerMineral(PoleFigureGrid &pole_figures) {

    const int num_axes = pole_figures.size();
    if (num_axes == 0)
        return;
    const int num_minerals_grid = pole_figures[0].size();
    for (int m = 0; m < num_minerals_grid; m++) {
        double shared_max_count = pole_figures[0][m].max_count;
        for (int a = 1; a < num_axes; a++) {
            if (pole_figures[a][m].max_count > shared_max_count)
                shared_max_count = pole_figures[a][m].max_count;
        }
        for (int a = 0; a < num_axes; a++)
            pole_figures[a][m].max_count = shared_max_count;
    }
}

// Upper limit of the color scale for a pole figure with the given maximum count
double colorScaleMaxCount(const double max_count, const std::string max_count_method) {
    if (max_count_method == "none")
        return max_count;
    else if (max_count_method == "divide 2")
        return max_count / 2.0;
    else if (max_count_method == "divide 3")
        return max_count / 3.0;
    else if (max_count_method == "divide 4")
        return max_count / 4.0;
    else
        throw std::runtime_error("Error: unknown max count method \"" + max_count_method + "\"");
}
