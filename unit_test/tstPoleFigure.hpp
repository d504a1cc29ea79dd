// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "CPOlambert.hpp"
#include "CPOorientation.hpp"
#include "CPOpolefigure.hpp"
#include "CPOrecords.hpp"
#include "CPOtypes.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// max_count_tests
//---------------------------------------------------------------------------//
void testMaxValidCount() {
    const double nan_value = std::numeric_limits<double>::quiet_NaN();
    view_type_double_2d_host counts("counts", 3, 3);
    view_type_double_2d_host mask("mask", 3, 3);
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++) {
            counts(i, j) = i + j;
            mask(i, j) = 1.0;
        }
    }
    EXPECT_DOUBLE_EQ(maxValidCount(counts, mask), 4.0);
    // Cells outside of the projected disk are ignored
    mask(2, 2) = nan_value;
    mask(1, 2) = nan_value;
    EXPECT_DOUBLE_EQ(maxValidCount(counts, mask), 3.0);
    // No valid cells
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++)
            mask(i, j) = nan_value;
    }
    EXPECT_DOUBLE_EQ(maxValidCount(counts, mask), 0.0);

    view_type_double_2d_host small_mask("small_mask", 2, 3);
    EXPECT_THROW(maxValidCount(counts, small_mask), std::runtime_error);
}

void testShareMaxCount() {
    view_type_double_2d_host counts("counts", 2, 2);
    // Two axes, two minerals
    PoleFigureGrid pole_figures(2);
    pole_figures[0].push_back(PoleFigure(AAxis, Olivine, counts));
    pole_figures[0].push_back(PoleFigure(AAxis, Enstatite, counts));
    pole_figures[1].push_back(PoleFigure(CAxis, Olivine, counts));
    pole_figures[1].push_back(PoleFigure(CAxis, Enstatite, counts));
    pole_figures[0][0].max_count = 3.0;
    pole_figures[1][0].max_count = 7.0;
    pole_figures[0][1].max_count = 5.0;
    pole_figures[1][1].max_count = 2.0;
    shareMaxCountPerMineral(pole_figures);
    EXPECT_DOUBLE_EQ(pole_figures[0][0].max_count, 7.0);
    EXPECT_DOUBLE_EQ(pole_figures[1][0].max_count, 7.0);
    EXPECT_DOUBLE_EQ(pole_figures[0][1].max_count, 5.0);
    EXPECT_DOUBLE_EQ(pole_figures[1][1].max_count, 5.0);

    PoleFigureGrid no_pole_figures;
    EXPECT_NO_THROW(shareMaxCountPerMineral(no_pole_figures));
}

void testColorScaleMaxCount() {
    EXPECT_DOUBLE_EQ(colorScaleMaxCount(12.0, "none"), 12.0);
    EXPECT_DOUBLE_EQ(colorScaleMaxCount(12.0, "divide 2"), 6.0);
    EXPECT_DOUBLE_EQ(colorScaleMaxCount(12.0, "divide 3"), 4.0);
    EXPECT_DOUBLE_EQ(colorScaleMaxCount(12.0, "divide 4"), 3.0);
    EXPECT_THROW(colorScaleMaxCount(12.0, "divide 5"), std::runtime_error);
}

//---------------------------------------------------------------------------//
// assemble_tests
//---------------------------------------------------------------------------//
void testAssemblePoleFigures() {

    using memory_space = TEST_MEMSPACE;

    // Olivine C axes spread between Z and Y, enstatite present for all grains
    std::vector<GrainRecord> grains;
    for (int n = 0; n < 4; n++) {
        GrainRecord grain;
        grain.id = 12;
        for (int m = 0; m < num_minerals; m++) {
            grain.has_mineral[m] = true;
            grain.euler_angles_deg[m][0] = 15.0 * n;
            grain.euler_angles_deg[m][1] = 20.0 * n + 10.0 * m;
            grain.euler_angles_deg[m][2] = 5.0;
        }
        grains.push_back(grain);
    }
    Orientation<memory_space> orientation(grains);
    const int sphere_points = 15;
    LambertGrid<memory_space> lambert(sphere_points, Upper);
    std::vector<CrystalAxis> axes = {AAxis, BAxis, CAxis};
    std::vector<Mineral> minerals = {Enstatite, Olivine};

    PoleFigureGrid pole_figures = assemblePoleFigures(orientation, lambert, axes, minerals);
    ASSERT_EQ(pole_figures.size(), 3);
    view_type_double_2d_host mask_host = copyToHost(lambert.mask);
    for (int a = 0; a < 3; a++) {
        ASSERT_EQ(pole_figures[a].size(), 2);
        for (int m = 0; m < 2; m++) {
            const PoleFigure &pole_figure = pole_figures[a][m];
            // Order of the requested axes and minerals
            EXPECT_EQ(pole_figure.crystal_axis, axes[a]);
            EXPECT_EQ(pole_figure.mineral, minerals[m]);
            EXPECT_EQ(pole_figure.counts.extent(0), sphere_points);
            EXPECT_EQ(pole_figure.counts.extent(1), sphere_points);
            // Shared maximum is at least the maximum of this figure, and equal across axes
            EXPECT_GE(pole_figure.max_count, maxValidCount(pole_figure.counts, mask_host));
            EXPECT_GT(pole_figure.max_count, 0.0);
            EXPECT_DOUBLE_EQ(pole_figure.max_count, pole_figures[0][m].max_count);
        }
    }
    // The shared maximum is reached by one of the axes
    for (int m = 0; m < 2; m++) {
        double largest = 0.0;
        for (int a = 0; a < 3; a++)
            largest = std::fmax(largest, maxValidCount(pole_figures[a][m].counts, mask_host));
        EXPECT_DOUBLE_EQ(pole_figures[0][m].max_count, largest);
    }
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, pole_figure) {
    testMaxValidCount();
    testShareMaxCount();
    testColorScaleMaxCount();
    testAssemblePoleFigures();
}
} // end namespace Test
