// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "CPOinputdata.hpp"
#include "CPOpolefigure.hpp"
#include "CPOprint.hpp"
#include "CPOrecords.hpp"
#include "CPOtypes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Helpers
//---------------------------------------------------------------------------//
std::vector<std::string> readLines(const std::string filename) {
    std::vector<std::string> lines;
    std::ifstream input_stream(filename);
    std::string line;
    while (std::getline(input_stream, line))
        lines.push_back(line);
    return lines;
}

bool hasLine(const std::vector<std::string> &lines, const std::string line) {
    return (std::find(lines.begin(), lines.end(), line) != lines.end());
}

ParticleRecord makeElasticParticle() {
    ParticleRecord particle;
    particle.id = 42;
    particle.x = 1.5;
    particle.y = 2.5;
    particle.z = 3.5;
    particle.has_deformation_type = true;
    particle.olivine_deformation_type = 2.0;
    particle.has_full_norm_square = true;
    particle.full_norm_square = 100.0;
    particle.has_isotropic_norm_square = true;
    particle.isotropic_norm_square = 80.0;
    double p1[num_symmetry_classes] = {1.0, 2.0, 3.0, 4.0, 10.0};
    for (int n = 0; n < num_symmetry_classes; n++) {
        particle.has_norm_square[n] = true;
        particle.norm_square[n][0] = p1[n];
        particle.norm_square[n][1] = 0.5 * p1[n];
        particle.norm_square[n][2] = 0.0;
    }
    return particle;
}

//---------------------------------------------------------------------------//
// filename_tests
//---------------------------------------------------------------------------//
void testPoleFigureFilename() {
    PoleFigureInputs inputs;
    inputs.axes = {AAxis, BAxis, CAxis};
    inputs.minerals = {Olivine, Enstatite};
    EXPECT_EQ(getPoleFigureFilename("/data/exp_1/", inputs, 7, 123, ".txt"),
              "/data/exp_1/CPO_figures/weighted_LPO_elastic_oli_ens_A-B-C-Axis_Batlow_g1_sp301_t00007.00123.txt");

    inputs.axes = {CAxis};
    inputs.minerals = {Enstatite};
    inputs.elasticity_header = false;
    inputs.color_scale = "Roma";
    inputs.sphere_points = 51;
    inputs.figure_output_dir = "figs/";
    inputs.figure_output_prefix = "cpo";
    EXPECT_EQ(getPoleFigureFilename("run/", inputs, 12345, 7, ""),
              "run/figs/cpo_no-elastic_ens_C-Axis_Roma_g1_sp51_t12345.00007");
}

//---------------------------------------------------------------------------//
// data_writer_tests
//---------------------------------------------------------------------------//
void testDataWriter() {

    // 3 x 3 grid with corners outside of the projected disk
    const double nan_value = std::numeric_limits<double>::quiet_NaN();
    view_type_double_2d_host mask("mask", 3, 3);
    view_type_double_2d_host counts("counts", 3, 3);
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++) {
            counts(i, j) = 3 * i + j + 0.5;
            if ((i != 1) && (j != 1))
                mask(i, j) = nan_value;
            else
                mask(i, j) = 1.0;
        }
    }
    PoleFigureGrid pole_figures(1);
    pole_figures[0].push_back(PoleFigure(CAxis, Olivine, counts));
    pole_figures[0][0].max_count = 7.0;

    RenderOptions options;
    options.max_count_method = "divide 2";
    options.sphere_points = 3;
    options.hemisphere = Lower;
    ParticleRecord particle = makeElasticParticle();

    std::filesystem::create_directories("TestPrint");
    std::string output_file = "TestPrint/pole_figure_data.txt";
    PoleFigureDataWriter writer;
    EXPECT_EQ(writer.fileExtension(), ".txt");
    writer.render(pole_figures, mask, particle, 1.25e5, 4, 42, options, output_file);

    std::vector<std::string> lines = readLines(output_file);
    EXPECT_TRUE(hasLine(lines, "% particle id: 42"));
    EXPECT_TRUE(hasLine(lines, "% time: 1.25000e+05"));
    EXPECT_TRUE(hasLine(lines, "% position: 1.500e+00 2.500e+00 3.500e+00"));
    EXPECT_TRUE(hasLine(lines, "% olivine deformation type: 2"));
    EXPECT_TRUE(hasLine(lines, "% grains: 4"));
    EXPECT_TRUE(hasLine(lines, "% hemisphere: lower"));
    EXPECT_TRUE(hasLine(lines, "% max count method: divide 2"));
    EXPECT_TRUE(hasLine(lines, "% anisotropic percent: 20.0000"));
    EXPECT_TRUE(hasLine(lines, "% tri%: 1.00 0.50 0.00"));
    EXPECT_TRUE(hasLine(lines, "% t/a%: 5.00 2.50 0.00"));
    EXPECT_TRUE(hasLine(lines, "% hex%: 10.00 5.00 0.00"));
    EXPECT_TRUE(hasLine(lines, "% h/a%: 50.00 25.00 0.00"));
    EXPECT_TRUE(hasLine(lines, "% pole figure: CAxis Olivine"));
    EXPECT_TRUE(hasLine(lines, "% max count: 7"));
    EXPECT_TRUE(hasLine(lines, "% color scale max: 3.5"));

    // Density matrix is the last block of the file
    ASSERT_GE(lines.size(), 3);
    const int num_lines = lines.size();
    EXPECT_EQ(lines[num_lines - 3], "nan 1.5 nan");
    EXPECT_EQ(lines[num_lines - 2], "3.5 4.5 5.5");
    EXPECT_EQ(lines[num_lines - 1], "nan 7.5 nan");
}

void testDataWriterWithoutElasticity() {
    view_type_double_2d_host mask("mask", 2, 2);
    view_type_double_2d_host counts("counts", 2, 2);
    PoleFigureGrid pole_figures(1);
    pole_figures[0].push_back(PoleFigure(AAxis, Enstatite, counts));

    // 2D particle without the elastic tensor decomposition
    ParticleRecord particle;
    particle.id = 3;
    particle.has_z = false;
    RenderOptions options;
    PoleFigureDataWriter writer;
    std::filesystem::create_directories("TestPrint");
    std::string output_file = "TestPrint/no_elasticity.txt";
    std::filesystem::remove(output_file);
    EXPECT_THROW(writer.render(pole_figures, mask, particle, 0.0, 1, 3, options, output_file), std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(output_file));

    // Without the elasticity header the figure is written
    options.elasticity_header = false;
    writer.render(pole_figures, mask, particle, 0.0, 1, 3, options, output_file);
    std::vector<std::string> lines = readLines(output_file);
    EXPECT_TRUE(hasLine(lines, "% position: 0.000e+00 0.000e+00"));
    EXPECT_TRUE(hasLine(lines, "% pole figure: AAxis Enstatite"));
    for (auto &line : lines) {
        EXPECT_EQ(line.find("olivine deformation type"), std::string::npos);
        EXPECT_EQ(line.find("anisotropic percent"), std::string::npos);
    }
    // Unwritable location
    EXPECT_THROW(writer.render(pole_figures, mask, particle, 0.0, 1, 3, options, "TestPrintMissing/out.txt"),
                 std::runtime_error);
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, print) {
    testPoleFigureFilename();
    testDataWriter();
    testDataWriterWithoutElasticity();
}
} // end namespace Test
