// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOinputs.hpp"
#include "CPOlog.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// file_read_tests
//---------------------------------------------------------------------------//
// Write an input file with all inputs given (full_version = true), or with only the required ones
void writeTestData(std::string input_filename, bool full_version) {

    std::ofstream test_data_file;
    test_data_file.open(input_filename);
    test_data_file << "{" << std::endl;
    test_data_file << "   \"BaseDirectory\": \"/data/runs/\"," << std::endl;
    test_data_file << "   \"ExperimentDirectories\": [\"exp_1/\", \"exp_2/\"]," << std::endl;
    if (full_version) {
        test_data_file << "   \"Compressed\": true," << std::endl;
        test_data_file << "   \"LogFile\": \"TestLog.json\"," << std::endl;
    }
    test_data_file << "   \"PoleFigures\": {" << std::endl;
    if (full_version) {
        test_data_file << "      \"TimeDataFile\": \"stats.txt\"," << std::endl;
        test_data_file << "      \"TimeDataMarker\": \"particle_CPO\"," << std::endl;
        test_data_file << "      \"ParticleDataFilePrefix\": \"cpo/particles\"," << std::endl;
        test_data_file << "      \"GrainDataFilePrefix\": \"cpo/grains\"," << std::endl;
        test_data_file << "      \"FigureOutputDirectory\": \"figures/\"," << std::endl;
        test_data_file << "      \"FigureOutputPrefix\": \"test_CPO\"," << std::endl;
        test_data_file << "      \"ColorScale\": \"Vik\"," << std::endl;
        test_data_file << "      \"MaxCountMethod\": \"divide 3\"," << std::endl;
        test_data_file << "      \"ElasticityHeader\": false," << std::endl;
        test_data_file << "      \"SmallFigure\": true," << std::endl;
        test_data_file << "      \"NoDescriptionText\": true," << std::endl;
        test_data_file << "      \"SpherePoints\": 51," << std::endl;
        test_data_file << "      \"Hemisphere\": \"lower\"," << std::endl;
    }
    test_data_file << "      \"Times\": [0.5, 2e6]," << std::endl;
    test_data_file << "      \"ParticleIDs\": [1, 10, 100]," << std::endl;
    test_data_file << "      \"Axes\": [\"AAxis\", \"CAxis\"]," << std::endl;
    test_data_file << "      \"Minerals\": [\"Olivine\", \"Enstatite\"]" << std::endl;
    test_data_file << "   }" << std::endl;
    test_data_file << "}" << std::endl;
    test_data_file.close();
}

void testInputsDefaults() {
    std::string input_filename = "TestInputsRequired.json";
    writeTestData(input_filename, false);
    Inputs inputs(1, input_filename);

    EXPECT_EQ(inputs.base_directory, "/data/runs/");
    ASSERT_EQ(inputs.experiment_dirs.size(), 2);
    EXPECT_EQ(inputs.experiment_dirs[1], "exp_2/");
    EXPECT_FALSE(inputs.compressed);
    EXPECT_EQ(inputs.log_file, "CPOAnalyzer.json");

    const PoleFigureInputs &pf = inputs.pole_figures;
    EXPECT_EQ(pf.time_data_file, "statistics");
    EXPECT_EQ(pf.time_data_marker, "particle_LPO");
    EXPECT_EQ(pf.particle_data_file_prefix, "particle_CPO/particles");
    EXPECT_EQ(pf.grain_data_file_prefix, "particle_CPO/weighted_CPO");
    EXPECT_EQ(pf.figure_output_dir, "CPO_figures/");
    EXPECT_EQ(pf.figure_output_prefix, "weighted_LPO");
    EXPECT_EQ(pf.color_scale, "Batlow");
    EXPECT_EQ(pf.max_count_method, "none");
    EXPECT_TRUE(pf.elasticity_header);
    EXPECT_FALSE(pf.small_figure);
    EXPECT_FALSE(pf.no_description_text);
    EXPECT_EQ(pf.sphere_points, 301);
    EXPECT_EQ(pf.hemisphere, Upper);

    ASSERT_EQ(pf.times.size(), 2);
    EXPECT_DOUBLE_EQ(pf.times[1], 2e6);
    ASSERT_EQ(pf.particle_ids.size(), 3);
    EXPECT_EQ(pf.particle_ids[2], 100);
    ASSERT_EQ(pf.axes.size(), 2);
    EXPECT_EQ(pf.axes[0], AAxis);
    EXPECT_EQ(pf.axes[1], CAxis);
    ASSERT_EQ(pf.minerals.size(), 2);
    EXPECT_EQ(pf.minerals[0], Olivine);
    EXPECT_EQ(pf.minerals[1], Enstatite);
}

void testInputsAllOptions() {
    std::string input_filename = "TestInputsAll.json";
    writeTestData(input_filename, true);
    Inputs inputs(1, input_filename);

    EXPECT_TRUE(inputs.compressed);
    EXPECT_EQ(inputs.log_file, "TestLog.json");
    const PoleFigureInputs &pf = inputs.pole_figures;
    EXPECT_EQ(pf.time_data_file, "stats.txt");
    EXPECT_EQ(pf.time_data_marker, "particle_CPO");
    EXPECT_EQ(pf.particle_data_file_prefix, "cpo/particles");
    EXPECT_EQ(pf.grain_data_file_prefix, "cpo/grains");
    EXPECT_EQ(pf.figure_output_dir, "figures/");
    EXPECT_EQ(pf.figure_output_prefix, "test_CPO");
    EXPECT_EQ(pf.color_scale, "Vik");
    EXPECT_EQ(pf.max_count_method, "divide 3");
    EXPECT_FALSE(pf.elasticity_header);
    EXPECT_TRUE(pf.small_figure);
    EXPECT_TRUE(pf.no_description_text);
    EXPECT_EQ(pf.sphere_points, 51);
    EXPECT_EQ(pf.hemisphere, Lower);
}

// Replace the first occurrence of "from" in an input file with "to"
void writeModifiedInput(std::string input_filename, std::string from, std::string to) {
    std::ifstream template_file("TestInputsAll.json");
    std::stringstream contents;
    contents << template_file.rdbuf();
    template_file.close();
    std::string modified = contents.str();
    std::size_t pos = modified.find(from);
    ASSERT_NE(pos, std::string::npos);
    modified.replace(pos, from.size(), to);
    std::ofstream output_file(input_filename);
    output_file << modified;
    output_file.close();
}

void testInputsErrors() {
    writeTestData("TestInputsAll.json", true);

    // Invalid enumerated values
    writeModifiedInput("TestInputsColor.json", "\"Vik\"", "\"Viridis\"");
    EXPECT_THROW(Inputs(1, "TestInputsColor.json"), std::runtime_error);
    writeModifiedInput("TestInputsMaxCount.json", "\"divide 3\"", "\"divide 5\"");
    EXPECT_THROW(Inputs(1, "TestInputsMaxCount.json"), std::runtime_error);
    writeModifiedInput("TestInputsHemisphere.json", "\"lower\"", "\"left\"");
    EXPECT_THROW(Inputs(1, "TestInputsHemisphere.json"), std::runtime_error);
    writeModifiedInput("TestInputsAxis.json", "\"CAxis\"", "\"DAxis\"");
    EXPECT_THROW(Inputs(1, "TestInputsAxis.json"), std::runtime_error);
    writeModifiedInput("TestInputsMineral.json", "\"Enstatite\"", "\"Quartz\"");
    EXPECT_THROW(Inputs(1, "TestInputsMineral.json"), std::runtime_error);
    writeModifiedInput("TestInputsSpherePoints.json", "51", "1");
    EXPECT_THROW(Inputs(1, "TestInputsSpherePoints.json"), std::runtime_error);

    // Missing required inputs, empty lists and missing file
    writeModifiedInput("TestInputsNoTimes.json", "\"Times\"", "\"Tims\"");
    EXPECT_THROW(Inputs(1, "TestInputsNoTimes.json"), std::runtime_error);
    writeModifiedInput("TestInputsNoBase.json", "\"BaseDirectory\"", "\"Base\"");
    EXPECT_THROW(Inputs(1, "TestInputsNoBase.json"), std::runtime_error);
    writeModifiedInput("TestInputsNoExperiments.json", "[\"exp_1/\", \"exp_2/\"]", "[]");
    EXPECT_THROW(Inputs(1, "TestInputsNoExperiments.json"), std::runtime_error);
    writeModifiedInput("TestInputsNoParticles.json", "[1, 10, 100]", "[]");
    EXPECT_THROW(Inputs(1, "TestInputsNoParticles.json"), std::runtime_error);
    EXPECT_THROW(Inputs(1, "TestInputsMissing.json"), std::runtime_error);
}

void testValidators() {
    EXPECT_NO_THROW(validColorScale("Batlow"));
    EXPECT_NO_THROW(validColorScale("Roma"));
    EXPECT_THROW(validColorScale("batlow"), std::runtime_error);
    EXPECT_NO_THROW(validMaxCountMethod("none"));
    EXPECT_NO_THROW(validMaxCountMethod("divide 4"));
    EXPECT_THROW(validMaxCountMethod("divide 1"), std::runtime_error);
}
void testProgressLog() {
    std::stringstream stream;
    ProgressLog log(3, stream);
    log.print("Processing experiment 0");
    log.printWarning("particle id 7 not found");
    EXPECT_EQ(stream.str(), "[rank 3] Processing experiment 0\n[rank 3] Warning: particle id 7 not found\n");
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, inputs) {
    testInputsDefaults();
    testInputsAllOptions();
    testInputsErrors();
    testValidators();
}
TEST(TEST_CATEGORY, progress_log) { testProgressLog(); }
} // end namespace Test
