// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "CPOAnalyzer.hpp"

#include <gtest/gtest.h>

#include "mpi.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace Test {
//---------------------------------------------------------------------------//
// Helpers: experiment directories written by rank 0
//---------------------------------------------------------------------------//
void writeTextFile(const std::string filename, const std::string contents) {
    std::ofstream text_file(filename);
    text_file << contents;
    text_file.close();
}

// Particle 5 is in shard 0 at timestep 0 and in shard 1 at timestep 1, particle 6 is never written
void writeGoodExperiment(const std::string experiment_dir) {
    std::filesystem::create_directories(experiment_dir + "particle_CPO");
    writeTextFile(experiment_dir + "statistics", "# 1: Time step number\n"
                                                 "# 2: Time (years)\n"
                                                 "0 0.0000e+00 particle_LPO/particles-00000\n"
                                                 "1 1.0000e+05 particle_LPO/particles-00001\n");
    const std::string grain_columns = "id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z\n";
    writeTextFile(experiment_dir + "particle_CPO/weighted_CPO-00000.0000.dat",
                  grain_columns + "5 10 20 30\n5 12 22 32\n7 0 0 0\n");
    writeTextFile(experiment_dir + "particle_CPO/particles-00000.0000.dat", "id x y\n5 1 2\n7 3 4\n");
    writeTextFile(experiment_dir + "particle_CPO/weighted_CPO-00001.0000.dat", "");
    writeTextFile(experiment_dir + "particle_CPO/weighted_CPO-00001.0001.dat",
                  grain_columns + "5 40 50 60\n5 42 52 62\n5 44 54 64\n");
    writeTextFile(experiment_dir + "particle_CPO/particles-00001.0001.dat", "id x y\n5 1.1 2.1\n");
}

// Grain data that cannot be parsed
void writeBadExperiment(const std::string experiment_dir) {
    std::filesystem::create_directories(experiment_dir + "particle_CPO");
    writeTextFile(experiment_dir + "statistics", "0 0.0000e+00 particle_LPO/particles-00000\n");
    writeTextFile(experiment_dir + "particle_CPO/weighted_CPO-00000.0000.dat",
                  "id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z\n5 10 twenty 30\n");
}

void writeRunInput(const std::string input_file, const std::string base_directory) {
    writeTextFile(input_file, "{\n"
                              "   \"BaseDirectory\": \"" +
                                  base_directory +
                                  "\",\n"
                                  "   \"ExperimentDirectories\": [\"exp_good/\", \"exp_bad/\"],\n"
                                  "   \"PoleFigures\": {\n"
                                  "      \"ElasticityHeader\": false,\n"
                                  "      \"SpherePoints\": 11,\n"
                                  "      \"Times\": [0.0, 9.0e4],\n"
                                  "      \"ParticleIDs\": [5, 6],\n"
                                  "      \"Axes\": [\"AAxis\", \"CAxis\"],\n"
                                  "      \"Minerals\": [\"Olivine\"]\n"
                                  "   }\n"
                                  "}\n");
}

//---------------------------------------------------------------------------//
// full_run_tests
//---------------------------------------------------------------------------//
void testRunCPOAnalyzer() {

    int id, np;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    MPI_Comm_size(MPI_COMM_WORLD, &np);

    // Separate directories for each backend and number of ranks the test is run with
    const std::string run_name = "TestRunCPO_" + std::string(TEST_EXECSPACE::name()) + "_np" + std::to_string(np);
    const std::string base_directory = run_name + "/";
    const std::string input_file = run_name + ".json";
    if (id == 0) {
        std::filesystem::remove_all(base_directory);
        writeGoodExperiment(base_directory + "exp_good/");
        writeBadExperiment(base_directory + "exp_bad/");
        writeRunInput(input_file, base_directory);
    }
    MPI_Barrier(MPI_COMM_WORLD);

    // The bad experiment fails without stopping the good one
    int num_failures = runCPOAnalyzer(id, np, input_file);
    EXPECT_EQ(num_failures, 1);
    MPI_Barrier(MPI_COMM_WORLD);

    if (id == 0) {
        const std::string figure_dir = base_directory + "exp_good/CPO_figures/";
        const std::string figure_prefix = figure_dir + "weighted_LPO_no-elastic_oli_A-C-Axis_Batlow_g1_sp11";
        EXPECT_TRUE(std::filesystem::exists(figure_prefix + "_t00000.00005.txt"));
        EXPECT_TRUE(std::filesystem::exists(figure_prefix + "_t00001.00005.txt"));
        EXPECT_FALSE(std::filesystem::exists(figure_prefix + "_t00000.00006.txt"));

        // Timestep 1 figure was made from the three grains in shard 1
        std::ifstream figure_stream(figure_prefix + "_t00001.00005.txt");
        std::string line;
        bool found_grains = false;
        int num_figures_in_file = 0;
        while (std::getline(figure_stream, line)) {
            if (line == "% grains: 3")
                found_grains = true;
            if (line.find("% pole figure:") == 0)
                num_figures_in_file++;
        }
        EXPECT_TRUE(found_grains);
        EXPECT_EQ(num_figures_in_file, 2);

        // Totals in the log file
        std::ifstream log_stream(base_directory + "CPOAnalyzer.json");
        nlohmann::json log_data = nlohmann::json::parse(log_stream);
        EXPECT_EQ(log_data["FiguresWritten"], 2);
        EXPECT_EQ(log_data["ParticlesNotFound"], 2);
        EXPECT_EQ(log_data["FailedExperiments"], 1);
        EXPECT_EQ(log_data["NumberMPIRanks"], np);
        EXPECT_EQ(log_data["PoleFigures"]["SpherePoints"], 11);
    }
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, run_cpo) { testRunCPOAnalyzer(); }
} // end namespace Test
