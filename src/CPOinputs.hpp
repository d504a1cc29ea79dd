// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_INPUTS_HPP
#define CPOANALYZER_INPUTS_HPP

#include "CPOinfo.hpp"
#include "CPOinputdata.hpp"
#include "CPOtimers.hpp"
#include "CPOtypes.hpp"

#include "mpi.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// Error if a required input is not present in the given section of the input file
inline void requireInput(const nlohmann::json &input_section, const std::string key, const std::string section) {
    if (!(input_section.contains(key)))
        throw std::runtime_error("Error: Required input \"" + key + "\" not found in " + section);
}

struct Inputs {

    std::string base_directory = "";
    std::vector<std::string> experiment_dirs;
    bool compressed = false;
    std::string log_file = "CPOAnalyzer.json";
    PoleFigureInputs pole_figures;
    std::string file_name;

    // Creates input struct with uninitialized/default values, used in unit tests
    Inputs(){};

    Inputs(const int id, const std::string input_file)
        : file_name(input_file) {

        // Open and read JSON input file
        std::ifstream input_data_stream(input_file);
        if (!(input_data_stream.is_open()))
            throw std::runtime_error("Error: Could not locate/open input file \"" + input_file + "\"");
        nlohmann::json input_data = nlohmann::json::parse(input_data_stream);

        // General inputs
        requireInput(input_data, "BaseDirectory", "the input file");
        base_directory = input_data["BaseDirectory"];
        requireInput(input_data, "ExperimentDirectories", "the input file");
        experiment_dirs = input_data["ExperimentDirectories"].get<std::vector<std::string>>();
        if (experiment_dirs.size() == 0)
            throw std::runtime_error("Error: At least one experiment directory must be given");
        // Grain orientation shards are uncompressed unless otherwise specified
        if (input_data.contains("Compressed"))
            compressed = input_data["Compressed"];
        if (input_data.contains("LogFile"))
            log_file = input_data["LogFile"];

        requireInput(input_data, "PoleFigures", "the input file");
        parsePoleFigures(id, input_data["PoleFigures"]);
        if (id == 0)
            std::cout << "Successfully parsed inputs from \"" << input_file << "\" for " << experiment_dirs.size()
                      << " experiment directories" << std::endl;
    }

    // Pole figure options: data file locations, display options, and the figures to make
    void parsePoleFigures(const int id, const nlohmann::json &pf_data) {

        // Data file names within each experiment directory (optional)
        if (pf_data.contains("TimeDataFile"))
            pole_figures.time_data_file = pf_data["TimeDataFile"];
        if (pf_data.contains("TimeDataMarker"))
            pole_figures.time_data_marker = pf_data["TimeDataMarker"];
        if (pf_data.contains("ParticleDataFilePrefix"))
            pole_figures.particle_data_file_prefix = pf_data["ParticleDataFilePrefix"];
        if (pf_data.contains("GrainDataFilePrefix"))
            pole_figures.grain_data_file_prefix = pf_data["GrainDataFilePrefix"];
        if (pf_data.contains("FigureOutputDirectory"))
            pole_figures.figure_output_dir = pf_data["FigureOutputDirectory"];
        if (pf_data.contains("FigureOutputPrefix"))
            pole_figures.figure_output_prefix = pf_data["FigureOutputPrefix"];

        // Display options (optional)
        if (pf_data.contains("ColorScale"))
            pole_figures.color_scale = pf_data["ColorScale"];
        validColorScale(pole_figures.color_scale);
        if (pf_data.contains("MaxCountMethod"))
            pole_figures.max_count_method = pf_data["MaxCountMethod"];
        validMaxCountMethod(pole_figures.max_count_method);
        if (pf_data.contains("ElasticityHeader"))
            pole_figures.elasticity_header = pf_data["ElasticityHeader"];
        if (pf_data.contains("SmallFigure"))
            pole_figures.small_figure = pf_data["SmallFigure"];
        if (pf_data.contains("NoDescriptionText"))
            pole_figures.no_description_text = pf_data["NoDescriptionText"];

        // Sampling grid (optional)
        if (pf_data.contains("SpherePoints"))
            pole_figures.sphere_points = pf_data["SpherePoints"];
        if (pole_figures.sphere_points < 2)
            throw std::runtime_error("Error: SpherePoints must be at least 2");
        if (pf_data.contains("Hemisphere"))
            pole_figures.hemisphere = getHemisphere(pf_data["Hemisphere"].get<std::string>());

        // Times, particles, axes, and minerals to make pole figures for (required)
        requireInput(pf_data, "Times", "PoleFigures");
        pole_figures.times = pf_data["Times"].get<std::vector<double>>();
        requireInput(pf_data, "ParticleIDs", "PoleFigures");
        pole_figures.particle_ids = pf_data["ParticleIDs"].get<std::vector<long>>();
        requireInput(pf_data, "Axes", "PoleFigures");
        std::vector<std::string> axis_names = pf_data["Axes"].get<std::vector<std::string>>();
        for (auto axis_name : axis_names)
            pole_figures.axes.push_back(getCrystalAxis(axis_name));
        requireInput(pf_data, "Minerals", "PoleFigures");
        std::vector<std::string> mineral_names = pf_data["Minerals"].get<std::vector<std::string>>();
        for (auto mineral_name : mineral_names)
            pole_figures.minerals.push_back(getMineral(mineral_name));
        if ((pole_figures.times.size() == 0) || (pole_figures.particle_ids.size() == 0) ||
            (pole_figures.axes.size() == 0) || (pole_figures.minerals.size() == 0))
            throw std::runtime_error("Error: At least one time, particle id, axis, and mineral must be given");
        if (id == 0)
            std::cout << "Successfully parsed pole figure options from input file" << std::endl;
    }

    // Print a log file for this run in json file format, containing the options used from the input file as well as
    // the number of figures made and experiments that failed
    void printCPOLog(const int id, const int np, const int num_figures, const int num_missing, const int num_failures,
                     Timers timers) {

        if (id == 0) {
            std::string FName = base_directory + log_file;
            std::cout << "Printing CPOAnalyzer log file" << std::endl;
            std::ofstream cpo_log;
            cpo_log.open(FName);
            cpo_log << "{" << std::endl;
            cpo_log << "   \"CPOAnalyzerVersion\": \"" << version() << "\", " << std::endl;
            cpo_log << "   \"CPOAnalyzerCommitHash\": \"" << gitCommitHash() << "\", " << std::endl;
            cpo_log << "   \"KokkosVersion\": \"" << kokkosVersion() << "\", " << std::endl;
            cpo_log << "   \"InputFile\": \"" << file_name << "\", " << std::endl;
            cpo_log << "   \"BaseDirectory\": \"" << base_directory << "\", " << std::endl;
            cpo_log << "   \"ExperimentDirectories\": [";
            for (std::size_t n = 0; n < experiment_dirs.size(); n++) {
                cpo_log << "\"" << experiment_dirs[n] << "\"";
                if (n != experiment_dirs.size() - 1)
                    cpo_log << ", ";
            }
            cpo_log << "]," << std::endl;
            cpo_log << "   \"Compressed\": " << std::boolalpha << compressed << "," << std::endl;
            cpo_log << "   \"PoleFigures\": {" << std::endl;
            cpo_log << "      \"ColorScale\": \"" << pole_figures.color_scale << "\"," << std::endl;
            cpo_log << "      \"MaxCountMethod\": \"" << pole_figures.max_count_method << "\"," << std::endl;
            cpo_log << "      \"SpherePoints\": " << pole_figures.sphere_points << "," << std::endl;
            cpo_log << "      \"Hemisphere\": \"" << hemisphereName(pole_figures.hemisphere) << "\"," << std::endl;
            cpo_log << "      \"NumberOfTimes\": " << pole_figures.times.size() << "," << std::endl;
            cpo_log << "      \"NumberOfParticles\": " << pole_figures.particle_ids.size() << std::endl;
            cpo_log << "   }," << std::endl;
            cpo_log << "   \"NumberMPIRanks\": " << np << "," << std::endl;
            cpo_log << "   \"FiguresWritten\": " << num_figures << "," << std::endl;
            cpo_log << "   \"ParticlesNotFound\": " << num_missing << "," << std::endl;
            cpo_log << "   \"FailedExperiments\": " << num_failures << "," << std::endl;
            cpo_log << timers.printLog() << std::endl;
            cpo_log << "}" << std::endl;
            cpo_log.close();
        }
    }
};

#endif
