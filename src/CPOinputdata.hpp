// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_INPUTDATA_HPP
#define CPOANALYZER_INPUTDATA_HPP

#include "CPOtypes.hpp"

#include <stdexcept>
#include <string>
#include <vector>

// Error if this is not a color scale known to the renderers
inline void validColorScale(const std::string color_scale) {
    if (color_scale != "Batlow" && color_scale != "Vik" && color_scale != "Simple" && color_scale != "Imola" &&
        color_scale != "Hawaii" && color_scale != "Roma")
        throw std::runtime_error("Error: unknown color scale \"" + color_scale +
                                 "\", available options are Batlow, Vik, Simple, Imola, Hawaii and Roma");
}

// Error if this is not a valid method of scaling the maximum of the color scale
inline void validMaxCountMethod(const std::string max_count_method) {
    if (max_count_method != "none" && max_count_method != "divide 2" && max_count_method != "divide 3" &&
        max_count_method != "divide 4")
        throw std::runtime_error("Error: unknown max count method \"" + max_count_method +
                                 "\", available options are none, divide 2, divide 3 and divide 4");
}

// Structs to organize data within inputs struct
struct PoleFigureInputs {
    // Paths relative to each experiment directory
    std::string time_data_file = "statistics";
    std::string time_data_marker = "particle_LPO";
    std::string particle_data_file_prefix = "particle_CPO/particles";
    std::string grain_data_file_prefix = "particle_CPO/weighted_CPO";
    std::string figure_output_dir = "CPO_figures/";
    std::string figure_output_prefix = "weighted_LPO";
    // Display options passed on to the renderer
    std::string color_scale = "Batlow";
    std::string max_count_method = "none";
    bool elasticity_header = true;
    bool small_figure = false;
    bool no_description_text = false;
    // Sampling grid
    int sphere_points = 301;
    Hemisphere hemisphere = Upper;
    // Requested figures
    std::vector<double> times;
    std::vector<long> particle_ids;
    std::vector<CrystalAxis> axes;
    std::vector<Mineral> minerals;
};

#endif
