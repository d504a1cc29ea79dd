// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOprint.hpp"

#include <cstdio>
#include <iomanip>
#include <stdexcept>

// Figure file name, ending with the extension of the renderer:
// <exp dir><out dir><out prefix>_<elastic_|no-elastic_><minerals><axes>Axis_<color scale>_g1_sp<N>_t<timestep>.<id>
std::string getPoleFigureFilename(const std::string experiment_dir, const PoleFigureInputs &inputs,
                                  const int timestep, const long particle_id, const std::string extension) {

    std::string mineral_tags = "";
    for (auto mineral : inputs.minerals)
        mineral_tags += mineralTag(mineral);
    std::string axis_tags = "";
    for (auto axis : inputs.axes)
        axis_tags += crystalAxisTag(axis);

    char suffix[64];
    std::snprintf(suffix, sizeof(suffix), "_t%05d.%05ld", timestep, particle_id);
    std::string elastic_tag = (inputs.elasticity_header) ? "elastic_" : "no-elastic_";
    // Kernel exponent (gamma) is fixed to 1
    return experiment_dir + inputs.figure_output_dir + inputs.figure_output_prefix + "_" + elastic_tag + mineral_tags +
           axis_tags + "Axis_" + inputs.color_scale + "_g1_sp" + std::to_string(inputs.sphere_points) + suffix +
           extension;
}

void PoleFigureDataWriter::render(const PoleFigureGrid &pole_figures, const view_type_double_2d_host mask,
                                  const ParticleRecord &particle, const double time, const int n_grains,
                                  const long particle_id, const RenderOptions &options,
                                  const std::string output_file) {

    // Checked before the file is opened so that no partial file is left behind
    if ((options.elasticity_header) && (!particle.hasElasticity()))
        throw std::runtime_error("Error: Particle " + std::to_string(particle_id) +
                                 " does not have the elastic tensor decomposition values needed for the elasticity "
                                 "header of \"" + output_file + "\"");
    std::ofstream output_stream;
    output_stream.open(output_file);
    if (!(output_stream.is_open()))
        throw std::runtime_error("Error: Could not open pole figure output file \"" + output_file + "\"");
    writeHeader(output_stream, particle, time, n_grains, particle_id, options);
    for (auto &pole_figures_axis : pole_figures) {
        for (auto &pole_figure : pole_figures_axis)
            writePoleFigure(output_stream, pole_figure, mask, options);
    }
    output_stream.close();
}

void PoleFigureDataWriter::writeHeader(std::ofstream &output_stream, const ParticleRecord &particle,
                                       const double time, const int n_grains, const long particle_id,
                                       const RenderOptions &options) {

    output_stream << "% CPOAnalyzer pole figure data" << std::endl;
    output_stream << "% particle id: " << particle_id << std::endl;
    output_stream << std::scientific << std::setprecision(5);
    output_stream << "% time: " << time << std::endl;
    output_stream << std::setprecision(3);
    output_stream << "% position: " << particle.x << " " << particle.y;
    if (particle.has_z)
        output_stream << " " << particle.z;
    output_stream << std::endl;
    output_stream << std::defaultfloat << std::setprecision(6);
    if (particle.has_deformation_type)
        output_stream << "% olivine deformation type: " << particle.olivine_deformation_type << std::endl;
    output_stream << "% grains: " << n_grains << std::endl;
    output_stream << "% sphere points: " << options.sphere_points << std::endl;
    output_stream << "% hemisphere: " << hemisphereName(options.hemisphere) << std::endl;
    output_stream << "% color scale: " << options.color_scale << std::endl;
    output_stream << "% max count method: " << options.max_count_method << std::endl;
    output_stream << "% figure size: " << ((options.small_figure) ? "small" : "normal") << std::endl;
    output_stream << "% description text: " << ((options.no_description_text) ? "off" : "on") << std::endl;
    if (options.elasticity_header) {
        ElasticAnisotropy anisotropy(particle);
        output_stream << std::fixed << std::setprecision(4);
        output_stream << "% anisotropic percent: " << anisotropy.anisotropic_percent << std::endl;
        output_stream << std::setprecision(2);
        for (int n = 0; n < num_symmetry_classes; n++) {
            output_stream << "% " << symmetryClassTag(n) << "%: " << anisotropy.percent_of_full[n][0] << " "
                          << anisotropy.percent_of_full[n][1] << " " << anisotropy.percent_of_full[n][2] << std::endl;
            output_stream << "% " << symmetryClassTag(n).substr(0, 1) << "/a%: "
                          << anisotropy.percent_of_anisotropic[n][0] << " " << anisotropy.percent_of_anisotropic[n][1]
                          << " " << anisotropy.percent_of_anisotropic[n][2] << std::endl;
        }
        output_stream << std::defaultfloat << std::setprecision(6);
    }
}

// One block per pole figure: tags and color scale limits, then the density matrix with cells outside of the
// projected disk written as nan
void PoleFigureDataWriter::writePoleFigure(std::ofstream &output_stream, const PoleFigure &pole_figure,
                                           const view_type_double_2d_host mask, const RenderOptions &options) {

    output_stream << "% pole figure: " << crystalAxisName(pole_figure.crystal_axis) << " "
                  << mineralName(pole_figure.mineral) << std::endl;
    output_stream << "% max count: " << pole_figure.max_count << std::endl;
    output_stream << "% color scale max: " << colorScaleMaxCount(pole_figure.max_count, options.max_count_method)
                  << std::endl;
    const int nrows = pole_figure.counts.extent(0);
    const int ncols = pole_figure.counts.extent(1);
    for (int i = 0; i < nrows; i++) {
        for (int j = 0; j < ncols; j++) {
            if (validCell(mask(i, j)))
                output_stream << pole_figure.counts(i, j);
            else
                output_stream << "nan";
            if (j != ncols - 1)
                output_stream << " ";
        }
        output_stream << std::endl;
    }
}
