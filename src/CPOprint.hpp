// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_PRINT_HPP
#define CPOANALYZER_PRINT_HPP

#include "CPOinputdata.hpp"
#include "CPOpolefigure.hpp"
#include "CPOrecords.hpp"
#include "CPOtypes.hpp"

#include <fstream>
#include <string>
#include <vector>

// Display options passed to a renderer along with the pole figures
struct RenderOptions {
    std::string color_scale = "Batlow";
    std::string max_count_method = "none";
    bool elasticity_header = true;
    bool small_figure = false;
    bool no_description_text = false;
    int sphere_points = 301;
    Hemisphere hemisphere = Upper;

    RenderOptions(){};
    RenderOptions(const PoleFigureInputs &inputs)
        : color_scale(inputs.color_scale)
        , max_count_method(inputs.max_count_method)
        , elasticity_header(inputs.elasticity_header)
        , small_figure(inputs.small_figure)
        , no_description_text(inputs.no_description_text)
        , sphere_points(inputs.sphere_points)
        , hemisphere(inputs.hemisphere) {}
};

// Consumer of a completed grid of pole figures for one particle at one time. "mask" is the validity mask of the
// sampling grid the pole figures were computed on
class PoleFigureRenderer {
  public:
    virtual ~PoleFigureRenderer() = default;
    virtual void render(const PoleFigureGrid &pole_figures, const view_type_double_2d_host mask,
                        const ParticleRecord &particle, const double time, const int n_grains, const long particle_id,
                        const RenderOptions &options, const std::string output_file) = 0;
    // Extension of the files written by this renderer
    virtual std::string fileExtension() const = 0;
};

// Writes the pole figure density matrices and their metadata to an ASCII file, for plotting by external tools
class PoleFigureDataWriter : public PoleFigureRenderer {
  public:
    void render(const PoleFigureGrid &pole_figures, const view_type_double_2d_host mask,
                const ParticleRecord &particle, const double time, const int n_grains, const long particle_id,
                const RenderOptions &options, const std::string output_file) override;
    std::string fileExtension() const override { return ".txt"; }

  private:
    void writeHeader(std::ofstream &output_stream, const ParticleRecord &particle, const double time,
                     const int n_grains, const long particle_id, const RenderOptions &options);
    void writePoleFigure(std::ofstream &output_stream, const PoleFigure &pole_figure,
                         const view_type_double_2d_host mask, const RenderOptions &options);
};

std::string getPoleFigureFilename(const std::string experiment_dir, const PoleFigureInputs &inputs,
                                  const int timestep, const long particle_id, const std::string extension);

#endif
