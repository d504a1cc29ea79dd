// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef RUNCPO_HPP
#define RUNCPO_HPP

#include "CPOinputs.hpp"
#include "CPOlambert.hpp"
#include "CPOlog.hpp"
#include "CPOorientation.hpp"
#include "CPOpolefigure.hpp"
#include "CPOprint.hpp"
#include "CPOshards.hpp"
#include "CPOtimeresolver.hpp"
#include "CPOtimers.hpp"

#include "mpi.h"

#include <Kokkos_Core.hpp>

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

// Counts of the pole figures written for one experiment directory
struct ExperimentSummary {
    int figures_written = 0;
    int particles_not_found = 0;
};

// Make the pole figures requested in "inputs" for all times and particles of one experiment directory. Particles that
// do not exist at a timestep are skipped, any other problem with the data aborts the experiment with an exception
template <typename MemorySpace>
ExperimentSummary processExperiment(const std::string experiment_dir, const Inputs &inputs, Timers &timers,
                                    ProgressLog &log, PoleFigureRenderer &renderer) {

    const PoleFigureInputs &pf_inputs = inputs.pole_figures;
    ExperimentSummary summary;

    std::vector<double> timestep_times =
        readTimestepTimes(experiment_dir + pf_inputs.time_data_file, pf_inputs.time_data_marker);
    if (timestep_times.size() == 0)
        throw std::runtime_error("Error: No particle output entries (\"" + pf_inputs.time_data_marker +
                                 "\") found in time data file \"" + experiment_dir + pf_inputs.time_data_file + "\"");

    // Sampling grid shared by all figures of this experiment
    LambertGrid<MemorySpace> lambert(pf_inputs.sphere_points, pf_inputs.hemisphere);
    view_type_double_2d_host mask_host = copyToHost(lambert.mask);
    ShardLocator locator(experiment_dir, pf_inputs.grain_data_file_prefix, pf_inputs.particle_data_file_prefix,
                         inputs.compressed);
    RenderOptions options(pf_inputs);
    std::filesystem::create_directories(experiment_dir + pf_inputs.figure_output_dir);

    for (auto requested_time : pf_inputs.times) {
        const int timestep = resolveTimestep(timestep_times, requested_time);
        const double time = timestep_times[timestep];
        log.print("Processing time " + std::to_string(time) + " (requested time: " + std::to_string(requested_time) +
                  "), located in timestep " + std::to_string(timestep) + " of " + experiment_dir);

        for (auto particle_id : pf_inputs.particle_ids) {
            try {
                timers.startRead();
                ParticleLookup lookup = locator.locateParticle(timestep, particle_id);
                timers.stopRead();
                if (!(lookup.found)) {
                    log.printWarning("particle id " + std::to_string(particle_id) + " not found for timestep " +
                                     std::to_string(timestep) + ", searched " + std::to_string(lookup.shard_index) +
                                     " shards");
                    summary.particles_not_found++;
                    continue;
                }
                const int n_grains = lookup.grains.size();

                timers.startDensity();
                Orientation<MemorySpace> orientation(lookup.grains);
                PoleFigureGrid pole_figures = assemblePoleFigures(orientation, lambert, pf_inputs.axes,
                                                                  pf_inputs.minerals);
                timers.stopDensity();

                timers.startOutput();
                std::string output_file = getPoleFigureFilename(experiment_dir, pf_inputs, timestep, particle_id,
                                                                renderer.fileExtension());
                renderer.render(pole_figures, mask_host, lookup.particle, time, n_grains, particle_id, options,
                                output_file);
                timers.stopOutput();
                summary.figures_written++;
                log.print("Wrote pole figures for particle " + std::to_string(particle_id) + " (" +
                          std::to_string(n_grains) + " grains from \"" + lookup.grain_file + "\") to \"" +
                          output_file + "\"");
            }
            catch (const std::exception &err) {
                throw std::runtime_error(std::string(err.what()) + " [experiment " + experiment_dir + ", timestep " +
                                         std::to_string(timestep) + ", particle id " + std::to_string(particle_id) +
                                         "]");
            }
        }
    }
    return summary;
}

// Distribute the experiment directories over the MPI ranks (experiment e on rank e % np) and process each. A failed
// experiment is logged and counted without stopping the others. Returns the number of failed experiments over all
// ranks
template <typename MemorySpace>
int runExperiments(int id, int np, Inputs inputs, Timers timers) {

    ProgressLog log(id);
    PoleFigureDataWriter data_writer;

    // End of initialization
    timers.stopInit();
    MPI_Barrier(MPI_COMM_WORLD);

    timers.startRun();
    int num_figures_local = 0, num_missing_local = 0, num_failures_local = 0;
    const int num_experiments = inputs.experiment_dirs.size();
    for (int e = id; e < num_experiments; e += np) {
        std::string experiment_dir = inputs.base_directory + inputs.experiment_dirs[e];
        log.print("Processing experiment " + std::to_string(e) + ": " + experiment_dir);
        try {
            ExperimentSummary summary =
                processExperiment<MemorySpace>(experiment_dir, inputs, timers, log, data_writer);
            num_figures_local += summary.figures_written;
            num_missing_local += summary.particles_not_found;
        }
        catch (const std::exception &err) {
            log.print("Experiment " + experiment_dir + " failed: " + err.what());
            num_failures_local++;
        }
    }
    timers.stopRun();
    MPI_Barrier(MPI_COMM_WORLD);

    // Totals over all ranks
    int num_figures, num_missing, num_failures;
    MPI_Allreduce(&num_figures_local, &num_figures, 1, MPI_INT, MPI_SUM, MPI_COMM_WORLD);
    MPI_Allreduce(&num_missing_local, &num_missing, 1, MPI_INT, MPI_SUM, MPI_COMM_WORLD);
    MPI_Allreduce(&num_failures_local, &num_failures, 1, MPI_INT, MPI_SUM, MPI_COMM_WORLD);
    timers.reduceMPI();

    // Print the log file with JSON format
    inputs.printCPOLog(id, np, num_figures, num_missing, num_failures, timers);

    // Print timing information to the console
    timers.printFinal(np, num_figures);
    if ((id == 0) && (num_failures > 0))
        std::cout << num_failures << " of " << num_experiments << " experiments failed" << std::endl;
    return num_failures;
}

#endif
