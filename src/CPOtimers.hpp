// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_TIMERS_HPP
#define CPOANALYZER_TIMERS_HPP

#include "mpi.h"
#include <iostream>
#include <sstream>
#include <string>

class Timer {
    double _time = 0.0;
    double start_time = 0.0;
    double max_time = 0.0, min_time = 0.0;
    int num_calls = 0;

  public:
    void start() { start_time = MPI_Wtime(); }
    void stop() {
        _time += MPI_Wtime() - start_time;
        num_calls++;
    }
    void reset() { _time = 0.0; }
    auto time() { return _time; }
    auto numCalls() { return num_calls; }
    auto minTime() { return min_time; }
    auto maxTime() { return max_time; }

    void reduceMPI() {
        MPI_Allreduce(&_time, &max_time, 1, MPI_DOUBLE, MPI_MAX, MPI_COMM_WORLD);
        MPI_Allreduce(&_time, &min_time, 1, MPI_DOUBLE, MPI_MIN, MPI_COMM_WORLD);
    }

    auto print(std::string description) {
        std::stringstream out;
        out << "Time spent " << description << " = " << _time << " s" << std::endl;
        return out.str();
    }

    auto printMinMax(std::string description) {
        std::stringstream out;
        out << "Max/min rank time " << description << " = " << max_time << " / " << min_time << " s" << std::endl;
        return out.str();
    }
};

// Print timing info
struct Timers {

    int id;
    Timer init, run, output;
    Timer read, density;

    Timers(const int mpi_id)
        : id(mpi_id)
        , init()
        , run()
        , output()
        , read()
        , density() {}

    void startInit() { init.start(); }
    void stopInit() {
        init.stop();
        if (id == 0)
            std::cout << "Inputs initialized: Time spent: " << init.time() << " s" << std::endl;
    }

    void startRun() { run.start(); }
    void stopRun() { run.stop(); }

    void startOutput() { output.start(); }
    void stopOutput() { output.stop(); }

    // Locating and decoding shard files
    void startRead() { read.start(); }
    void stopRead() { read.stop(); }

    void startDensity() { density.start(); }
    void stopDensity() { density.stop(); }

    double getTotal() { return init.time() + run.time(); }

    auto printLog() {
        // This assumes reduceMPI() has already been called.
        std::stringstream log;
        log << "   \"Timing\": {" << std::endl;
        log << "       \"Runtime\": " << getTotal() << "," << std::endl;
        log << "       \"InitRunBreakdown\": [" << init.time() << "," << run.time() << "]," << std::endl;
        log << "       \"MaxMinRunTime\": [" << run.maxTime() << "," << run.minTime() << "]," << std::endl;
        log << "       \"MaxMinReadTime\": [" << read.maxTime() << "," << read.minTime() << "]," << std::endl;
        log << "       \"MaxMinDensityTime\": [" << density.maxTime() << "," << density.minTime() << "]," << std::endl;
        log << "       \"MaxMinOutputTime\": [" << output.maxTime() << "," << output.minTime() << "]" << std::endl;
        log << "   }" << std::endl;
        return log.str();
    }

    void reduceMPI() {
        // Reduce all times across MPI ranks
        init.reduceMPI();
        run.reduceMPI();
        read.reduceMPI();
        density.reduceMPI();
        output.reduceMPI();
    }

    void printFinal(const int np, const int num_figures) {

        if (id != 0)
            return;

        std::cout << "===================================================================================" << std::endl;
        std::cout << "Having run with = " << np << " processors" << std::endl;
        std::cout << "Pole figures written = " << num_figures << std::endl;
        std::cout << "Total time = " << getTotal() << std::endl;
        std::cout << init.print("reading inputs");
        std::cout << run.print("processing experiments");

        std::cout << run.printMinMax("processing experiments");
        std::cout << read.printMinMax("reading shard files");
        std::cout << density.printMinMax("computing orientation densities");
        std::cout << output.printMinMax("writing pole figures");

        std::cout << "===================================================================================" << std::endl;
    }
};

#endif
