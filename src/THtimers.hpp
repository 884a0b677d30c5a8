// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_TIMERS_HPP
#define THERMALHISTORY_TIMERS_HPP

#include "mpi.h"
#include <iostream>
#include <sstream>

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
    Timer read, resample, analyze;

    Timers(const int mpi_id)
        : id(mpi_id)
        , init()
        , run()
        , output()
        , read()
        , resample()
        , analyze() {}

    void startInit() { init.start(); }
    void stopInit() {
        init.stop();
        if (id == 0)
            std::cout << "Data initialized: Time spent: " << init.time() << " s" << std::endl;
    }

    void startRun() { run.start(); }
    void stopRun() { run.stop(); }

    void startOutput() { output.start(); }
    void stopOutput() { output.stop(); }

    void startRead() { read.start(); }
    void stopRead() { read.stop(); }

    void startResample() { resample.start(); }
    void stopResample() { resample.stop(); }

    void startAnalyze() { analyze.start(); }
    void stopAnalyze() { analyze.stop(); }

    double getTotal() { return init.time() + run.time() + output.time(); }

    auto printLog() {
        // This assumes reduceMPI() has already been called.
        std::stringstream log;
        log << "   \"Timing\": {" << std::endl;
        log << "       \"Runtime\": " << getTotal() << "," << std::endl;
        log << "       \"InitRunOutputBreakdown\": [" << init.time() << "," << run.time() << "," << output.time()
            << "]," << std::endl;
        log << "       \"MaxMinInitTime\": [" << init.maxTime() << "," << init.minTime() << "]," << std::endl;
        log << "       \"MaxMinSnapshotReadTime\": [" << read.maxTime() << "," << read.minTime() << "]," << std::endl;
        log << "       \"MaxMinResampleTime\": [" << resample.maxTime() << "," << resample.minTime() << "],"
            << std::endl;
        log << "       \"MaxMinAnalysisTime\": [" << analyze.maxTime() << "," << analyze.minTime() << "],"
            << std::endl;
        log << "       \"MaxMinOutputTime\": [" << output.maxTime() << "," << output.minTime() << "]" << std::endl;
        log << "   }" << std::endl;
        return log.str();
    }

    void reduceMPI() {
        // Reduce all times across MPI ranks
        init.reduceMPI();
        read.reduceMPI();
        resample.reduceMPI();
        analyze.reduceMPI();
        output.reduceMPI();
    }

    void printFinal(const int np, const int num_snapshots) {

        if (id != 0)
            return;

        std::cout << "===================================================================================" << std::endl;
        std::cout << "Having run with = " << np << " processors" << std::endl;
        std::cout << "Number of snapshots processed = " << num_snapshots << std::endl;
        std::cout << "Total time = " << getTotal() << std::endl;
        std::cout << init.print("initializing data");
        std::cout << run.print("resampling snapshots and analyzing thermal histories");
        std::cout << output.print("collecting and printing output data");

        std::cout << init.printMinMax("initializing data");
        std::cout << read.printMinMax("reading snapshots");
        std::cout << resample.printMinMax("resampling snapshots");
        std::cout << analyze.printMinMax("analyzing thermal histories");
        std::cout << output.printMinMax("exporting data");

        std::cout << "===================================================================================" << std::endl;
    }
};

#endif
