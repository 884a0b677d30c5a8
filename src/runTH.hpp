// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef RUNTH_HPP
#define RUNTH_HPP

#include "ThermalHistory.hpp"

#include "mpi.h"

#include <exception>
#include <string>
#include <vector>

void handleInterruptSignal(int signal);
void installInterruptHandlers();
void resetInterrupt();
bool checkForInterrupt();

// Read the snapshots in time order, resample each onto the grid, analyze the temperature series of each grid point,
// and write the remapped thermal history table
template <typename MemorySpace>
HistorySummary runThermalHistory(const int id, const int np, const Inputs &inputs, Timers &timers) {

    using memory_space = MemorySpace;

    timers.startInit();
    // List the snapshot files and their times
    SnapshotStore snapshot_store(id, inputs.snapshots);
    // Check the output coordinate transform before doing any work
    Remapper remapper(inputs.remap);
    // Grid spanning the requested bounds or the snapshot data
    std::array<double, 6> data_bounds = snapshot_store.findDataBounds(id, np);
    Grid grid(id, np, inputs.domain, data_bounds);
    // Temperature series of each grid point on this rank
    Resampler<memory_space> resampler(id, grid, snapshot_store.size(), inputs.resample, inputs.snapshots);
    ThermalHistory<memory_space> thermal_history(grid.num_points_local, inputs.material, inputs.thermal_history);
    Print print(inputs.print);
    timers.stopInit();
    MPI_Barrier(MPI_COMM_WORLD);

    timers.startRun();
    int num_snapshots = snapshot_store.size();
    for (int n = 0; n < num_snapshots; n++) {
        // Stop between snapshots if any rank was interrupted, leaving the stored series unchanged
        if (checkForInterrupt())
            throw RunInterrupted("run interrupted after " + std::to_string(resampler.num_steps_committed) + " of " +
                                 std::to_string(num_snapshots) + " snapshots, no output was written");
        timers.startRead();
        Snapshot snapshot = snapshot_store.load(n, resampler.field_names);
        timers.stopRead();
        timers.startResample();
        resampler.resampleSnapshot(grid, snapshot);
        timers.stopResample();
        if (inputs.print.print_resampled_snapshots)
            print.printResampledSnapshot(id, np, grid, resampler, snapshot.time);
        if (id == 0)
            std::cout << "Resampled snapshot " << n + 1 << " of " << num_snapshots << " (time "
                      << canonicalTimeString(snapshot.time) << ", " << snapshot.num_points << " points)" << std::endl;
    }

    // Thermal history of each grid point from its temperature series
    timers.startAnalyze();
    thermal_history.analyze(resampler.temperature_series, resampler.getTimes(), resampler.num_steps_committed);
    if (inputs.snapshots.use_mask)
        thermal_history.applyMask(resampler.getCurrentField(inputs.snapshots.mask_field),
                                  inputs.snapshots.mask_threshold);
    timers.stopAnalyze();
    HistorySummary summary = thermal_history.summarize(id);
    timers.stopRun();
    MPI_Barrier(MPI_COMM_WORLD);

    // Collect the rows on rank 0, transform the coordinates, and write the table
    timers.startOutput();
    std::vector<double> rows = remapper.collectRows(id, np, grid, thermal_history);
    std::exception_ptr write_error = nullptr;
    if (id == 0) {
        try {
            remapper.remapRows(rows);
            // Point cloud first: the table only appears once all requested output was written
            if (inputs.print.print_results_vtk)
                print.printResultsVTK(print.getResultsVTKFilename(), rows, Remapper::num_columns,
                                      remapper.getColumnNames());
            remapper.writeTable(print.getOutputFilename(), rows);
        }
        catch (...) {
            write_error = std::current_exception();
        }
    }
    // Other ranks stop with rank 0 if the output could not be written
    int write_failed = (write_error != nullptr) ? 1 : 0;
    MPI_Bcast(&write_failed, 1, MPI_INT, 0, MPI_COMM_WORLD);
    if (write_error != nullptr)
        std::rethrow_exception(write_error);
    if (write_failed)
        throw ThermalHistoryError("Remapper", "output table could not be written on rank 0");
    timers.stopOutput();

    // Timing and log
    timers.reduceMPI();
    inputs.printThermalHistoryLog(id, np, print.getLogFilename(), grid, timers, summary, snapshot_store.getPaths());
    timers.printFinal(np, resampler.num_steps_committed);
    return summary;
}

#endif
