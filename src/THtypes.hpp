// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_TYPES_HPP
#define THERMALHISTORY_TYPES_HPP

// Outcome of the thermal history analysis of a single grid point
enum PointStatus {
    NoData = 0,
    NotMelted = 1,
    IncompleteSolidification = 2,
    Solidified = 3,
    Masked = 4
};

// Point counts and cooling rate statistics across all MPI ranks, filled by ThermalHistory::summarize
struct HistorySummary {
    long num_points = 0;
    long no_data = 0;
    long not_melted = 0;
    long incomplete_solidification = 0;
    long solidified = 0;
    long masked = 0;
    // Solidified points that crossed the liquidus more than once
    long remelted = 0;
    // Only meaningful if solidified > 0
    double min_cooling_rate = 0.0;
    double max_cooling_rate = 0.0;
    double mean_cooling_rate = 0.0;
    double median_cooling_rate = 0.0;
    // Ranges of the melting and solidification times of solidified points
    double min_melting_time = 0.0;
    double max_melting_time = 0.0;
    double min_solidification_time = 0.0;
    double max_solidification_time = 0.0;
};

#endif
