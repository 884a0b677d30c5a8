// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "THthermalhistory.hpp"
#include "THtypes.hpp"

#include <gtest/gtest.h>

#include "mpi.h"

#include <cmath>
#include <limits>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Thermal history of a single temperature series sampled at times 0, 1, 2, ..., with liquidus 1700 and solidus 1300
PointHistory analyzeSeries(const std::vector<double> temperatures, const bool cooling_rate_magnitude = false,
                           const bool interpolate_melting_time = false) {
    int num_steps = temperatures.size();
    Kokkos::View<double **, Kokkos::HostSpace> series("series", 1, num_steps);
    Kokkos::View<double *, Kokkos::HostSpace> times("times", num_steps);
    for (int step = 0; step < num_steps; step++) {
        series(0, step) = temperatures[step];
        times(step) = static_cast<double>(step);
    }
    return analyzePointHistory(series, times, 0, num_steps, 1700.0, 1300.0, cooling_rate_magnitude,
                               interpolate_melting_time, std::numeric_limits<double>::quiet_NaN());
}

//---------------------------------------------------------------------------//
// point_history_tests
//---------------------------------------------------------------------------//
void testPointHistory() {

    double no_sample = std::numeric_limits<double>::quiet_NaN();

    // Samples exactly at the liquidus and solidus count as crossing them
    PointHistory history = analyzeSeries({1000.0, 1700.0, 2000.0, 1300.0, 900.0});
    EXPECT_EQ(history.status, Solidified);
    EXPECT_EQ(history.num_melt_events, 1);
    EXPECT_DOUBLE_EQ(history.melting_time, 1.0);
    EXPECT_DOUBLE_EQ(history.solidification_time, 3.0);
    EXPECT_DOUBLE_EQ(history.cooling_rate, -700.0);

    // Remelting: the final melt event is used, and the point did not reach the solidus in between
    history = analyzeSeries({300.0, 2000.0, 1500.0, 1900.0, 1000.0});
    EXPECT_EQ(history.status, Solidified);
    EXPECT_EQ(history.num_melt_events, 2);
    EXPECT_DOUBLE_EQ(history.melting_time, 3.0);
    EXPECT_NEAR(history.solidification_time, 3.0 + 600.0 / 900.0, 1.0e-12);
    EXPECT_DOUBLE_EQ(history.cooling_rate, -900.0);

    // Remelting after solidification
    history = analyzeSeries({2000.0, 1000.0, 1800.0, 1200.0});
    EXPECT_EQ(history.status, Solidified);
    EXPECT_EQ(history.num_melt_events, 2);
    EXPECT_DOUBLE_EQ(history.melting_time, 2.0);
    EXPECT_NEAR(history.solidification_time, 2.0 + 500.0 / 600.0, 1.0e-12);

    // First sample already above the liquidus
    history = analyzeSeries({2000.0, 1000.0});
    EXPECT_EQ(history.status, Solidified);
    EXPECT_DOUBLE_EQ(history.melting_time, 0.0);
    EXPECT_NEAR(history.solidification_time, 0.7, 1.0e-12);
    EXPECT_DOUBLE_EQ(history.cooling_rate, -1000.0);
    // Positive cooling rate
    history = analyzeSeries({2000.0, 1000.0}, true);
    EXPECT_DOUBLE_EQ(history.cooling_rate, 1000.0);

    // Melting time between the samples bracketing the liquidus
    history = analyzeSeries({1000.0, 2000.0, 1000.0}, false, true);
    EXPECT_NEAR(history.melting_time, 0.7, 1.0e-12);
    EXPECT_NEAR(history.solidification_time, 1.7, 1.0e-12);
    history = analyzeSeries({1000.0, 2000.0, 1000.0}, false, false);
    EXPECT_DOUBLE_EQ(history.melting_time, 1.0);

    // Missing samples are skipped
    history = analyzeSeries({no_sample, 300.0, no_sample, 2000.0, no_sample, 1000.0});
    EXPECT_EQ(history.status, Solidified);
    EXPECT_DOUBLE_EQ(history.melting_time, 3.0);
    EXPECT_NEAR(history.solidification_time, 4.4, 1.0e-12);
    EXPECT_DOUBLE_EQ(history.cooling_rate, -500.0);

    // Never reaches the liquidus
    history = analyzeSeries({300.0, 1600.0, 1200.0});
    EXPECT_EQ(history.status, NotMelted);
    EXPECT_EQ(history.num_melt_events, 0);
    EXPECT_TRUE(std::isnan(history.melting_time));
    EXPECT_TRUE(std::isnan(history.solidification_time));
    EXPECT_TRUE(std::isnan(history.cooling_rate));

    // Melts but does not return to the solidus
    history = analyzeSeries({300.0, 2000.0, 1500.0});
    EXPECT_EQ(history.status, IncompleteSolidification);
    EXPECT_EQ(history.num_melt_events, 1);
    EXPECT_TRUE(std::isnan(history.melting_time));
    EXPECT_TRUE(std::isnan(history.solidification_time));
    EXPECT_TRUE(std::isnan(history.cooling_rate));

    // No samples at all
    history = analyzeSeries({no_sample, no_sample});
    EXPECT_EQ(history.status, NoData);
    EXPECT_TRUE(std::isnan(history.melting_time));
}

// Melting time <= solidification time <= final sample time for any solidified point
void testPointHistoryOrdering() {

    std::vector<std::vector<double>> all_series = {{1800.0, 1250.0},
                                                   {1000.0, 1750.0, 1400.0, 1310.0, 1290.0},
                                                   {1700.0, 1300.0},
                                                   {1200.0, 1900.0, 1350.0, 1720.0, 1500.0, 1299.0, 1800.0, 100.0}};
    for (auto &temperatures : all_series) {
        PointHistory history = analyzeSeries(temperatures);
        ASSERT_EQ(history.status, Solidified);
        EXPECT_LE(history.melting_time, history.solidification_time);
        EXPECT_LE(history.solidification_time, static_cast<double>(temperatures.size() - 1));
        EXPECT_LT(history.cooling_rate, 0.0);
    }
}

//---------------------------------------------------------------------------//
// thermal_history_tests
//---------------------------------------------------------------------------//
void testThermalHistory() {

    using memory_space = TEST_MEMSPACE;
    using view_type_double_2d = Kokkos::View<double **, memory_space>;
    using view_type_double = Kokkos::View<double *, memory_space>;
    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);

    double no_sample = std::numeric_limits<double>::quiet_NaN();
    int num_points = 5;
    int num_steps = 5;
    double temperatures[5][5] = {{1000.0, 1700.0, 2000.0, 1300.0, 900.0},
                                 {300.0, 2000.0, 1500.0, 1900.0, 1000.0},
                                 {300.0, 1600.0, 1200.0, 1000.0, 900.0},
                                 {300.0, 2000.0, 1500.0, 1400.0, 1350.0},
                                 {no_sample, no_sample, no_sample, no_sample, no_sample}};
    view_type_double_2d series(Kokkos::ViewAllocateWithoutInitializing("series"), num_points, num_steps);
    view_type_double times(Kokkos::ViewAllocateWithoutInitializing("times"), num_steps);
    auto series_host = Kokkos::create_mirror_view(series);
    auto times_host = Kokkos::create_mirror_view(times);
    for (int step = 0; step < num_steps; step++) {
        times_host(step) = 0.001 * step;
        for (int point = 0; point < num_points; point++)
            series_host(point, step) = temperatures[point][step];
    }
    Kokkos::deep_copy(series, series_host);
    Kokkos::deep_copy(times, times_host);

    MaterialInputs m_inputs;
    m_inputs.liquidus_temperature = 1700.0;
    m_inputs.solidus_temperature = 1300.0;
    ThermalHistoryInputs inputs;
    ThermalHistory<memory_space> thermal_history(num_points, m_inputs, inputs);
    thermal_history.analyze(series, times, num_steps);

    auto status_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), thermal_history.status);
    auto melting_time_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), thermal_history.melting_time);
    auto solidification_time_host =
        Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), thermal_history.solidification_time);
    auto cooling_rate_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), thermal_history.cooling_rate);
    EXPECT_EQ(status_host(0), Solidified);
    EXPECT_EQ(status_host(1), Solidified);
    EXPECT_EQ(status_host(2), NotMelted);
    EXPECT_EQ(status_host(3), IncompleteSolidification);
    EXPECT_EQ(status_host(4), NoData);
    EXPECT_DOUBLE_EQ(melting_time_host(0), 0.001);
    EXPECT_DOUBLE_EQ(solidification_time_host(0), 0.003);
    EXPECT_NEAR(cooling_rate_host(0), -700000.0, 1.0e-6);
    EXPECT_DOUBLE_EQ(melting_time_host(1), 0.003);
    EXPECT_NEAR(cooling_rate_host(1), -900000.0, 1.0e-6);
    for (int point = 2; point < num_points; point++) {
        EXPECT_TRUE(std::isnan(melting_time_host(point)));
        EXPECT_TRUE(std::isnan(solidification_time_host(point)));
        EXPECT_TRUE(std::isnan(cooling_rate_host(point)));
    }

    HistorySummary summary = thermal_history.summarize(id);
    EXPECT_EQ(summary.num_points, num_points);
    EXPECT_EQ(summary.solidified, 2);
    EXPECT_EQ(summary.remelted, 1);
    EXPECT_EQ(summary.not_melted, 1);
    EXPECT_EQ(summary.incomplete_solidification, 1);
    EXPECT_EQ(summary.no_data, 1);
    EXPECT_EQ(summary.masked, 0);
    EXPECT_NEAR(summary.min_cooling_rate, -900000.0, 1.0e-6);
    EXPECT_NEAR(summary.max_cooling_rate, -700000.0, 1.0e-6);
    EXPECT_NEAR(summary.mean_cooling_rate, -800000.0, 1.0e-6);
    EXPECT_NEAR(summary.median_cooling_rate, -800000.0, 1.0e-6);
    EXPECT_DOUBLE_EQ(summary.min_melting_time, 0.001);
    EXPECT_DOUBLE_EQ(summary.max_melting_time, 0.003);
    EXPECT_DOUBLE_EQ(summary.min_solidification_time, 0.003);
    EXPECT_NEAR(summary.max_solidification_time, 0.003 + 0.001 * 600.0 / 900.0, 1.0e-12);

    // Points with a mask value that is missing, or not above the threshold, are excluded
    view_type_double mask(Kokkos::ViewAllocateWithoutInitializing("mask"), num_points);
    auto mask_host = Kokkos::create_mirror_view(mask);
    double mask_values[5] = {1.0, 0.2, 1.0, no_sample, 0.5};
    for (int point = 0; point < num_points; point++)
        mask_host(point) = mask_values[point];
    Kokkos::deep_copy(mask, mask_host);
    thermal_history.applyMask(mask, 0.5);
    EXPECT_EQ(thermal_history.countStatus(Solidified), 1);
    EXPECT_EQ(thermal_history.countStatus(NotMelted), 1);
    EXPECT_EQ(thermal_history.countStatus(Masked), 3);
    Kokkos::deep_copy(status_host, thermal_history.status);
    Kokkos::deep_copy(melting_time_host, thermal_history.melting_time);
    EXPECT_EQ(status_host(1), Masked);
    EXPECT_TRUE(std::isnan(melting_time_host(1)));
    summary = thermal_history.summarize(id);
    EXPECT_EQ(summary.solidified, 1);
    EXPECT_EQ(summary.remelted, 0);
    EXPECT_NEAR(summary.mean_cooling_rate, -700000.0, 1.0e-6);
    EXPECT_NEAR(summary.median_cooling_rate, -700000.0, 1.0e-6);
    EXPECT_DOUBLE_EQ(summary.min_melting_time, 0.001);
    EXPECT_DOUBLE_EQ(summary.max_melting_time, 0.001);
    EXPECT_DOUBLE_EQ(summary.max_solidification_time, 0.003);

    // Liquidus must not be below the solidus
    m_inputs.liquidus_temperature = 1200.0;
    EXPECT_THROW(ThermalHistory<memory_space> thermal_history_invalid(num_points, m_inputs, inputs), InputError);
}

//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, point_history_tests) {
    testPointHistory();
    testPointHistoryOrdering();
}
TEST(TEST_CATEGORY, thermal_history_tests) { testThermalHistory(); }
} // end namespace Test
