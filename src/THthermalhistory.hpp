// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_THERMALHISTORY_HPP
#define THERMALHISTORY_THERMALHISTORY_HPP

#include "THerrors.hpp"
#include "THinputdata.hpp"
#include "THtypes.hpp"

#include "mpi.h"

#include <Kokkos_Core.hpp>

#include <algorithm>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

// Melting time, solidification time, and cooling rate derived from the temperature series of one grid point
struct PointHistory {
    double melting_time;
    double solidification_time;
    double cooling_rate;
    int status;
    int num_melt_events;
};

// Analyze the temperature series of a grid point (row "point" of series, num_steps valid columns). Samples that are
// NaN are skipped. The point melts at each sample that reaches the liquidus when the previous sample was below it (or
// when it is the first sample); only the final melt event is kept. It solidifies at the first following sample at or
// below the solidus, with the solidification time interpolated between that sample and the one before it
template <typename SeriesViewType, typename TimesViewType>
KOKKOS_INLINE_FUNCTION PointHistory analyzePointHistory(const SeriesViewType &series, const TimesViewType &times,
                                                        const int point, const int num_steps, const double liquidus,
                                                        const double solidus, const bool cooling_rate_magnitude,
                                                        const bool interpolate_melting_time, const double unset_value) {

    PointHistory history;
    history.melting_time = unset_value;
    history.solidification_time = unset_value;
    history.cooling_rate = unset_value;
    history.num_melt_events = 0;

    // Final melt event: the sample at/above the liquidus and the valid sample before it
    int melt_step = -1, before_melt_step = -1;
    int previous_step = -1;
    for (int step = 0; step < num_steps; step++) {
        double temperature = series(point, step);
        if (Kokkos::isnan(temperature))
            continue;
        if ((temperature >= liquidus) && ((previous_step == -1) || (series(point, previous_step) < liquidus))) {
            melt_step = step;
            before_melt_step = previous_step;
            history.num_melt_events++;
        }
        previous_step = step;
    }
    if (previous_step == -1) {
        history.status = NoData;
        return history;
    }
    if (melt_step == -1) {
        history.status = NotMelted;
        return history;
    }

    // First sample at/below the solidus after the final melt
    int solidification_step = -1;
    previous_step = melt_step;
    for (int step = melt_step + 1; step < num_steps; step++) {
        double temperature = series(point, step);
        if (Kokkos::isnan(temperature))
            continue;
        if (temperature <= solidus) {
            solidification_step = step;
            break;
        }
        previous_step = step;
    }
    if (solidification_step == -1) {
        history.status = IncompleteSolidification;
        return history;
    }

    double temperature_1 = series(point, previous_step);
    double temperature_2 = series(point, solidification_step);
    double time_1 = times(previous_step);
    double time_2 = times(solidification_step);
    double fraction = 1.0;
    if (temperature_1 > temperature_2)
        fraction = (temperature_1 - solidus) / (temperature_1 - temperature_2);
    fraction = Kokkos::fmin(Kokkos::fmax(fraction, 0.0), 1.0);
    history.solidification_time = time_2 - (1.0 - fraction) * (time_2 - time_1);
    history.cooling_rate = (temperature_2 - temperature_1) / (time_2 - time_1);
    if (cooling_rate_magnitude)
        history.cooling_rate = Kokkos::fabs(history.cooling_rate);

    history.melting_time = times(melt_step);
    if (interpolate_melting_time && (before_melt_step != -1)) {
        double temperature_before = series(point, before_melt_step);
        double temperature_melt = series(point, melt_step);
        double time_before = times(before_melt_step);
        double melt_fraction = (liquidus - temperature_before) / (temperature_melt - temperature_before);
        history.melting_time = time_before + melt_fraction * (history.melting_time - time_before);
    }
    history.status = Solidified;
    return history;
}

// Melting time, solidification time, and cooling rate of each local grid point
template <typename MemorySpace>
struct ThermalHistory {

    using memory_space = MemorySpace;
    using view_type_short = Kokkos::View<short *, memory_space>;
    using view_type_int = Kokkos::View<int *, memory_space>;
    using view_type_double = Kokkos::View<double *, memory_space>;
    using view_type_short_host = typename view_type_short::host_mirror_type;
    using view_type_double_host = typename view_type_double::host_mirror_type;

    // Using the default exec space for this memory space.
    using execution_space = typename memory_space::execution_space;

    int num_points_local;
    // NaN unless status is Solidified
    view_type_double melting_time, solidification_time, cooling_rate;
    // PointStatus of each grid point
    view_type_short status;
    // Number of times each grid point crossed the liquidus
    view_type_int num_melt_events;
    MaterialInputs _m_inputs;
    ThermalHistoryInputs _inputs;

    ThermalHistory(const int num_points_local_in, MaterialInputs m_inputs, ThermalHistoryInputs inputs)
        : num_points_local(num_points_local_in)
        , melting_time(view_type_double(Kokkos::ViewAllocateWithoutInitializing("melting_time"), num_points_local_in))
        , solidification_time(
              view_type_double(Kokkos::ViewAllocateWithoutInitializing("solidification_time"), num_points_local_in))
        , cooling_rate(view_type_double(Kokkos::ViewAllocateWithoutInitializing("cooling_rate"), num_points_local_in))
        , status(view_type_short("status", num_points_local_in))
        , num_melt_events(view_type_int("num_melt_events", num_points_local_in))
        , _m_inputs(m_inputs)
        , _inputs(inputs) {

        if (_m_inputs.liquidus_temperature < _m_inputs.solidus_temperature)
            throw InputError("ThermalHistoryAnalyzer", "liquidus temperature " +
                                                           std::to_string(_m_inputs.liquidus_temperature) +
                                                           " is below the solidus temperature " +
                                                           std::to_string(_m_inputs.solidus_temperature));
        double unset_value = std::numeric_limits<double>::quiet_NaN();
        Kokkos::deep_copy(melting_time, unset_value);
        Kokkos::deep_copy(solidification_time, unset_value);
        Kokkos::deep_copy(cooling_rate, unset_value);
    }

    // Analyze the first num_steps columns of the temperature series, sampled at the given times
    template <typename SeriesViewType, typename TimesViewType>
    void analyze(const SeriesViewType &series, const TimesViewType &times, const int num_steps) {

        auto melting_time_local = melting_time;
        auto solidification_time_local = solidification_time;
        auto cooling_rate_local = cooling_rate;
        auto status_local = status;
        auto num_melt_events_local = num_melt_events;
        double liquidus = _m_inputs.liquidus_temperature;
        double solidus = _m_inputs.solidus_temperature;
        bool cooling_rate_magnitude = _inputs.cooling_rate_magnitude;
        bool interpolate_melting_time = _inputs.interpolate_melting_time;
        double unset_value = std::numeric_limits<double>::quiet_NaN();

        Kokkos::parallel_for(
            "AnalyzeThermalHistory", Kokkos::RangePolicy<execution_space>(0, num_points_local),
            KOKKOS_LAMBDA(const int point) {
                PointHistory history =
                    analyzePointHistory(series, times, point, num_steps, liquidus, solidus, cooling_rate_magnitude,
                                        interpolate_melting_time, unset_value);
                melting_time_local(point) = history.melting_time;
                solidification_time_local(point) = history.solidification_time;
                cooling_rate_local(point) = history.cooling_rate;
                status_local(point) = static_cast<short>(history.status);
                num_melt_events_local(point) = history.num_melt_events;
            });
        Kokkos::fence();
    }

    // Exclude grid points where the mask value is missing or not above the threshold
    template <typename MaskViewType>
    void applyMask(const MaskViewType &mask, const double threshold) {

        auto melting_time_local = melting_time;
        auto solidification_time_local = solidification_time;
        auto cooling_rate_local = cooling_rate;
        auto status_local = status;
        double unset_value = std::numeric_limits<double>::quiet_NaN();

        Kokkos::parallel_for(
            "ApplyMask", Kokkos::RangePolicy<execution_space>(0, num_points_local), KOKKOS_LAMBDA(const int point) {
                if (!(mask(point) > threshold)) {
                    melting_time_local(point) = unset_value;
                    solidification_time_local(point) = unset_value;
                    cooling_rate_local(point) = unset_value;
                    status_local(point) = Masked;
                }
            });
        Kokkos::fence();
    }

    // Number of local grid points with the given status
    long countStatus(const int point_status) const {
        auto status_local = status;
        long count = 0;
        Kokkos::parallel_reduce(
            "CountStatus", Kokkos::RangePolicy<execution_space>(0, num_points_local),
            KOKKOS_LAMBDA(const int point, long &local_count) {
                if (status_local(point) == point_status)
                    local_count++;
            },
            count);
        return count;
    }

    // Smallest and largest values of a per-point view among solidified points, across all ranks
    void findSolidifiedRange(const view_type_double &values, double &global_min, double &global_max) const {

        auto status_local = status;
        double local_min = std::numeric_limits<double>::max();
        double local_max = std::numeric_limits<double>::lowest();
        Kokkos::parallel_reduce(
            "SolidifiedMin", Kokkos::RangePolicy<execution_space>(0, num_points_local),
            KOKKOS_LAMBDA(const int point, double &update_min) {
                if ((status_local(point) == Solidified) && (values(point) < update_min))
                    update_min = values(point);
            },
            Kokkos::Min<double>(local_min));
        Kokkos::parallel_reduce(
            "SolidifiedMax", Kokkos::RangePolicy<execution_space>(0, num_points_local),
            KOKKOS_LAMBDA(const int point, double &update_max) {
                if ((status_local(point) == Solidified) && (values(point) > update_max))
                    update_max = values(point);
            },
            Kokkos::Max<double>(local_max));
        MPI_Allreduce(&local_min, &global_min, 1, MPI_DOUBLE, MPI_MIN, MPI_COMM_WORLD);
        MPI_Allreduce(&local_max, &global_max, 1, MPI_DOUBLE, MPI_MAX, MPI_COMM_WORLD);
    }

    // Median cooling rate of the solidified points on all ranks: the rates are gathered and sorted on rank 0, and the
    // result is broadcast. For an even number of points, the mean of the two middle values
    double findMedianCoolingRate(const int id, const long num_solidified) const {

        int np;
        MPI_Comm_size(MPI_COMM_WORLD, &np);
        auto status_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), status);
        auto cooling_rate_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), cooling_rate);
        std::vector<double> local_rates;
        for (int point = 0; point < num_points_local; point++) {
            if (status_host(point) == Solidified)
                local_rates.push_back(cooling_rate_host(point));
        }

        int send_size = static_cast<int>(local_rates.size());
        std::vector<int> recv_sizes(np, 0), recv_offsets(np, 0);
        MPI_Gather(&send_size, 1, MPI_INT, recv_sizes.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);
        for (int rank = 1; rank < np; rank++)
            recv_offsets[rank] = recv_offsets[rank - 1] + recv_sizes[rank - 1];
        std::vector<double> rates((id == 0) ? num_solidified : 0);
        MPI_Gatherv(local_rates.data(), send_size, MPI_DOUBLE, rates.data(), recv_sizes.data(), recv_offsets.data(),
                    MPI_DOUBLE, 0, MPI_COMM_WORLD);

        double median = 0.0;
        if ((id == 0) && (num_solidified > 0)) {
            std::sort(rates.begin(), rates.end());
            long middle = num_solidified / 2;
            if (num_solidified % 2 == 0)
                median = 0.5 * (rates[middle - 1] + rates[middle]);
            else
                median = rates[middle];
        }
        MPI_Bcast(&median, 1, MPI_DOUBLE, 0, MPI_COMM_WORLD);
        return median;
    }

    // Point counts and cooling rate statistics across all ranks, printed on rank 0
    HistorySummary summarize(const int id) const {

        auto status_local = status;
        auto cooling_rate_local = cooling_rate;
        auto num_melt_events_local = num_melt_events;

        long local_counts[7];
        local_counts[0] = num_points_local;
        local_counts[1] = countStatus(NoData);
        local_counts[2] = countStatus(NotMelted);
        local_counts[3] = countStatus(IncompleteSolidification);
        local_counts[4] = countStatus(Solidified);
        local_counts[5] = countStatus(Masked);
        long remelted = 0;
        Kokkos::parallel_reduce(
            "CountRemelted", Kokkos::RangePolicy<execution_space>(0, num_points_local),
            KOKKOS_LAMBDA(const int point, long &local_count) {
                if ((status_local(point) == Solidified) && (num_melt_events_local(point) > 1))
                    local_count++;
            },
            remelted);
        local_counts[6] = remelted;

        double min_cooling_rate = std::numeric_limits<double>::max();
        double max_cooling_rate = std::numeric_limits<double>::lowest();
        double sum_cooling_rate = 0.0;
        Kokkos::parallel_reduce(
            "MinCoolingRate", Kokkos::RangePolicy<execution_space>(0, num_points_local),
            KOKKOS_LAMBDA(const int point, double &local_min) {
                if ((status_local(point) == Solidified) && (cooling_rate_local(point) < local_min))
                    local_min = cooling_rate_local(point);
            },
            Kokkos::Min<double>(min_cooling_rate));
        Kokkos::parallel_reduce(
            "MaxCoolingRate", Kokkos::RangePolicy<execution_space>(0, num_points_local),
            KOKKOS_LAMBDA(const int point, double &local_max) {
                if ((status_local(point) == Solidified) && (cooling_rate_local(point) > local_max))
                    local_max = cooling_rate_local(point);
            },
            Kokkos::Max<double>(max_cooling_rate));
        Kokkos::parallel_reduce(
            "SumCoolingRate", Kokkos::RangePolicy<execution_space>(0, num_points_local),
            KOKKOS_LAMBDA(const int point, double &local_sum) {
                if (status_local(point) == Solidified)
                    local_sum += cooling_rate_local(point);
            },
            sum_cooling_rate);

        long global_counts[7];
        MPI_Allreduce(local_counts, global_counts, 7, MPI_LONG, MPI_SUM, MPI_COMM_WORLD);
        HistorySummary summary;
        summary.num_points = global_counts[0];
        summary.no_data = global_counts[1];
        summary.not_melted = global_counts[2];
        summary.incomplete_solidification = global_counts[3];
        summary.solidified = global_counts[4];
        summary.masked = global_counts[5];
        summary.remelted = global_counts[6];
        double global_sum_cooling_rate;
        MPI_Allreduce(&min_cooling_rate, &summary.min_cooling_rate, 1, MPI_DOUBLE, MPI_MIN, MPI_COMM_WORLD);
        MPI_Allreduce(&max_cooling_rate, &summary.max_cooling_rate, 1, MPI_DOUBLE, MPI_MAX, MPI_COMM_WORLD);
        MPI_Allreduce(&sum_cooling_rate, &global_sum_cooling_rate, 1, MPI_DOUBLE, MPI_SUM, MPI_COMM_WORLD);
        findSolidifiedRange(melting_time, summary.min_melting_time, summary.max_melting_time);
        findSolidifiedRange(solidification_time, summary.min_solidification_time, summary.max_solidification_time);
        summary.median_cooling_rate = findMedianCoolingRate(id, summary.solidified);
        if (summary.solidified > 0)
            summary.mean_cooling_rate = global_sum_cooling_rate / summary.solidified;
        else {
            summary.min_cooling_rate = 0.0;
            summary.max_cooling_rate = 0.0;
            summary.min_melting_time = 0.0;
            summary.max_melting_time = 0.0;
            summary.min_solidification_time = 0.0;
            summary.max_solidification_time = 0.0;
        }

        if (id == 0) {
            std::cout << "Thermal history summary:" << std::endl;
            std::cout << "   Grid points analyzed: " << summary.num_points << std::endl;
            std::cout << "   Melted and solidified: " << summary.solidified << " (" << summary.remelted
                      << " melted more than once)" << std::endl;
            std::cout << "   Never reached the liquidus: " << summary.not_melted << std::endl;
            std::cout << "   Did not return to the solidus after melting: " << summary.incomplete_solidification
                      << std::endl;
            std::cout << "   No source data within the search radius: " << summary.no_data << std::endl;
            std::cout << "   Excluded by mask: " << summary.masked << std::endl;
            if (summary.solidified > 0) {
                std::cout << "   Cooling rate min/max/mean/median: " << summary.min_cooling_rate << " / "
                          << summary.max_cooling_rate << " / " << summary.mean_cooling_rate << " / "
                          << summary.median_cooling_rate << " K/s" << std::endl;
                std::cout << "   Melting time range: " << summary.min_melting_time << " to "
                          << summary.max_melting_time << std::endl;
                std::cout << "   Solidification time range: " << summary.min_solidification_time << " to "
                          << summary.max_solidification_time << std::endl;
            }
        }
        return summary;
    }
};

#endif
