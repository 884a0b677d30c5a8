// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_RESAMPLE_HPP
#define THERMALHISTORY_RESAMPLE_HPP

#include "THerrors.hpp"
#include "THgrid.hpp"
#include "THinputdata.hpp"
#include "THparsefiles.hpp"
#include "THsnapshots.hpp"

#include <Kokkos_Core.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

// Uniform grid of buckets covering the source points of one snapshot. The points in bucket b are
// bucket_points(bucket_start(b)) through bucket_points(bucket_start(b + 1) - 1), in increasing point order
template <typename MemorySpace>
struct SourceBuckets {

    using memory_space = MemorySpace;
    using view_type_int = Kokkos::View<int *, memory_space>;
    using view_type_int_host = typename view_type_int::host_mirror_type;
    using view_type_double_2d_source = Kokkos::View<double **, Kokkos::LayoutRight, memory_space>;

    int num_source_points;
    double bucket_size;
    Kokkos::Array<double, 3> low_corner;
    Kokkos::Array<int, 3> num_buckets;
    view_type_int bucket_start, bucket_points;
    // Source point coordinates and field values
    view_type_double_2d_source points, fields;

    // The bucket size starts at the search radius, and is doubled until there are no more than
    // max_buckets_per_point buckets per source point
    SourceBuckets(const Snapshot &snapshot, const double search_radius, const int max_buckets_per_point = 8)
        : num_source_points(snapshot.num_points)
        , bucket_size(search_radius) {

        std::array<double, 6> bounds = snapshot.getBounds();
        if (num_source_points == 0)
            bounds = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
        long max_num_buckets = std::max(static_cast<long>(max_buckets_per_point) * num_source_points, 1L);
        long total_buckets;
        do {
            total_buckets = 1;
            for (int a = 0; a < 3; a++) {
                low_corner[a] = bounds[2 * a];
                long num_buckets_a =
                    static_cast<long>(std::floor((bounds[2 * a + 1] - bounds[2 * a]) / bucket_size)) + 1;
                num_buckets[a] = static_cast<int>(std::min(num_buckets_a, max_num_buckets));
                total_buckets *= num_buckets[a];
                total_buckets = std::min(total_buckets, max_num_buckets + 1);
            }
            if (total_buckets > max_num_buckets)
                bucket_size *= 2.0;
        } while (total_buckets > max_num_buckets);

        // Counting sort of the source points by bucket
        view_type_int_host bucket_start_host(Kokkos::ViewAllocateWithoutInitializing("bucket_start"),
                                             total_buckets + 1);
        view_type_int_host bucket_points_host(Kokkos::ViewAllocateWithoutInitializing("bucket_points"),
                                              num_source_points);
        view_type_int_host point_bucket(Kokkos::ViewAllocateWithoutInitializing("point_bucket"), num_source_points);
        Kokkos::deep_copy(bucket_start_host, 0);
        for (int p = 0; p < num_source_points; p++) {
            int bucket_ijk[3];
            for (int a = 0; a < 3; a++) {
                bucket_ijk[a] = static_cast<int>((snapshot.points(p, a) - low_corner[a]) / bucket_size);
                bucket_ijk[a] = std::min(std::max(bucket_ijk[a], 0), num_buckets[a] - 1);
            }
            point_bucket(p) = bucket_ijk[0] + num_buckets[0] * (bucket_ijk[1] + num_buckets[1] * bucket_ijk[2]);
            bucket_start_host(point_bucket(p) + 1)++;
        }
        for (long b = 0; b < total_buckets; b++)
            bucket_start_host(b + 1) += bucket_start_host(b);
        std::vector<int> next_position(bucket_start_host.data(), bucket_start_host.data() + total_buckets);
        for (int p = 0; p < num_source_points; p++) {
            bucket_points_host(next_position[point_bucket(p)]) = p;
            next_position[point_bucket(p)]++;
        }
        bucket_start = Kokkos::create_mirror_view_and_copy(memory_space(), bucket_start_host);
        bucket_points = Kokkos::create_mirror_view_and_copy(memory_space(), bucket_points_host);
        points = Kokkos::create_mirror_view_and_copy(memory_space(), snapshot.points);
        fields = Kokkos::create_mirror_view_and_copy(memory_space(), snapshot.fields);
    }
};

// Interpolates the fields of each snapshot onto the local grid points, and stores the temperature time series of each
// grid point
template <typename MemorySpace>
struct Resampler {

    using memory_space = MemorySpace;
    using view_type_int = Kokkos::View<int *, memory_space>;
    using view_type_double = Kokkos::View<double *, memory_space>;
    using view_type_double_2d = Kokkos::View<double **, memory_space>;
    using view_type_int_host = typename view_type_int::host_mirror_type;
    using view_type_double_host = typename view_type_double::host_mirror_type;
    using view_type_double_2d_host = typename view_type_double_2d::host_mirror_type;

    // Using the default exec space for this memory space.
    using execution_space = typename memory_space::execution_space;

    int num_points_local, num_snapshots;
    // Number of snapshots stored in the temperature series so far
    int num_steps_committed = 0;
    // Temperature first, followed by any other resampled fields
    std::vector<std::string> field_names;
    // Time of each stored snapshot
    view_type_double_host times;
    // Temperature of each local grid point (row) at each snapshot time (column). NaN where no source point was within
    // the search radius
    view_type_double_2d temperature_series;
    // Values of all fields at the most recent stored snapshot
    view_type_double_2d current_fields;
    // Values of all fields for the snapshot being resampled, copied to temperature_series/current_fields only once
    // the full snapshot is done
    view_type_double_2d resampled_fields;
    double search_radius;
    ResampleInputs _inputs;

    Resampler(const int id, const Grid &grid, const int num_snapshots_in, ResampleInputs inputs,
              SnapshotInputs s_inputs)
        : num_points_local(grid.num_points_local)
        , num_snapshots(num_snapshots_in)
        , times(view_type_double_host(Kokkos::ViewAllocateWithoutInitializing("times"), num_snapshots_in))
        , temperature_series(view_type_double_2d(Kokkos::ViewAllocateWithoutInitializing("temperature_series"),
                                                 grid.num_points_local, num_snapshots_in))
        , _inputs(inputs) {

        field_names.push_back(s_inputs.temperature_field);
        for (auto &name : s_inputs.field_names)
            addField(name);
        if (s_inputs.use_mask)
            addField(s_inputs.mask_field);
        int num_fields = field_names.size();
        current_fields = view_type_double_2d(Kokkos::ViewAllocateWithoutInitializing("current_fields"),
                                             num_points_local, num_fields);
        resampled_fields = view_type_double_2d(Kokkos::ViewAllocateWithoutInitializing("resampled_fields"),
                                               num_points_local, num_fields);
        Kokkos::deep_copy(temperature_series, std::numeric_limits<double>::quiet_NaN());
        Kokkos::deep_copy(current_fields, std::numeric_limits<double>::quiet_NaN());

        if (_inputs.search_radius_given)
            search_radius = _inputs.search_radius;
        else
            search_radius = grid.deltax;
        if (!(search_radius > 0.0))
            throw InputError("Resampler", "search radius must be positive, got " + std::to_string(search_radius));
        if (id == 0) {
            std::cout << "Resampling ";
            for (int n = 0; n < num_fields; n++)
                std::cout << "\"" << field_names[n] << "\" ";
            if (_inputs.interpolation == ResampleInputs::nearest)
                std::cout << "using the nearest source point";
            else
                std::cout << "using inverse distance weighting (power " << _inputs.inverse_distance_power << ")";
            std::cout << " within a search radius of " << search_radius << std::endl;
        }
    }

    void addField(const std::string name) {
        if (getFieldIndex(name) == -1)
            field_names.push_back(name);
    }

    int getFieldIndex(const std::string name) const {
        for (std::size_t n = 0; n < field_names.size(); n++) {
            if (field_names[n] == name)
                return static_cast<int>(n);
        }
        return -1;
    }

    // Subview of the current values of the named field
    auto getCurrentField(const std::string name) const {
        int field_index = getFieldIndex(name);
        if (field_index == -1)
            throw InputError("Resampler", "field \"" + name + "\" was not resampled");
        return Kokkos::subview(current_fields, Kokkos::ALL, field_index);
    }

    // Times of the stored snapshots, in the memory space of the temperature series
    view_type_double getTimes() const {
        view_type_double times_device(Kokkos::ViewAllocateWithoutInitializing("times_device"), num_steps_committed);
        auto times_host = Kokkos::create_mirror_view(times_device);
        for (int n = 0; n < num_steps_committed; n++)
            times_host(n) = times(n);
        Kokkos::deep_copy(times_device, times_host);
        return times_device;
    }

    // Interpolate the snapshot fields onto the local grid points and append the result to the stored series.
    // Snapshots must be given in increasing time order
    void resampleSnapshot(const Grid &grid, const Snapshot &snapshot) {

        if (num_steps_committed == num_snapshots)
            throw InputError("Resampler", "space was allocated for " + std::to_string(num_snapshots) +
                                              " snapshots, cannot add \"" + snapshot.filename + "\"");
        if ((num_steps_committed > 0) && !(snapshot.time > times(num_steps_committed - 1)))
            throw UnorderedSnapshots("snapshot \"" + snapshot.filename + "\" at time " +
                                     canonicalTimeString(snapshot.time) + " does not follow the previous time " +
                                     canonicalTimeString(times(num_steps_committed - 1)));

        // Column of each resampled field in the snapshot
        int num_fields = field_names.size();
        view_type_int_host field_columns_host(Kokkos::ViewAllocateWithoutInitializing("field_columns_host"),
                                              num_fields);
        for (int n = 0; n < num_fields; n++) {
            field_columns_host(n) = snapshot.getFieldIndex(field_names[n]);
            if (field_columns_host(n) == -1)
                throw InputError("Resampler", "field \"" + field_names[n] + "\" not found in snapshot \"" +
                                                  snapshot.filename + "\"");
        }
        view_type_int field_columns = Kokkos::create_mirror_view_and_copy(memory_space(), field_columns_host);

        SourceBuckets<memory_space> buckets(snapshot, search_radius);
        auto bucket_start = buckets.bucket_start;
        auto bucket_points = buckets.bucket_points;
        auto source_points = buckets.points;
        auto source_fields = buckets.fields;
        auto low_corner = buckets.low_corner;
        auto num_buckets = buckets.num_buckets;
        double bucket_size = buckets.bucket_size;

        auto resampled_fields_local = resampled_fields;
        int nx = grid.nx;
        int ny = grid.ny;
        int point_offset = grid.point_offset;
        Kokkos::Array<double, 3> grid_low_corner = {grid.x_min, grid.y_min, grid.z_min};
        double deltax = grid.deltax;
        double radius = search_radius;
        double radius_squared = search_radius * search_radius;
        bool nearest = (_inputs.interpolation == ResampleInputs::nearest);
        double half_power = 0.5 * _inputs.inverse_distance_power;
        double no_sample = std::numeric_limits<double>::quiet_NaN();

        Kokkos::parallel_for(
            "ResampleSnapshot", Kokkos::RangePolicy<execution_space>(0, num_points_local),
            KOKKOS_LAMBDA(const int point) {
                int index = point_offset + point;
                int coord_ijk[3] = {index % nx, (index / nx) % ny, index / (nx * ny)};
                double coords[3];
                // Range of buckets intersecting the search sphere
                int bucket_low[3], bucket_high[3];
                bool in_range = true;
                for (int a = 0; a < 3; a++) {
                    coords[a] = grid_low_corner[a] + coord_ijk[a] * deltax;
                    double low = Kokkos::floor((coords[a] - radius - low_corner[a]) / bucket_size);
                    double high = Kokkos::floor((coords[a] + radius - low_corner[a]) / bucket_size);
                    if ((high < 0.0) || (low > num_buckets[a] - 1))
                        in_range = false;
                    bucket_low[a] = (low < 0.0) ? 0 : static_cast<int>(low);
                    bucket_high[a] = (high > num_buckets[a] - 1) ? num_buckets[a] - 1 : static_cast<int>(high);
                }
                if (!in_range) {
                    for (int n = 0; n < num_fields; n++)
                        resampled_fields_local(point, n) = no_sample;
                    return;
                }

                // Nearest source point (lowest index on ties), or lowest index source point at distance 0
                int selected_point = -1;
                double selected_distance_squared = 0.0;
                double weight_sum = 0.0;
                if (!nearest) {
                    for (int n = 0; n < num_fields; n++)
                        resampled_fields_local(point, n) = 0.0;
                }
                for (int k = bucket_low[2]; k <= bucket_high[2]; k++) {
                    for (int j = bucket_low[1]; j <= bucket_high[1]; j++) {
                        for (int i = bucket_low[0]; i <= bucket_high[0]; i++) {
                            int bucket = i + num_buckets[0] * (j + num_buckets[1] * k);
                            for (int b = bucket_start(bucket); b < bucket_start(bucket + 1); b++) {
                                int source_point = bucket_points(b);
                                double distance_squared = 0.0;
                                for (int a = 0; a < 3; a++) {
                                    double d = source_points(source_point, a) - coords[a];
                                    distance_squared += d * d;
                                }
                                if (distance_squared > radius_squared)
                                    continue;
                                if (nearest) {
                                    if ((selected_point == -1) || (distance_squared < selected_distance_squared) ||
                                        ((distance_squared == selected_distance_squared) &&
                                         (source_point < selected_point))) {
                                        selected_point = source_point;
                                        selected_distance_squared = distance_squared;
                                    }
                                }
                                else if (distance_squared == 0.0) {
                                    if ((selected_point == -1) || (source_point < selected_point))
                                        selected_point = source_point;
                                }
                                else {
                                    double weight = Kokkos::pow(distance_squared, -half_power);
                                    weight_sum += weight;
                                    for (int n = 0; n < num_fields; n++)
                                        resampled_fields_local(point, n) +=
                                            weight * source_fields(source_point, field_columns(n));
                                }
                            }
                        }
                    }
                }
                for (int n = 0; n < num_fields; n++) {
                    if (selected_point != -1)
                        resampled_fields_local(point, n) = source_fields(selected_point, field_columns(n));
                    else if (weight_sum > 0.0)
                        resampled_fields_local(point, n) /= weight_sum;
                    else
                        resampled_fields_local(point, n) = no_sample;
                }
            });

        // Store the resampled values of this snapshot
        auto temperature_series_local = temperature_series;
        auto current_fields_local = current_fields;
        int step = num_steps_committed;
        Kokkos::parallel_for(
            "StoreSnapshot", Kokkos::RangePolicy<execution_space>(0, num_points_local),
            KOKKOS_LAMBDA(const int point) {
                temperature_series_local(point, step) = resampled_fields_local(point, 0);
                for (int n = 0; n < num_fields; n++)
                    current_fields_local(point, n) = resampled_fields_local(point, n);
            });
        Kokkos::fence();
        times(step) = snapshot.time;
        num_steps_committed++;
    }
};

#endif
