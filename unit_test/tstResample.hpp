// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "THgrid.hpp"
#include "THresample.hpp"
#include "THsnapshots.hpp"

#include <gtest/gtest.h>

#include "mpi.h"

#include <cmath>
#include <random>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Grid of nx by ny by nz points with spacing deltax starting at the origin, all owned by this rank
Grid makeTestGrid(const int nx, const int ny, const int nz, const double deltax) {
    Grid grid;
    grid.nx = nx;
    grid.ny = ny;
    grid.nz = nz;
    grid.domain_size = nx * ny * nz;
    grid.deltax = deltax;
    grid.x_max = (nx - 1) * deltax;
    grid.y_max = (ny - 1) * deltax;
    grid.z_max = (nz - 1) * deltax;
    grid.num_points_local = grid.domain_size;
    grid.point_offset = 0;
    return grid;
}

// Source points along the X axis: x = 0 (T = 100), two points at x = 2 (T = 300 and T = 999), and x = 3.5 (T = 500)
Snapshot makeLineSnapshot(const double time) {
    Snapshot snapshot("line_snapshot", time, 4, {"alpha.metal", "T"});
    double x[4] = {0.0, 2.0, 2.0, 3.5};
    double temperature[4] = {100.0, 300.0, 999.0, 500.0};
    for (int p = 0; p < 4; p++) {
        snapshot.points(p, 0) = x[p];
        snapshot.points(p, 1) = 0.0;
        snapshot.points(p, 2) = 0.0;
        snapshot.fields(p, 0) = 1.0 - 0.1 * p;
        snapshot.fields(p, 1) = temperature[p];
    }
    return snapshot;
}

SnapshotInputs makeSnapshotInputs() {
    SnapshotInputs inputs;
    inputs.temperature_field = "T";
    inputs.field_names = {"alpha.metal", "T"};
    return inputs;
}

//---------------------------------------------------------------------------//
// resample_tests
//---------------------------------------------------------------------------//
void testResampleNearest() {

    using memory_space = TEST_MEMSPACE;
    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);

    // Grid points at x = 0 through 6
    Grid grid = makeTestGrid(7, 1, 1, 1.0);
    ResampleInputs inputs;
    Resampler<memory_space> resampler(id, grid, 2, inputs, makeSnapshotInputs());
    // Temperature first, no duplicate fields
    ASSERT_EQ(resampler.field_names.size(), 2);
    EXPECT_EQ(resampler.field_names[0], "T");
    EXPECT_EQ(resampler.field_names[1], "alpha.metal");
    // Search radius defaults to the cell size
    EXPECT_DOUBLE_EQ(resampler.search_radius, 1.0);

    resampler.resampleSnapshot(grid, makeLineSnapshot(0.5));
    EXPECT_EQ(resampler.num_steps_committed, 1);
    auto temperature_series_host =
        Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), resampler.temperature_series);
    // Coincident source point
    EXPECT_DOUBLE_EQ(temperature_series_host(0, 0), 100.0);
    // Equidistant from points 0 and 1: lowest index
    EXPECT_DOUBLE_EQ(temperature_series_host(1, 0), 100.0);
    // Two coincident source points: lowest index
    EXPECT_DOUBLE_EQ(temperature_series_host(2, 0), 300.0);
    EXPECT_DOUBLE_EQ(temperature_series_host(3, 0), 500.0);
    EXPECT_DOUBLE_EQ(temperature_series_host(4, 0), 500.0);
    // No source point within the search radius
    EXPECT_TRUE(std::isnan(temperature_series_host(5, 0)));
    EXPECT_TRUE(std::isnan(temperature_series_host(6, 0)));
    // Second snapshot not resampled yet
    EXPECT_TRUE(std::isnan(temperature_series_host(0, 1)));

    // Other fields use the same source point
    auto alpha_host =
        Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), resampler.getCurrentField("alpha.metal"));
    EXPECT_DOUBLE_EQ(alpha_host(0), 1.0);
    EXPECT_DOUBLE_EQ(alpha_host(2), 0.9);
    EXPECT_DOUBLE_EQ(alpha_host(4), 0.7);
    EXPECT_TRUE(std::isnan(alpha_host(6)));
    EXPECT_THROW(resampler.getCurrentField("p"), InputError);
}

void testResampleInverseDistance() {

    using memory_space = TEST_MEMSPACE;
    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);

    Grid grid = makeTestGrid(7, 1, 1, 1.0);
    ResampleInputs inputs;
    inputs.interpolation = ResampleInputs::inverse_distance;
    inputs.inverse_distance_power = 2.0;
    Resampler<memory_space> resampler(id, grid, 2, inputs, makeSnapshotInputs());
    resampler.resampleSnapshot(grid, makeLineSnapshot(0.5));
    auto temperature_series_host =
        Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), resampler.temperature_series);
    // Coincident source points give their exact value
    EXPECT_DOUBLE_EQ(temperature_series_host(0, 0), 100.0);
    EXPECT_DOUBLE_EQ(temperature_series_host(2, 0), 300.0);
    // x = 1: three points at distance 1
    EXPECT_NEAR(temperature_series_host(1, 0), (100.0 + 300.0 + 999.0) / 3.0, 1.0e-10);
    // x = 3: two points at distance 1 (weight 1), one at distance 0.5 (weight 4)
    EXPECT_NEAR(temperature_series_host(3, 0), (300.0 + 999.0 + 4.0 * 500.0) / 6.0, 1.0e-10);
    // Single point in range
    EXPECT_NEAR(temperature_series_host(4, 0), 500.0, 1.0e-10);
    EXPECT_TRUE(std::isnan(temperature_series_host(5, 0)));

    // Values between source values with a larger search radius
    inputs.search_radius_given = true;
    inputs.search_radius = 10.0;
    Resampler<memory_space> resampler_wide(id, grid, 1, inputs, makeSnapshotInputs());
    resampler_wide.resampleSnapshot(grid, makeLineSnapshot(0.5));
    auto wide_series_host =
        Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), resampler_wide.temperature_series);
    for (int point = 0; point < grid.num_points_local; point++) {
        EXPECT_GE(wide_series_host(point, 0), 100.0);
        EXPECT_LE(wide_series_host(point, 0), 999.0);
    }

    // Search radius must be positive
    inputs.search_radius = 0.0;
    EXPECT_THROW(Resampler<memory_space> resampler_invalid(id, grid, 1, inputs, makeSnapshotInputs()), InputError);
}

// Bucketed search gives the same nearest source point as checking all source points
void testResampleMatchesAllPoints() {

    using memory_space = TEST_MEMSPACE;
    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);

    Grid grid = makeTestGrid(6, 5, 4, 0.8);
    int num_source_points = 300;
    Snapshot snapshot("random_snapshot", 1.0, num_source_points, {"T"});
    std::mt19937_64 generator(2024);
    std::uniform_real_distribution<double> distribution(-0.5, 4.5);
    for (int p = 0; p < num_source_points; p++) {
        for (int a = 0; a < 3; a++)
            snapshot.points(p, a) = distribution(generator);
        snapshot.fields(p, 0) = static_cast<double>(p);
    }
    ResampleInputs inputs;
    inputs.search_radius_given = true;
    inputs.search_radius = 0.9;
    SnapshotInputs s_inputs;
    Resampler<memory_space> resampler(id, grid, 1, inputs, s_inputs);
    resampler.resampleSnapshot(grid, snapshot);
    auto temperature_series_host =
        Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), resampler.temperature_series);

    double radius_squared = inputs.search_radius * inputs.search_radius;
    for (int point = 0; point < grid.num_points_local; point++) {
        int coord_ijk[3] = {grid.getCoordX(point), grid.getCoordY(point), grid.getCoordZ(point)};
        int expected_point = -1;
        double expected_distance_squared = 0.0;
        for (int p = 0; p < num_source_points; p++) {
            double distance_squared = 0.0;
            for (int a = 0; a < 3; a++) {
                double d = snapshot.points(p, a) - coord_ijk[a] * grid.deltax;
                distance_squared += d * d;
            }
            if ((distance_squared <= radius_squared) &&
                ((expected_point == -1) || (distance_squared < expected_distance_squared))) {
                expected_point = p;
                expected_distance_squared = distance_squared;
            }
        }
        if (expected_point == -1)
            EXPECT_TRUE(std::isnan(temperature_series_host(point, 0)));
        else
            EXPECT_DOUBLE_EQ(temperature_series_host(point, 0), static_cast<double>(expected_point));
    }
}

void testResampleOrder() {

    using memory_space = TEST_MEMSPACE;
    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);

    Grid grid = makeTestGrid(7, 1, 1, 1.0);
    ResampleInputs inputs;
    Resampler<memory_space> resampler(id, grid, 2, inputs, makeSnapshotInputs());
    resampler.resampleSnapshot(grid, makeLineSnapshot(1.0));
    // Same time, then an earlier time
    EXPECT_THROW(resampler.resampleSnapshot(grid, makeLineSnapshot(1.0)), UnorderedSnapshots);
    EXPECT_THROW(resampler.resampleSnapshot(grid, makeLineSnapshot(0.5)), UnorderedSnapshots);
    // Nothing was stored for the rejected snapshots
    EXPECT_EQ(resampler.num_steps_committed, 1);
    auto temperature_series_host =
        Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), resampler.temperature_series);
    EXPECT_TRUE(std::isnan(temperature_series_host(0, 1)));

    // Snapshot missing a resampled field
    Snapshot snapshot_no_alpha("no_alpha_snapshot", 2.0, 1, {"T"});
    snapshot_no_alpha.points(0, 0) = 0.0;
    snapshot_no_alpha.points(0, 1) = 0.0;
    snapshot_no_alpha.points(0, 2) = 0.0;
    snapshot_no_alpha.fields(0, 0) = 400.0;
    EXPECT_THROW(resampler.resampleSnapshot(grid, snapshot_no_alpha), InputError);
    EXPECT_EQ(resampler.num_steps_committed, 1);

    resampler.resampleSnapshot(grid, makeLineSnapshot(2.0));
    EXPECT_EQ(resampler.num_steps_committed, 2);
    auto times_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), resampler.getTimes());
    ASSERT_EQ(times_host.extent(0), 2);
    EXPECT_DOUBLE_EQ(times_host(0), 1.0);
    EXPECT_DOUBLE_EQ(times_host(1), 2.0);
    // No space for more snapshots
    EXPECT_THROW(resampler.resampleSnapshot(grid, makeLineSnapshot(3.0)), InputError);
}

//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, resample_tests) {
    testResampleNearest();
    testResampleInverseDistance();
    testResampleMatchesAllPoints();
}
TEST(TEST_CATEGORY, resample_order_tests) { testResampleOrder(); }
} // end namespace Test
