// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "THgrid.hpp"

#include <gtest/gtest.h>

#include "mpi.h"

#include <array>
#include <cmath>
#include <limits>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// grid_build_tests
//---------------------------------------------------------------------------//
void testGridFromDataBounds() {

    int id, np;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    MPI_Comm_size(MPI_COMM_WORLD, &np);

    DomainInputs inputs;
    inputs.cell_size = 1.0e-05;
    std::array<double, 6> data_bounds = {0.0, 1.0e-04, 0.0, 5.0e-05, -2.0e-05, 0.0};
    Grid grid(id, np, inputs, data_bounds);
    EXPECT_EQ(grid.nx, 11);
    EXPECT_EQ(grid.ny, 6);
    EXPECT_EQ(grid.nz, 3);
    EXPECT_EQ(grid.domain_size, 198);
    EXPECT_DOUBLE_EQ(grid.deltax, 1.0e-05);
    EXPECT_DOUBLE_EQ(grid.x_min, 0.0);
    EXPECT_DOUBLE_EQ(grid.z_min, -2.0e-05);

    // Same inputs give the same grid
    Grid grid_repeat(id, np, inputs, data_bounds);
    EXPECT_EQ(grid_repeat.domain_size, grid.domain_size);
    EXPECT_EQ(grid_repeat.num_points_local, grid.num_points_local);
    EXPECT_EQ(grid_repeat.point_offset, grid.point_offset);
    for (int index = 0; index < grid.domain_size; index++) {
        std::array<double, 3> coordinates = grid.getCoordinates(index);
        std::array<double, 3> coordinates_repeat = grid_repeat.getCoordinates(index);
        for (int a = 0; a < 3; a++)
            EXPECT_EQ(coordinates[a], coordinates_repeat[a]);
    }

    // X fastest, then Y, then Z
    int index = grid.get1DIndex(3, 2, 1);
    EXPECT_EQ(index, 3 + 11 * (2 + 6 * 1));
    EXPECT_EQ(grid.getCoordX(index), 3);
    EXPECT_EQ(grid.getCoordY(index), 2);
    EXPECT_EQ(grid.getCoordZ(index), 1);
    std::array<double, 3> coordinates = grid.getCoordinates(index);
    EXPECT_NEAR(coordinates[0], 3.0e-05, 1.0e-15);
    EXPECT_NEAR(coordinates[1], 2.0e-05, 1.0e-15);
    EXPECT_NEAR(coordinates[2], -1.0e-05, 1.0e-15);
    // Last grid point is at the upper bounds
    coordinates = grid.getCoordinates(grid.domain_size - 1);
    EXPECT_NEAR(coordinates[0], 1.0e-04, 1.0e-15);
    EXPECT_NEAR(coordinates[1], 5.0e-05, 1.0e-15);
    EXPECT_NEAR(coordinates[2], 0.0, 1.0e-15);

    // Each grid point is owned by exactly one rank, and ranks own consecutive points in rank order
    int total_points;
    MPI_Allreduce(&grid.num_points_local, &total_points, 1, MPI_INT, MPI_SUM, MPI_COMM_WORLD);
    EXPECT_EQ(total_points, grid.domain_size);
    std::vector<int> offsets(np), sizes(np);
    MPI_Allgather(&grid.point_offset, 1, MPI_INT, offsets.data(), 1, MPI_INT, MPI_COMM_WORLD);
    MPI_Allgather(&grid.num_points_local, 1, MPI_INT, sizes.data(), 1, MPI_INT, MPI_COMM_WORLD);
    EXPECT_EQ(offsets[0], 0);
    for (int rank = 1; rank < np; rank++)
        EXPECT_EQ(offsets[rank], offsets[rank - 1] + sizes[rank - 1]);
}

void testGridFixedBounds() {

    int id, np;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    MPI_Comm_size(MPI_COMM_WORLD, &np);

    std::array<double, 6> data_bounds = {0.0, 10.0, 0.0, 10.0, 0.0, 10.0};
    DomainInputs inputs;
    inputs.cell_size = 1.0;
    inputs.use_fixed_bounds = true;
    // Upper X bound and lower Z bound outside of the data are moved to the data bounds
    inputs.bounds = {2.0, 12.0, 3.0, 5.0, -4.0, 1.0};
    Grid grid(id, np, inputs, data_bounds);
    EXPECT_DOUBLE_EQ(grid.x_min, 2.0);
    EXPECT_DOUBLE_EQ(grid.x_max, 10.0);
    EXPECT_DOUBLE_EQ(grid.y_min, 3.0);
    EXPECT_DOUBLE_EQ(grid.y_max, 5.0);
    EXPECT_DOUBLE_EQ(grid.z_min, 0.0);
    EXPECT_DOUBLE_EQ(grid.z_max, 1.0);
    EXPECT_EQ(grid.nx, 9);
    EXPECT_EQ(grid.ny, 3);
    EXPECT_EQ(grid.nz, 2);

    // Extent that is not a multiple of the cell size: the last grid point is inside the bounds
    inputs.bounds = {0.0, 2.5, 0.0, 1.0, 0.0, 1.0};
    Grid grid_partial(id, np, inputs, data_bounds);
    EXPECT_EQ(grid_partial.nx, 3);

    // Lower bound above the upper bound
    inputs.bounds = {5.0, 4.0, 0.0, 1.0, 0.0, 1.0};
    EXPECT_THROW(Grid grid_invalid(id, np, inputs, data_bounds), InputError);
    // No overlap with the data
    inputs.bounds = {0.0, 1.0, 20.0, 30.0, 0.0, 1.0};
    EXPECT_THROW(Grid grid_invalid(id, np, inputs, data_bounds), InputError);
}

void testGridResolution() {

    int id, np;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    MPI_Comm_size(MPI_COMM_WORLD, &np);

    std::array<double, 6> data_bounds = {0.0, 1.0, 0.0, 2.0, 0.0, 0.5};
    DomainInputs inputs;
    inputs.cell_size = 0.0;
    EXPECT_THROW(Grid grid_invalid(id, np, inputs, data_bounds), InvalidResolution);
    inputs.cell_size = -0.1;
    EXPECT_THROW(Grid grid_invalid(id, np, inputs, data_bounds), InvalidResolution);
    inputs.cell_size = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(Grid grid_invalid(id, np, inputs, data_bounds), InvalidResolution);
    // Coarser than the largest extent
    inputs.cell_size = 2.5;
    EXPECT_THROW(Grid grid_invalid(id, np, inputs, data_bounds), InvalidResolution);
    try {
        Grid grid_invalid(id, np, inputs, data_bounds);
    }
    catch (const ThermalHistoryError &error) {
        EXPECT_EQ(error.stage(), "GridBuilder");
    }
    // Equal to the largest extent: 2 points in Y
    inputs.cell_size = 2.0;
    Grid grid_coarse(id, np, inputs, data_bounds);
    EXPECT_EQ(grid_coarse.ny, 2);
    EXPECT_EQ(grid_coarse.nx, 1);

    // Data at a single point is a single grid point
    std::array<double, 6> point_bounds = {1.0, 1.0, 2.0, 2.0, 3.0, 3.0};
    inputs.cell_size = 0.1;
    Grid grid_point(id, np, inputs, point_bounds);
    EXPECT_EQ(grid_point.domain_size, 1);
    std::array<double, 3> coordinates = grid_point.getCoordinates(0);
    EXPECT_DOUBLE_EQ(coordinates[0], 1.0);
    EXPECT_DOUBLE_EQ(coordinates[1], 2.0);
    EXPECT_DOUBLE_EQ(coordinates[2], 3.0);
}

//---------------------------------------------------------------------------//
// grid_decomposition_tests
//---------------------------------------------------------------------------//
void testDecomposition() {

    // 10 points on 3 ranks: remainder goes to the lowest ranks
    Grid grid;
    grid.domain_size = 10;
    EXPECT_EQ(grid.getNumPointsLocal(0, 3), 4);
    EXPECT_EQ(grid.getNumPointsLocal(1, 3), 3);
    EXPECT_EQ(grid.getNumPointsLocal(2, 3), 3);
    EXPECT_EQ(grid.getPointOffset(0, 3), 0);
    EXPECT_EQ(grid.getPointOffset(1, 3), 4);
    EXPECT_EQ(grid.getPointOffset(2, 3), 7);
    // More ranks than points
    grid.domain_size = 2;
    EXPECT_EQ(grid.getNumPointsLocal(1, 4), 1);
    EXPECT_EQ(grid.getNumPointsLocal(3, 4), 0);
    EXPECT_EQ(grid.getPointOffset(3, 4), 2);
}

//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, grid_build_tests) {
    testGridFromDataBounds();
    testGridFixedBounds();
    testGridResolution();
}
TEST(TEST_CATEGORY, grid_decomposition_tests) { testDecomposition(); }
} // end namespace Test
