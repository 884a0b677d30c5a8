// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "THgrid.hpp"
#include "THprint.hpp"
#include "THresample.hpp"
#include "THsnapshots.hpp"

#include <gtest/gtest.h>

#include "mpi.h"

#include <filesystem>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Output directory for this test, unique to the number of ranks
std::string makeOutputDirectory(const int id, const int np, const bool print_binary) {
    std::string directory = "TestPrint_np" + std::to_string(np) + (print_binary ? "_binary/" : "_ascii/");
    if (id == 0) {
        std::filesystem::remove_all(directory);
        std::filesystem::create_directory(directory);
    }
    MPI_Barrier(MPI_COMM_WORLD);
    return directory;
}

//---------------------------------------------------------------------------//
// print_resampled_tests
//---------------------------------------------------------------------------//
void testPrintResampledSnapshot(const bool print_binary) {

    using memory_space = TEST_MEMSPACE;
    int id, np;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    MPI_Comm_size(MPI_COMM_WORLD, &np);

    // 3 by 2 by 1 grid, split across ranks
    DomainInputs d_inputs;
    d_inputs.cell_size = 1.0;
    Grid grid(id, np, d_inputs, {0.0, 2.0, 0.0, 1.0, 0.0, 0.0});
    ASSERT_EQ(grid.domain_size, 6);

    // Source points at all grid points except the last one
    Snapshot snapshot("print_snapshot", 1.5e-05, 5, {"T"});
    for (int p = 0; p < 5; p++) {
        std::array<double, 3> coordinates = grid.getCoordinates(p);
        for (int a = 0; a < 3; a++)
            snapshot.points(p, a) = coordinates[a];
        snapshot.fields(p, 0) = 1000.0 + 100.0 * p;
    }
    ResampleInputs r_inputs;
    r_inputs.search_radius_given = true;
    r_inputs.search_radius = 0.4;
    SnapshotInputs s_inputs;
    Resampler<memory_space> resampler(id, grid, 1, r_inputs, s_inputs);
    resampler.resampleSnapshot(grid, snapshot);

    PrintInputs inputs;
    inputs.path_to_output = makeOutputDirectory(id, np, print_binary);
    inputs.output_file = "TestPrint.csv";
    inputs.print_resampled_snapshots = true;
    inputs.print_binary = print_binary;
    Print print(inputs);
    print.printResampledSnapshot(id, np, grid, resampler, snapshot.time);
    std::string filename = print.getResampledFilename(snapshot.time);
    EXPECT_EQ(filename, inputs.path_to_output + "resampled_1.5e-05.vtk");

    if (id == 0) {
        PointData point_data = readVTKPointData(filename);
        ASSERT_EQ(point_data.numPoints(), 6);
        EXPECT_DOUBLE_EQ(point_data.coordinates[12], 1.0);
        EXPECT_DOUBLE_EQ(point_data.coordinates[13], 1.0);
        EXPECT_DOUBLE_EQ(point_data.coordinates[14], 0.0);
        int has_sample_index = point_data.getFieldIndex("HasSample");
        int temperature_index = point_data.getFieldIndex("T");
        ASSERT_NE(has_sample_index, -1);
        ASSERT_NE(temperature_index, -1);
        for (int index = 0; index < 5; index++) {
            EXPECT_DOUBLE_EQ(point_data.field_values[has_sample_index][index], 1.0);
            EXPECT_DOUBLE_EQ(point_data.field_values[temperature_index][index], 1000.0 + 100.0 * index);
        }
        // No source point within the search radius
        EXPECT_DOUBLE_EQ(point_data.field_values[has_sample_index][5], 0.0);
        EXPECT_DOUBLE_EQ(point_data.field_values[temperature_index][5], 0.0);
    }
    MPI_Barrier(MPI_COMM_WORLD);
}

//---------------------------------------------------------------------------//
// print_results_tests
//---------------------------------------------------------------------------//
void testPrintResultsVTK(const bool print_binary) {

    int id, np;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    MPI_Comm_size(MPI_COMM_WORLD, &np);

    PrintInputs inputs;
    inputs.path_to_output = makeOutputDirectory(id, np, print_binary);
    inputs.output_file = "TestResults.catemp";
    inputs.print_results_vtk = true;
    inputs.print_binary = print_binary;
    Print print(inputs);
    EXPECT_EQ(print.getOutputFilename(), inputs.path_to_output + "TestResults.catemp");
    EXPECT_EQ(print.getResultsVTKFilename(), inputs.path_to_output + "TestResults.vtk");
    EXPECT_EQ(print.getLogFilename(), inputs.path_to_output + "TestResults.json");

    if (id == 0) {
        std::vector<double> rows = {0.5, 1.0, 1.5, 1.0e-05, 2.5e-05, -250000.0,
                                    2.5, 3.0, 3.5, 2.0e-05, 3.5e-05, -125000.5};
        std::vector<std::string> column_names = {"x", "y", "z", "tm", "ts", "cr"};
        print.printResultsVTK(print.getResultsVTKFilename(), rows, 6, column_names);

        PointData point_data = readVTKPointData(print.getResultsVTKFilename());
        ASSERT_EQ(point_data.numPoints(), 2);
        for (int row = 0; row < 2; row++) {
            for (int a = 0; a < 3; a++)
                EXPECT_DOUBLE_EQ(point_data.coordinates[3 * row + a], rows[6 * row + a]);
        }
        ASSERT_EQ(point_data.field_names.size(), 3);
        for (int n = 0; n < 3; n++) {
            EXPECT_EQ(point_data.field_names[n], column_names[3 + n]);
            for (int row = 0; row < 2; row++)
                EXPECT_DOUBLE_EQ(point_data.field_values[n][row], rows[6 * row + 3 + n]);
        }

        // Empty table
        print.printResultsVTK(print.getResultsVTKFilename(), {}, 6, column_names);
        point_data = readVTKPointData(print.getResultsVTKFilename());
        EXPECT_EQ(point_data.numPoints(), 0);
    }
    MPI_Barrier(MPI_COMM_WORLD);
}

//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, print_resampled_tests) {
    // test ASCII and binary output
    testPrintResampledSnapshot(false);
    testPrintResampledSnapshot(true);
}
TEST(TEST_CATEGORY, print_results_tests) {
    testPrintResultsVTK(false);
    testPrintResultsVTK(true);
}
} // end namespace Test
