// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "THgrid.hpp"
#include "THparsefiles.hpp"
#include "THremap.hpp"
#include "THthermalhistory.hpp"

#include <gtest/gtest.h>

#include "mpi.h"

#include <array>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
RemapInputs makeRemapInputs(const std::array<double, 3> offset, const double unit_scale) {
    RemapInputs inputs;
    inputs.coordinate_offset_given = true;
    inputs.coordinate_offset = offset;
    inputs.unit_scale_given = true;
    inputs.unit_scale = unit_scale;
    return inputs;
}

//---------------------------------------------------------------------------//
// remap_transform_tests
//---------------------------------------------------------------------------//
void testTransformCoordinates() {

    std::array<double, 3> coordinates = {1.5e-04, -2.5e-05, 3.0e-06};

    // No offset and unit scale leave the coordinates unchanged
    Remapper identity(makeRemapInputs({0.0, 0.0, 0.0}, 1.0));
    std::array<double, 3> transformed = identity.transformCoordinates(coordinates);
    for (int a = 0; a < 3; a++)
        EXPECT_EQ(transformed[a], coordinates[a]);

    // Offset then the opposite offset
    std::array<double, 3> offset = {5.0e-04, 2.5e-05, -1.0e-04};
    Remapper shift(makeRemapInputs(offset, 1.0));
    Remapper shift_back(makeRemapInputs({-offset[0], -offset[1], -offset[2]}, 1.0));
    transformed = shift_back.transformCoordinates(shift.transformCoordinates(coordinates));
    for (int a = 0; a < 3; a++)
        EXPECT_NEAR(transformed[a], coordinates[a], 1.0e-18);

    // Offset applied before scaling, meters to millimeters
    Remapper to_mm(makeRemapInputs(offset, 1000.0));
    transformed = to_mm.transformCoordinates(coordinates);
    EXPECT_NEAR(transformed[0], 0.65, 1.0e-12);
    EXPECT_NEAR(transformed[1], 0.0, 1.0e-12);
    EXPECT_NEAR(transformed[2], -0.097, 1.0e-12);

    // Output axes taken from other input axes
    RemapInputs swap_inputs = makeRemapInputs({1.0, 0.0, 0.0}, 2.0);
    swap_inputs.axis_order = {2, 0, 1};
    Remapper swap(swap_inputs);
    transformed = swap.transformCoordinates({1.0, 2.0, 3.0});
    EXPECT_DOUBLE_EQ(transformed[0], 8.0);
    EXPECT_DOUBLE_EQ(transformed[1], 2.0);
    EXPECT_DOUBLE_EQ(transformed[2], 4.0);

    // Only the coordinate columns change, and row order is kept
    std::vector<double> rows = {1.0, 2.0, 3.0, 0.1, 0.2, -100.0, 4.0, 5.0, 6.0, 0.3, 0.4, -200.0};
    swap.remapRows(rows);
    std::vector<double> expected_rows = {8.0, 2.0, 4.0, 0.1, 0.2, -100.0, 14.0, 8.0, 10.0, 0.3, 0.4, -200.0};
    ASSERT_EQ(rows.size(), expected_rows.size());
    for (std::size_t n = 0; n < rows.size(); n++)
        EXPECT_DOUBLE_EQ(rows[n], expected_rows[n]);
}

void testRemapSchema() {

    // Transform parameters must be given explicitly
    RemapInputs inputs = makeRemapInputs({0.0, 0.0, 0.0}, 1.0);
    inputs.coordinate_offset_given = false;
    EXPECT_THROW(Remapper remapper(inputs), SchemaMismatch);
    inputs = makeRemapInputs({0.0, 0.0, 0.0}, 1.0);
    inputs.unit_scale_given = false;
    EXPECT_THROW(Remapper remapper(inputs), SchemaMismatch);
    EXPECT_THROW(Remapper remapper(makeRemapInputs({0.0, 0.0, 0.0}, 0.0)), SchemaMismatch);
    EXPECT_THROW(Remapper remapper(makeRemapInputs({0.0, 0.0, 0.0}, -1.0)), SchemaMismatch);
    EXPECT_THROW(Remapper remapper(makeRemapInputs({std::numeric_limits<double>::infinity(), 0.0, 0.0}, 1.0)),
                 SchemaMismatch);
    inputs = makeRemapInputs({0.0, 0.0, 0.0}, 1.0);
    inputs.axis_order = {0, 0, 2};
    EXPECT_THROW(Remapper remapper(inputs), SchemaMismatch);
    try {
        Remapper remapper(inputs);
    }
    catch (const ThermalHistoryError &error) {
        EXPECT_EQ(error.stage(), "Remapper");
    }
}

//---------------------------------------------------------------------------//
// remap_write_tests
//---------------------------------------------------------------------------//
void testWriteTable() {

    std::vector<double> rows = {0.0, 0.5, 1.0, 1.25e-05, 3.125e-05, -123456.789,
                                1.0, 1.5, 2.0, 2.0e-05,  4.0e-05,   -1.5e06};

    // ExaCA column names
    RemapInputs inputs = makeRemapInputs({0.0, 0.0, 0.0}, 1.0);
    inputs.header_style = RemapInputs::exaca;
    Remapper remapper_exaca(inputs);
    std::string filename = "TestRemapExaCA.csv";
    remapper_exaca.writeTable(filename, rows);
    EXPECT_FALSE(std::filesystem::exists(filename + ".tmp"));
    std::ifstream table(filename);
    std::string line;
    std::getline(table, line);
    EXPECT_EQ(line, "x,y,z,tm,ts,cr");
    std::vector<std::string> parsed_line(Remapper::num_columns);
    int num_rows = 0;
    while (std::getline(table, line)) {
        splitString(line, parsed_line, Remapper::num_columns);
        for (int n = 0; n < Remapper::num_columns; n++)
            EXPECT_NEAR(getInputDouble(parsed_line[n]), rows[Remapper::num_columns * num_rows + n],
                        1.0e-12 * std::abs(rows[Remapper::num_columns * num_rows + n]));
        num_rows++;
    }
    EXPECT_EQ(num_rows, 2);
    table.close();

    // Descriptive column names, replacing the earlier file
    inputs.header_style = RemapInputs::descriptive;
    Remapper remapper_descriptive(inputs);
    remapper_descriptive.writeTable(filename, rows);
    table.open(filename);
    std::getline(table, line);
    EXPECT_EQ(line, "x,y,z,melting_time,solidification_time,cooling_rate");
    table.close();

    // No rows: header only
    remapper_descriptive.writeTable("TestRemapEmpty.csv", {});
    table.open("TestRemapEmpty.csv");
    int num_lines = 0;
    while (std::getline(table, line))
        num_lines++;
    EXPECT_EQ(num_lines, 1);
    table.close();

    // Binary doubles without a header
    std::string binary_filename = "TestRemapBinary.catemp";
    remapper_descriptive.writeTable(binary_filename, rows);
    EXPECT_EQ(std::filesystem::file_size(binary_filename), rows.size() * sizeof(double));
    std::ifstream binary_table(binary_filename, std::ios::binary);
    for (std::size_t n = 0; n < rows.size(); n++)
        EXPECT_EQ(readBinaryData<double>(binary_table, false), rows[n]);

    // Directory that does not exist: nothing is written
    EXPECT_THROW(remapper_descriptive.writeTable("TestRemapMissingDirectory/Table.csv", rows), ThermalHistoryError);
    EXPECT_FALSE(std::filesystem::exists("TestRemapMissingDirectory/Table.csv"));
}

// Rows of solidified grid points only, in grid order
void testCollectRows() {

    using memory_space = TEST_MEMSPACE;
    int id, np;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    MPI_Comm_size(MPI_COMM_WORLD, &np);

    Grid grid;
    grid.nx = 2;
    grid.ny = 2;
    grid.nz = 1;
    grid.domain_size = 4;
    grid.deltax = 0.5;
    grid.x_min = 1.0;
    grid.y_min = -1.0;
    grid.z_min = 2.0;
    grid.num_points_local = 4;
    grid.point_offset = 0;

    MaterialInputs m_inputs;
    m_inputs.liquidus_temperature = 1700.0;
    m_inputs.solidus_temperature = 1300.0;
    ThermalHistory<memory_space> thermal_history(grid.num_points_local, m_inputs, ThermalHistoryInputs());
    auto status_host = Kokkos::create_mirror_view(thermal_history.status);
    auto melting_time_host = Kokkos::create_mirror_view(thermal_history.melting_time);
    auto solidification_time_host = Kokkos::create_mirror_view(thermal_history.solidification_time);
    auto cooling_rate_host = Kokkos::create_mirror_view(thermal_history.cooling_rate);
    short statuses[4] = {Solidified, NotMelted, IncompleteSolidification, Solidified};
    for (int point = 0; point < 4; point++) {
        status_host(point) = statuses[point];
        melting_time_host(point) = 0.1 * point;
        solidification_time_host(point) = 0.1 * point + 0.05;
        cooling_rate_host(point) = -1000.0 * (point + 1);
    }
    Kokkos::deep_copy(thermal_history.status, status_host);
    Kokkos::deep_copy(thermal_history.melting_time, melting_time_host);
    Kokkos::deep_copy(thermal_history.solidification_time, solidification_time_host);
    Kokkos::deep_copy(thermal_history.cooling_rate, cooling_rate_host);

    Remapper remapper(makeRemapInputs({0.0, 0.0, 0.0}, 1.0));
    std::vector<double> rows = remapper.collectRows(id, np, grid, thermal_history);
    std::vector<double> expected_rows = {1.0, -1.0, 2.0, 0.0, 0.05, -1000.0, 1.5, -0.5, 2.0, 0.3, 0.35, -4000.0};
    ASSERT_EQ(rows.size(), expected_rows.size());
    for (std::size_t n = 0; n < rows.size(); n++)
        EXPECT_DOUBLE_EQ(rows[n], expected_rows[n]);
}

//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, remap_transform_tests) {
    testTransformCoordinates();
    testRemapSchema();
}
TEST(TEST_CATEGORY, remap_write_tests) {
    testWriteTable();
    testCollectRows();
}
} // end namespace Test
