// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "THprint.hpp"
#include "THsnapshots.hpp"

#include <gtest/gtest.h>

#include "mpi.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Empty directory for the snapshot files of one test
void makeEmptyDirectory(const std::string directory) {
    std::filesystem::remove_all(directory);
    std::filesystem::create_directory(directory);
}

// Two point snapshot with temperature "T" and volume fraction "alpha.metal"
void writeCSVSnapshot(const std::string filename, const double temperature_1, const double temperature_2) {
    std::ofstream test_data_file(filename);
    test_data_file << "x,y,z,T,alpha.metal" << std::endl;
    test_data_file << "0.0,0.0,0.0," << temperature_1 << ",1.0" << std::endl;
    test_data_file << "1.0e-05,0.0,-2.0e-05," << temperature_2 << ",0.25" << std::endl;
    test_data_file.close();
}

//---------------------------------------------------------------------------//
// snapshot_list_tests
//---------------------------------------------------------------------------//
void testFindSnapshotFiles() {

    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    std::string directory = "TestSnapshotsList";
    makeEmptyDirectory(directory);
    // Written out of order, with times in both notations
    writeCSVSnapshot(directory + "/data_2.0e-01.csv", 1000.0, 1100.0);
    writeCSVSnapshot(directory + "/data_0.3.csv", 900.0, 1000.0);
    writeCSVSnapshot(directory + "/data_1.0e-01.csv", 1200.0, 1300.0);
    // No time in the name: skipped
    writeCSVSnapshot(directory + "/notes.csv", 0.0, 0.0);
    // Not a snapshot file type: ignored
    std::ofstream other_file(directory + "/data_0.4.txt");
    other_file << "not a snapshot" << std::endl;
    other_file.close();

    std::vector<SnapshotFile> files = findSnapshotFiles(id, directory, 2.0);
    ASSERT_EQ(files.size(), 3);
    EXPECT_EQ(getFileStem(files[0].path), "data_1.0e-01");
    EXPECT_EQ(getFileStem(files[1].path), "data_2.0e-01");
    EXPECT_EQ(getFileStem(files[2].path), "data_0.3");
    EXPECT_DOUBLE_EQ(files[0].time, 0.2);
    EXPECT_DOUBLE_EQ(files[1].time, 0.4);
    EXPECT_DOUBLE_EQ(files[2].time, 0.6);
    for (std::size_t n = 1; n < files.size(); n++)
        EXPECT_LT(files[n - 1].time, files[n].time);

    // Sorting an already sorted list does not change it
    std::vector<SnapshotFile> files_resorted = files;
    sortSnapshotFiles(files_resorted);
    for (std::size_t n = 0; n < files.size(); n++) {
        EXPECT_EQ(files_resorted[n].path, files[n].path);
        EXPECT_EQ(files_resorted[n].time, files[n].time);
    }

    // Same list through the store, which reads the files only when loaded
    SnapshotInputs inputs;
    inputs.directory = directory;
    inputs.time_scale = 2.0;
    SnapshotStore snapshot_store(id, inputs);
    EXPECT_EQ(snapshot_store.size(), 3);
    std::vector<double> times = snapshot_store.getTimes();
    std::vector<std::string> paths = snapshot_store.getPaths();
    for (int n = 0; n < 3; n++) {
        EXPECT_DOUBLE_EQ(times[n], files[n].time);
        EXPECT_EQ(paths[n], files[n].path);
    }
    Snapshot snapshot = snapshot_store.load(0, {"alpha.metal", "T"});
    EXPECT_DOUBLE_EQ(snapshot.time, 0.2);
    EXPECT_EQ(snapshot.num_points, 2);
    ASSERT_EQ(snapshot.field_names.size(), 2);
    EXPECT_EQ(snapshot.getFieldIndex("T"), 1);
    EXPECT_EQ(snapshot.getFieldIndex("p"), -1);
    EXPECT_DOUBLE_EQ(snapshot.fields(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(snapshot.fields(1, 0), 0.25);
    EXPECT_DOUBLE_EQ(snapshot.fields(0, 1), 1200.0);
    EXPECT_DOUBLE_EQ(snapshot.fields(1, 1), 1300.0);
    std::array<double, 6> bounds = snapshot.getBounds();
    std::array<double, 6> expected_bounds = {0.0, 1.0e-05, 0.0, 0.0, -2.0e-05, 0.0};
    for (int n = 0; n < 6; n++)
        EXPECT_DOUBLE_EQ(bounds[n], expected_bounds[n]);
    // Union of all snapshots
    std::array<double, 6> data_bounds = snapshot_store.findDataBounds(id, 1);
    for (int n = 0; n < 6; n++)
        EXPECT_DOUBLE_EQ(data_bounds[n], expected_bounds[n]);

    // Fields that are not in the snapshot
    EXPECT_THROW(snapshot_store.load(1, {"T", "p"}), InputError);
}

void testFindSnapshotFilesInvalid() {

    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    std::string directory = "TestSnapshotsInvalid";

    // Directory does not exist
    std::filesystem::remove_all(directory);
    EXPECT_THROW(findSnapshotFiles(id, directory, 1.0), InputError);

    // No snapshot files
    makeEmptyDirectory(directory);
    EXPECT_THROW(findSnapshotFiles(id, directory, 1.0), MalformedSnapshotName);

    // No file names ending in a time
    writeCSVSnapshot(directory + "/initial.csv", 300.0, 300.0);
    writeCSVSnapshot(directory + "/final.vtk", 300.0, 300.0);
    EXPECT_THROW(findSnapshotFiles(id, directory, 1.0), MalformedSnapshotName);

    // A single snapshot
    writeCSVSnapshot(directory + "/data_1.5e-05.csv", 300.0, 300.0);
    EXPECT_THROW(findSnapshotFiles(id, directory, 1.0), EmptySequence);

    // Two snapshots at the same time, written differently
    writeCSVSnapshot(directory + "/data_0.000015.csv", 300.0, 300.0);
    EXPECT_THROW(findSnapshotFiles(id, directory, 1.0), MalformedSnapshotName);
    try {
        findSnapshotFiles(id, directory, 1.0);
    }
    catch (const ThermalHistoryError &error) {
        EXPECT_EQ(error.stage(), "SnapshotStore");
    }

    std::vector<SnapshotFile> files(2);
    files[0].path = "a_2.csv";
    files[0].time = 2.0;
    files[1].path = "b_2.0.csv";
    files[1].time = 2.0;
    EXPECT_THROW(sortSnapshotFiles(files), MalformedSnapshotName);
}

// Snapshot times far from 1 keep their full value and order
void testFindSnapshotFilesExtremeTimes() {

    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    std::string directory = "TestSnapshotsExtremeTimes";
    makeEmptyDirectory(directory);
    writeCSVSnapshot(directory + "/T_4e-13.csv", 1000.0, 1100.0);
    writeCSVSnapshot(directory + "/T_1e-13.csv", 900.0, 1000.0);
    writeCSVSnapshot(directory + "/T_1.23456789e-05.csv", 800.0, 900.0);
    writeCSVSnapshot(directory + "/T_1e70.csv", 700.0, 800.0);
    std::vector<SnapshotFile> files = findSnapshotFiles(id, directory, 1.0);
    ASSERT_EQ(files.size(), 4);
    EXPECT_EQ(files[0].time, 1e-13);
    EXPECT_EQ(files[1].time, 4e-13);
    EXPECT_EQ(files[2].time, 1.23456789e-05);
    EXPECT_EQ(files[3].time, 1e70);
    EXPECT_EQ(getFileStem(files[0].path), "T_1e-13");

    // Every other snapshot in time order, starting with the first
    files = findSnapshotFiles(id, directory, 1.0, 2);
    ASSERT_EQ(files.size(), 2);
    EXPECT_EQ(files[0].time, 1e-13);
    EXPECT_EQ(files[1].time, 1.23456789e-05);
    files = findSnapshotFiles(id, directory, 1.0, 3);
    ASSERT_EQ(files.size(), 2);
    EXPECT_EQ(files[1].time, 1e70);
    // A stride that leaves a single snapshot
    EXPECT_THROW(findSnapshotFiles(id, directory, 1.0, 4), EmptySequence);
}

//---------------------------------------------------------------------------//
// snapshot_read_tests
//---------------------------------------------------------------------------//
void testReadCSV() {

    std::string filename = "TestSnapshotsRead.csv";
    std::ofstream test_data_file(filename);
    test_data_file << "X, Y, Z, T, alpha.metal" << std::endl;
    test_data_file << "0.5, 1.5, 2.5, 1700.0, 1" << std::endl;
    test_data_file << std::endl;
    test_data_file << "-0.5, -1.5, -2.5, 1.5e+03, 0" << std::endl;
    test_data_file.close();
    PointData point_data = readPointData(filename);
    ASSERT_EQ(point_data.numPoints(), 2);
    ASSERT_EQ(point_data.field_names.size(), 2);
    EXPECT_EQ(point_data.getFieldIndex("T"), 0);
    EXPECT_EQ(point_data.getFieldIndex("alpha.metal"), 1);
    EXPECT_DOUBLE_EQ(point_data.coordinates[1], 1.5);
    EXPECT_DOUBLE_EQ(point_data.coordinates[5], -2.5);
    EXPECT_DOUBLE_EQ(point_data.field_values[0][1], 1500.0);
    EXPECT_DOUBLE_EQ(point_data.field_values[1][0], 1.0);

    // Coordinates must be the first columns
    test_data_file.open(filename);
    test_data_file << "T,x,y,z" << std::endl;
    test_data_file << "1700,0,0,0" << std::endl;
    test_data_file.close();
    EXPECT_THROW(readPointData(filename), InputError);

    // Wrong number of values on a line
    test_data_file.open(filename);
    test_data_file << "x,y,z,T" << std::endl;
    test_data_file << "0,0,0" << std::endl;
    test_data_file.close();
    EXPECT_THROW(readPointData(filename), InputError);

    EXPECT_THROW(readPointData("TestSnapshotsRead.dat"), InputError);
}

// Legacy ASCII unstructured grid with cell data, multi-component arrays, and a field data block
void testReadVTKUnstructuredASCII() {

    std::string filename = "TestSnapshotsUnstructured.vtk";
    std::ofstream test_data_file(filename);
    test_data_file << "# vtk DataFile Version 3.0" << std::endl;
    test_data_file << "melt pool snapshot" << std::endl;
    test_data_file << "ASCII" << std::endl;
    test_data_file << "DATASET UNSTRUCTURED_GRID" << std::endl;
    test_data_file << "POINTS 4 float" << std::endl;
    test_data_file << "0 0 0 1e-05 0 0" << std::endl;
    test_data_file << "0 1e-05 0 0 0 1e-05" << std::endl;
    test_data_file << "CELLS 1 5" << std::endl;
    test_data_file << "4 0 1 2 3" << std::endl;
    test_data_file << "CELL_TYPES 1" << std::endl;
    test_data_file << "10" << std::endl;
    test_data_file << std::endl;
    test_data_file << "CELL_DATA 1" << std::endl;
    test_data_file << "SCALARS cellT double 1" << std::endl;
    test_data_file << "LOOKUP_TABLE default" << std::endl;
    test_data_file << "500" << std::endl;
    test_data_file << "POINT_DATA 4" << std::endl;
    test_data_file << "SCALARS T double" << std::endl;
    test_data_file << "LOOKUP_TABLE default" << std::endl;
    test_data_file << "300 400.5" << std::endl;
    test_data_file << "500 600" << std::endl;
    test_data_file << "SCALARS rho float 1" << std::endl;
    test_data_file << "7800 7800 7700 7600" << std::endl;
    test_data_file << "VECTORS U float" << std::endl;
    test_data_file << "0 0 0 1 1 1 2 2 2 3 3 3" << std::endl;
    test_data_file << "FIELD FieldData 3" << std::endl;
    test_data_file << "alpha.metal 1 4 double" << std::endl;
    test_data_file << "1 1 0.5 0" << std::endl;
    test_data_file << "NULL_ARRAY" << std::endl;
    test_data_file << "grad 3 4 float" << std::endl;
    test_data_file << "0 0 0 0 0 0 0 0 0 0 0 0" << std::endl;
    test_data_file.close();

    PointData point_data = readPointData(filename);
    ASSERT_EQ(point_data.numPoints(), 4);
    EXPECT_DOUBLE_EQ(point_data.coordinates[3], 1e-05);
    EXPECT_DOUBLE_EQ(point_data.coordinates[11], 1e-05);
    // Single component point arrays only
    ASSERT_EQ(point_data.field_names.size(), 3);
    EXPECT_EQ(point_data.field_names[0], "T");
    EXPECT_EQ(point_data.field_names[1], "rho");
    EXPECT_EQ(point_data.field_names[2], "alpha.metal");
    EXPECT_EQ(point_data.getFieldIndex("cellT"), -1);
    EXPECT_EQ(point_data.getFieldIndex("U"), -1);
    EXPECT_EQ(point_data.getFieldIndex("grad"), -1);
    EXPECT_DOUBLE_EQ(point_data.field_values[0][1], 400.5);
    EXPECT_DOUBLE_EQ(point_data.field_values[1][3], 7600.0);
    EXPECT_DOUBLE_EQ(point_data.field_values[2][2], 0.5);
}

// Legacy binary (big endian) polydata
void testReadVTKPolydataBinary() {

    std::string filename = "TestSnapshotsPolydata.vtk";
    std::ofstream test_data_file(filename, std::ios::out | std::ios::binary);
    test_data_file << "# vtk DataFile Version 3.0" << std::endl;
    test_data_file << "binary point cloud" << std::endl;
    test_data_file << "BINARY" << std::endl;
    test_data_file << "DATASET POLYDATA" << std::endl;
    test_data_file << "POINTS 2 double" << std::endl;
    double coordinates[6] = {1.0e-06, 2.0e-06, 3.0e-06, -1.0e-06, -2.0e-06, -3.0e-06};
    for (int n = 0; n < 6; n++)
        writeData(test_data_file, coordinates[n], true, true);
    test_data_file << std::endl;
    test_data_file << "VERTICES 2 4" << std::endl;
    int vertices[4] = {1, 0, 1, 1};
    for (int n = 0; n < 4; n++)
        writeData(test_data_file, vertices[n], true, true);
    test_data_file << std::endl;
    test_data_file << "POINT_DATA 2" << std::endl;
    test_data_file << "SCALARS T float 1" << std::endl;
    test_data_file << "LOOKUP_TABLE default" << std::endl;
    float temperatures[2] = {1650.5, 1450.25};
    for (int n = 0; n < 2; n++)
        writeData(test_data_file, temperatures[n], true, true);
    test_data_file << std::endl;
    test_data_file << "SCALARS phase short 1" << std::endl;
    test_data_file << "LOOKUP_TABLE default" << std::endl;
    short phases[2] = {1, -1};
    for (int n = 0; n < 2; n++)
        writeData(test_data_file, phases[n], true, true);
    test_data_file << std::endl;
    test_data_file.close();

    PointData point_data = readPointData(filename);
    ASSERT_EQ(point_data.numPoints(), 2);
    for (int n = 0; n < 6; n++)
        EXPECT_DOUBLE_EQ(point_data.coordinates[n], coordinates[n]);
    ASSERT_EQ(point_data.field_names.size(), 2);
    EXPECT_DOUBLE_EQ(point_data.field_values[0][0], 1650.5);
    EXPECT_DOUBLE_EQ(point_data.field_values[0][1], 1450.25);
    EXPECT_DOUBLE_EQ(point_data.field_values[1][1], -1.0);
}

// Version 5.1 files give cell offsets and connectivity as separate arrays, and may contain metadata
void testReadVTKOffsetsFormat() {

    std::string filename = "TestSnapshotsOffsets.vtk";
    std::ofstream test_data_file(filename);
    test_data_file << "# vtk DataFile Version 5.1" << std::endl;
    test_data_file << "vtk output" << std::endl;
    test_data_file << "ASCII" << std::endl;
    test_data_file << "DATASET UNSTRUCTURED_GRID" << std::endl;
    test_data_file << "POINTS 3 double" << std::endl;
    test_data_file << "0 0 0 2 0 0 0 2 0" << std::endl;
    test_data_file << std::endl;
    test_data_file << "METADATA" << std::endl;
    test_data_file << "INFORMATION 0" << std::endl;
    test_data_file << std::endl;
    test_data_file << "CELLS 2 3" << std::endl;
    test_data_file << "OFFSETS vtktypeint64" << std::endl;
    test_data_file << "0 3" << std::endl;
    test_data_file << "CONNECTIVITY vtktypeint64" << std::endl;
    test_data_file << "0 1 2" << std::endl;
    test_data_file << "CELL_TYPES 1" << std::endl;
    test_data_file << "5" << std::endl;
    test_data_file << std::endl;
    test_data_file << "CELL_DATA 1" << std::endl;
    test_data_file << "FIELD FieldData 1" << std::endl;
    test_data_file << "cellID 1 1 int" << std::endl;
    test_data_file << "0" << std::endl;
    test_data_file << "POINT_DATA 3" << std::endl;
    test_data_file << "FIELD FieldData 1" << std::endl;
    test_data_file << "T 1 3 double" << std::endl;
    test_data_file << "1000 1500 2000" << std::endl;
    test_data_file.close();

    PointData point_data = readPointData(filename);
    ASSERT_EQ(point_data.numPoints(), 3);
    EXPECT_DOUBLE_EQ(point_data.coordinates[3], 2.0);
    EXPECT_DOUBLE_EQ(point_data.coordinates[7], 2.0);
    ASSERT_EQ(point_data.field_names.size(), 1);
    EXPECT_EQ(point_data.field_names[0], "T");
    EXPECT_DOUBLE_EQ(point_data.field_values[0][2], 2000.0);
}

// Structured points give the coordinates implicitly, X fastest
void testReadVTKStructuredPoints() {

    std::string filename = "TestSnapshotsStructured.vtk";
    std::ofstream test_data_file(filename);
    test_data_file << "# vtk DataFile Version 3.0" << std::endl;
    test_data_file << "resampled snapshot" << std::endl;
    test_data_file << "ASCII" << std::endl;
    test_data_file << "DATASET STRUCTURED_POINTS" << std::endl;
    test_data_file << "DIMENSIONS 2 2 1" << std::endl;
    test_data_file << "ORIGIN -1 0 4" << std::endl;
    test_data_file << "SPACING 0.5 0.5 0.5" << std::endl;
    test_data_file << "POINT_DATA 4" << std::endl;
    test_data_file << "SCALARS T double 1" << std::endl;
    test_data_file << "LOOKUP_TABLE default" << std::endl;
    test_data_file << "1 2 3 4" << std::endl;
    test_data_file.close();

    PointData point_data = readPointData(filename);
    ASSERT_EQ(point_data.numPoints(), 4);
    // Point 3 is i = 1, j = 1, k = 0
    EXPECT_DOUBLE_EQ(point_data.coordinates[9], -0.5);
    EXPECT_DOUBLE_EQ(point_data.coordinates[10], 0.5);
    EXPECT_DOUBLE_EQ(point_data.coordinates[11], 4.0);
    EXPECT_DOUBLE_EQ(point_data.field_values[0][3], 4.0);

    // Not a legacy VTK file
    test_data_file.open(filename);
    test_data_file << "<?xml version=\"1.0\"?>" << std::endl;
    test_data_file << "<VTKFile type=\"UnstructuredGrid\">" << std::endl;
    test_data_file << "</VTKFile>" << std::endl;
    test_data_file.close();
    EXPECT_THROW(readPointData(filename), InputError);
}

//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, snapshot_list_tests) {
    testFindSnapshotFiles();
    testFindSnapshotFilesInvalid();
    testFindSnapshotFilesExtremeTimes();
}
TEST(TEST_CATEGORY, snapshot_read_tests) {
    testReadCSV();
    testReadVTKUnstructuredASCII();
    testReadVTKPolydataBinary();
    testReadVTKOffsetsFormat();
    testReadVTKStructuredPoints();
}
} // end namespace Test
