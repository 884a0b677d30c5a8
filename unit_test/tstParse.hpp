// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "THparsefiles.hpp"
#include "THprint.hpp"

#include <gtest/gtest.h>

#include "mpi.h"

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// file_read_tests
//---------------------------------------------------------------------------//
void testReadWrite(bool print_read_binary) {

    // Make lists of some int and double data
    int int_data[5] = {-2, 0, 2, 4, 6};
    double double_data[5] = {-1.5, 0.0, 1.25e-05, 2.0, 873.0};

    // Write data as binary to be used as input
    std::string int_filename = "TestParseInt.txt";
    std::string double_filename = "TestParseDouble.txt";
    std::ofstream test_int_data;
    std::ofstream test_double_data;
    if (print_read_binary) {
        test_int_data.open(int_filename, std::ios::out | std::ios::binary);
        test_double_data.open(double_filename, std::ios::out | std::ios::binary);
    }
    else {
        test_int_data.open(int_filename);
        test_double_data.open(double_filename);
    }
    for (int n = 0; n < 5; n++) {
        // Write to files
        writeData(test_int_data, int_data[n], print_read_binary, true);
        writeData(test_double_data, double_data[n], print_read_binary, true);
    }
    test_int_data.close();
    test_double_data.close();

    // Read data and convert back to ints and doubles, compare to original values
    std::ifstream test_int_data_read;
    test_int_data_read.open(int_filename);
    std::ifstream test_double_data_read;
    test_double_data_read.open(double_filename);
    // For reading ASCII data, obtain the lines from the files first, then read the string stream at the spaces
    if (print_read_binary) {
        for (int n = 0; n < 5; n++) {
            int int_to_compare = readBinaryData<int>(test_int_data_read, true);
            double double_to_compare = readBinaryData<double>(test_double_data_read, true);
            // Compare to expected values
            EXPECT_EQ(int_to_compare, int_data[n]);
            EXPECT_DOUBLE_EQ(double_to_compare, double_data[n]);
        }
    }
    else {
        std::string intline, doubleline;
        getline(test_int_data_read, intline);
        getline(test_double_data_read, doubleline);
        std::istringstream intss(intline);
        std::istringstream doubless(doubleline);
        for (int n = 0; n < 5; n++) {
            int int_to_compare;
            double double_to_compare;
            intss >> int_to_compare;
            doubless >> double_to_compare;
            // Compare to expected values
            EXPECT_EQ(int_to_compare, int_data[n]);
            EXPECT_DOUBLE_EQ(double_to_compare, double_data[n]);
        }
    }
}

//---------------------------------------------------------------------------//
// string_parse_tests
//---------------------------------------------------------------------------//
void testSplitString() {

    std::vector<std::string> parsed_line(4);
    splitString("0.0, 1.5e-06,2.5e-06 ,873", parsed_line, 4);
    EXPECT_DOUBLE_EQ(getInputDouble(parsed_line[0]), 0.0);
    EXPECT_DOUBLE_EQ(getInputDouble(parsed_line[1]), 1.5e-06);
    EXPECT_DOUBLE_EQ(getInputDouble(parsed_line[2]), 2.5e-06);
    EXPECT_DOUBLE_EQ(getInputDouble(parsed_line[3], -3), 0.873);
    // Wrong number of values on the line
    EXPECT_THROW(splitString("0.0,1.0,2.0", parsed_line, 4), std::runtime_error);
    EXPECT_EQ(removeWhitespace(" melting time\t"), "meltingtime");
}

void testCoordinateHeader() {

    std::vector<std::string> columns = checkForCoordinateHeader("X, y,Z,T,alpha.metal");
    ASSERT_EQ(columns.size(), 5);
    EXPECT_EQ(columns[0], "x");
    EXPECT_EQ(columns[2], "z");
    EXPECT_EQ(columns[3], "T");
    EXPECT_EQ(columns[4], "alpha.metal");
    // Coordinates must come first, in order
    EXPECT_THROW(checkForCoordinateHeader("x,z,y,T"), std::runtime_error);
    EXPECT_THROW(checkForCoordinateHeader("x,y"), std::runtime_error);
}

//---------------------------------------------------------------------------//
// snapshot_name_tests
//---------------------------------------------------------------------------//
void testParseSnapshotTime() {

    double time = -1.0;
    // Exponent notation, as written by the melt pool solver
    EXPECT_TRUE(parseSnapshotTime("VTK/data-1.25e-05.vtk", time));
    EXPECT_DOUBLE_EQ(time, 1.25e-05);
    EXPECT_TRUE(parseSnapshotTime("T_2.5E-4.csv", time));
    EXPECT_DOUBLE_EQ(time, 2.5e-04);
    EXPECT_TRUE(parseSnapshotTime("case2_3.0e+00.vtk", time));
    EXPECT_DOUBLE_EQ(time, 3.0);
    // Plain decimals
    EXPECT_TRUE(parseSnapshotTime("data-0.000012500000.vtk", time));
    EXPECT_DOUBLE_EQ(time, 1.25e-05);
    EXPECT_TRUE(parseSnapshotTime("/path/to.dir/snapshot_12.csv", time));
    EXPECT_DOUBLE_EQ(time, 12.0);
    // The same time written two ways has the same canonical value
    double time_exponent, time_decimal;
    parseSnapshotTime("data-1.2e-04.vtk", time_exponent);
    parseSnapshotTime("data-0.000120000000.vtk", time_decimal);
    EXPECT_EQ(time_exponent, time_decimal);
    EXPECT_EQ(canonicalTimeString(time_exponent), "0.00012");
    // Very small times stay distinct from each other and from zero
    double time_small_1, time_small_2;
    EXPECT_TRUE(parseSnapshotTime("T_1e-13.vtk", time_small_1));
    EXPECT_TRUE(parseSnapshotTime("T_4e-13.vtk", time_small_2));
    EXPECT_EQ(time_small_1, 1e-13);
    EXPECT_EQ(time_small_2, 4e-13);
    EXPECT_LT(time_small_1, time_small_2);
    EXPECT_EQ(canonicalTimeString(time_small_1), "1e-13");
    // All written digits are kept
    EXPECT_TRUE(parseSnapshotTime("data-1.23456789e-05.vtk", time));
    EXPECT_EQ(time, 1.23456789e-05);
    EXPECT_EQ(std::stod(canonicalTimeString(time)), 1.23456789e-05);
    // Very large times are not truncated
    EXPECT_TRUE(parseSnapshotTime("step_1e70.vtk", time));
    EXPECT_EQ(time, 1e70);
    EXPECT_EQ(canonicalTimeString(time), "1e+70");
    EXPECT_EQ(std::stod(canonicalTimeString(0.1 + 0.2)), 0.1 + 0.2);
    // Out of the range of a double
    EXPECT_FALSE(parseSnapshotTime("step_1e400.vtk", time));
    // No time at the end of the name
    EXPECT_FALSE(parseSnapshotTime("README.vtk", time));
    EXPECT_FALSE(parseSnapshotTime("data-1.5e-05_final.vtk", time));
}

void testFileNames() {

    EXPECT_EQ(getFileExtension("VTK/data-1.5e-05.VTK"), ".vtk");
    EXPECT_EQ(getFileExtension("path.with.dots/file"), "");
    EXPECT_EQ(getFileStem("path/output_results_remapped.csv"), "output_results_remapped");
    EXPECT_TRUE(checkBinaryOutputFormat("TestData.catemp"));
    EXPECT_FALSE(checkBinaryOutputFormat("TestData.csv"));
}

//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, file_read_tests) {
    // test ASCII and binary read/write
    testReadWrite(true);
    testReadWrite(false);
}
TEST(TEST_CATEGORY, string_parse_tests) {
    testSplitString();
    testCoordinateHeader();
}
TEST(TEST_CATEGORY, snapshot_name_tests) {
    testParseSnapshotTime();
    testFileNames();
}
} // end namespace Test
