// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "runTH.hpp"

#include <gtest/gtest.h>

#include "mpi.h"

#include <nlohmann/json.hpp>

#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Snapshots at times 0, 1, and 2 of two points: the point at the origin melts and solidifies, the point at x = 1 stays
// at 300 K. Written on rank 0 to a directory unique to the number of ranks, and returns the input file name
std::string writePipelineTestData(const int id, const int np) {

    std::string directory = "TestPipeline_np" + std::to_string(np) + "/";
    std::string snapshot_directory = directory + "snapshots";
    std::string input_filename = directory + "TestPipeline.json";
    if (id == 0) {
        std::filesystem::remove_all(directory);
        std::filesystem::create_directory(directory);
        std::filesystem::create_directory(snapshot_directory);
        std::vector<std::string> snapshot_names = {"data_0.csv", "data_1.0e+00.csv", "data_2.csv"};
        double temperatures[3] = {300.0, 2000.0, 900.0};
        for (int n = 0; n < 3; n++) {
            std::ofstream snapshot_file(snapshot_directory + "/" + snapshot_names[n]);
            snapshot_file << "x,y,z,T,alpha.metal" << std::endl;
            snapshot_file << "0.0,0.0,0.0," << temperatures[n] << ",1.0" << std::endl;
            snapshot_file << "1.0,0.0,0.0,300.0,1.0" << std::endl;
            snapshot_file.close();
        }
        std::ofstream input_file(input_filename);
        input_file << "{" << std::endl;
        input_file << "   \"Snapshots\": {" << std::endl;
        input_file << "      \"Directory\": \"" << snapshot_directory << "\"," << std::endl;
        input_file << "      \"FieldNames\": [\"alpha.metal\"]" << std::endl;
        input_file << "   }," << std::endl;
        input_file << "   \"Domain\": {" << std::endl;
        input_file << "      \"CellSize\": 1.0" << std::endl;
        input_file << "   }," << std::endl;
        input_file << "   \"Material\": {" << std::endl;
        input_file << "      \"LiquidusTemperature\": 1700," << std::endl;
        input_file << "      \"SolidusTemperature\": 1300" << std::endl;
        input_file << "   }," << std::endl;
        input_file << "   \"Remap\": {" << std::endl;
        input_file << "      \"CoordinateOffset\": [0.0, 0.0, 0.0]," << std::endl;
        input_file << "      \"UnitScale\": 1.0," << std::endl;
        input_file << "      \"HeaderStyle\": \"ExaCA\"" << std::endl;
        input_file << "   }," << std::endl;
        input_file << "   \"Printing\": {" << std::endl;
        input_file << "      \"PathToOutput\": \"" << directory << "\"," << std::endl;
        input_file << "      \"OutputFile\": \"TestPipeline.csv\"," << std::endl;
        input_file << "      \"PrintResampledSnapshots\": true," << std::endl;
        input_file << "      \"PrintResultsVTK\": true" << std::endl;
        input_file << "   }" << std::endl;
        input_file << "}" << std::endl;
        input_file.close();
    }
    MPI_Barrier(MPI_COMM_WORLD);
    return input_filename;
}

// Rows of the output table, without the header
std::vector<std::vector<double>> readOutputTable(const std::string filename, std::string &header) {
    std::ifstream table(filename);
    std::getline(table, header);
    std::vector<std::vector<double>> rows;
    std::vector<std::string> parsed_line(6);
    std::string line;
    while (std::getline(table, line)) {
        splitString(line, parsed_line, 6);
        std::vector<double> row(6);
        for (int n = 0; n < 6; n++)
            row[n] = getInputDouble(parsed_line[n]);
        rows.push_back(row);
    }
    return rows;
}

//---------------------------------------------------------------------------//
// pipeline_tests
//---------------------------------------------------------------------------//
void testPipeline() {

    using memory_space = TEST_MEMSPACE;
    int id, np;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    MPI_Comm_size(MPI_COMM_WORLD, &np);

    std::string input_filename = writePipelineTestData(id, np);
    Inputs inputs(id, input_filename);
    Timers timers(id);
    HistorySummary summary = runThermalHistory<memory_space>(id, np, inputs, timers);
    EXPECT_EQ(summary.num_points, 2);
    EXPECT_EQ(summary.solidified, 1);
    EXPECT_EQ(summary.not_melted, 1);
    EXPECT_EQ(summary.no_data, 0);
    EXPECT_DOUBLE_EQ(summary.mean_cooling_rate, -1100.0);
    EXPECT_DOUBLE_EQ(summary.median_cooling_rate, -1100.0);
    EXPECT_DOUBLE_EQ(summary.min_melting_time, 1.0);
    EXPECT_DOUBLE_EQ(summary.max_melting_time, 1.0);
    EXPECT_NEAR(summary.min_solidification_time, 2.0 - 400.0 / 1100.0, 1.0e-12);
    EXPECT_NEAR(summary.max_solidification_time, 2.0 - 400.0 / 1100.0, 1.0e-12);

    if (id == 0) {
        Print print(inputs.print);
        std::string header;
        std::vector<std::vector<double>> rows = readOutputTable(print.getOutputFilename(), header);
        EXPECT_EQ(header, "x,y,z,tm,ts,cr");
        // The point that never melted is not in the table
        ASSERT_EQ(rows.size(), 1);
        EXPECT_DOUBLE_EQ(rows[0][0], 0.0);
        EXPECT_DOUBLE_EQ(rows[0][1], 0.0);
        EXPECT_DOUBLE_EQ(rows[0][2], 0.0);
        EXPECT_DOUBLE_EQ(rows[0][3], 1.0);
        EXPECT_NEAR(rows[0][4], 2.0 - 400.0 / 1100.0, 1.0e-12);
        EXPECT_GT(rows[0][4], rows[0][3]);
        EXPECT_LT(rows[0][4], 2.0);
        EXPECT_DOUBLE_EQ(rows[0][5], -1100.0);
        EXPECT_FALSE(std::filesystem::exists(print.getOutputFilename() + ".tmp"));

        // Optional output files
        EXPECT_TRUE(std::filesystem::exists(print.getResultsVTKFilename()));
        for (double time : {0.0, 1.0, 2.0})
            EXPECT_TRUE(std::filesystem::exists(print.getResampledFilename(time)));

        // Log is valid json
        std::ifstream log_stream(print.getLogFilename());
        nlohmann::json log_data = nlohmann::json::parse(log_stream);
        EXPECT_EQ(log_data["ThermalHistory"]["Solidified"], 1);
        EXPECT_EQ(log_data["ThermalHistory"]["NotMelted"], 1);
        EXPECT_EQ(log_data["Domain"]["Nx"], 2);
        EXPECT_EQ(log_data["Snapshots"]["Files"].size(), 3);
        EXPECT_DOUBLE_EQ(log_data["ThermalHistory"]["MedianCoolingRate"], -1100.0);
        EXPECT_DOUBLE_EQ(log_data["ThermalHistory"]["MeltingTimeRange"][0], 1.0);
        EXPECT_EQ(log_data["ThermalHistory"]["SolidificationTimeRange"].size(), 2);
        EXPECT_EQ(log_data["NumberMPIRanks"], np);
    }
    MPI_Barrier(MPI_COMM_WORLD);

    // Same data excluded by the mask: header only
    inputs.snapshots.use_mask = true;
    inputs.snapshots.mask_field = "alpha.metal";
    inputs.snapshots.mask_threshold = 1.5;
    inputs.print.print_resampled_snapshots = false;
    inputs.print.print_results_vtk = false;
    inputs.print.output_file = "TestPipelineMasked.csv";
    summary = runThermalHistory<memory_space>(id, np, inputs, timers);
    EXPECT_EQ(summary.solidified, 0);
    EXPECT_EQ(summary.masked, 2);
    if (id == 0) {
        Print print(inputs.print);
        std::string header;
        std::vector<std::vector<double>> rows = readOutputTable(print.getOutputFilename(), header);
        EXPECT_EQ(header, "x,y,z,tm,ts,cr");
        EXPECT_EQ(rows.size(), 0);
    }
    MPI_Barrier(MPI_COMM_WORLD);
}

// Runs that stop before writing any output
void testPipelineFailures() {

    using memory_space = TEST_MEMSPACE;
    int id, np;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    MPI_Comm_size(MPI_COMM_WORLD, &np);

    std::string input_filename = writePipelineTestData(id, np);
    Inputs inputs(id, input_filename);
    inputs.print.output_file = "TestPipelineFailure.csv";
    Print print(inputs.print);
    Timers timers(id);

    // Transform parameters missing
    Inputs inputs_no_scale = inputs;
    inputs_no_scale.remap.unit_scale_given = false;
    EXPECT_THROW(runThermalHistory<memory_space>(id, np, inputs_no_scale, timers), SchemaMismatch);
    EXPECT_FALSE(std::filesystem::exists(print.getOutputFilename()));
    MPI_Barrier(MPI_COMM_WORLD);

    // Single snapshot
    std::string single_directory = "TestPipeline_np" + std::to_string(np) + "/single";
    if (id == 0) {
        std::filesystem::create_directory(single_directory);
        std::filesystem::copy_file(inputs.snapshots.directory + "/data_0.csv", single_directory + "/data_0.csv");
    }
    MPI_Barrier(MPI_COMM_WORLD);
    Inputs inputs_single = inputs;
    inputs_single.snapshots.directory = single_directory;
    EXPECT_THROW(runThermalHistory<memory_space>(id, np, inputs_single, timers), EmptySequence);
    EXPECT_FALSE(std::filesystem::exists(print.getOutputFilename()));
    MPI_Barrier(MPI_COMM_WORLD);

    // Point cloud of the results cannot be written: the table is not written either
    if (id == 0)
        std::filesystem::create_directory(print.getResultsVTKFilename());
    MPI_Barrier(MPI_COMM_WORLD);
    Inputs inputs_vtk = inputs;
    inputs_vtk.print.print_results_vtk = true;
    inputs_vtk.print.print_resampled_snapshots = false;
    EXPECT_THROW(runThermalHistory<memory_space>(id, np, inputs_vtk, timers), ThermalHistoryError);
    EXPECT_FALSE(std::filesystem::exists(print.getOutputFilename()));
    EXPECT_FALSE(std::filesystem::exists(print.getOutputFilename() + ".tmp"));
    MPI_Barrier(MPI_COMM_WORLD);

    // Interrupt received by one rank stops all ranks before the first snapshot
    if (id == 0)
        handleInterruptSignal(SIGINT);
    EXPECT_THROW(runThermalHistory<memory_space>(id, np, inputs, timers), RunInterrupted);
    resetInterrupt();
    EXPECT_FALSE(std::filesystem::exists(print.getOutputFilename()));
    EXPECT_FALSE(checkForInterrupt());
    MPI_Barrier(MPI_COMM_WORLD);
}

//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, pipeline_tests) {
    testPipeline();
    testPipelineFailures();
}
} // end namespace Test
