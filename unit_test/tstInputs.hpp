// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include <Kokkos_Core.hpp>

#include "THinputs.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Write an input file with all required inputs, and optionally all optional inputs. "replace" is written in place of
// the Remap section, if given
void writeTestData(std::string input_filename, bool optional_inputs, std::string remap_section = "") {

    std::ofstream test_data_file;
    test_data_file.open(input_filename);
    test_data_file << "{" << std::endl;
    test_data_file << "   \"Snapshots\": {" << std::endl;
    test_data_file << "      \"Directory\": \"VTK\"";
    if (optional_inputs) {
        test_data_file << "," << std::endl;
        test_data_file << "      \"TemperatureField\": \"temperature\"," << std::endl;
        test_data_file << "      \"FieldNames\": [\"alpha.metal\", \"temperature\", \"p\"]," << std::endl;
        test_data_file << "      \"TimeScale\": 0.001," << std::endl;
        test_data_file << "      \"Stride\": 3," << std::endl;
        test_data_file << "      \"MaskField\": \"alpha.metal\"," << std::endl;
        test_data_file << "      \"MaskThreshold\": 0.25" << std::endl;
    }
    else
        test_data_file << std::endl;
    test_data_file << "   }," << std::endl;
    test_data_file << "   \"Domain\": {" << std::endl;
    test_data_file << "      \"CellSize\": 2.5e-06";
    if (optional_inputs) {
        test_data_file << "," << std::endl;
        test_data_file << "      \"DomainBounds\": [0.0, 0.001, -0.0005, 0.0005, -0.0002, 0.0]" << std::endl;
    }
    else
        test_data_file << std::endl;
    test_data_file << "   }," << std::endl;
    if (optional_inputs) {
        test_data_file << "   \"Resampling\": {" << std::endl;
        test_data_file << "      \"SearchRadius\": 5.0e-06," << std::endl;
        test_data_file << "      \"Interpolation\": \"InverseDistance\"," << std::endl;
        test_data_file << "      \"InverseDistancePower\": 3" << std::endl;
        test_data_file << "   }," << std::endl;
        test_data_file << "   \"ThermalHistory\": {" << std::endl;
        test_data_file << "      \"CoolingRateMagnitude\": true," << std::endl;
        test_data_file << "      \"InterpolateMeltingTime\": true" << std::endl;
        test_data_file << "   }," << std::endl;
    }
    test_data_file << "   \"Material\": {" << std::endl;
    test_data_file << "      \"LiquidusTemperature\": 1623," << std::endl;
    test_data_file << "      \"SolidusTemperature\": 1563" << std::endl;
    test_data_file << "   }," << std::endl;
    if (!remap_section.empty())
        test_data_file << remap_section << std::endl;
    else if (optional_inputs) {
        test_data_file << "   \"Remap\": {" << std::endl;
        test_data_file << "      \"CoordinateOffset\": [0.0005, 0.0005, 0.0002]," << std::endl;
        test_data_file << "      \"UnitScale\": 1000," << std::endl;
        test_data_file << "      \"AxisOrder\": [\"y\", \"X\", \"z\"]," << std::endl;
        test_data_file << "      \"HeaderStyle\": \"ExaCA\"" << std::endl;
        test_data_file << "   }," << std::endl;
    }
    test_data_file << "   \"Printing\": {" << std::endl;
    if (optional_inputs) {
        test_data_file << "      \"PathToOutput\": \"THoutput\"," << std::endl;
        test_data_file << "      \"PrintResampledSnapshots\": true," << std::endl;
        test_data_file << "      \"PrintResultsVTK\": true," << std::endl;
        test_data_file << "      \"PrintBinary\": true," << std::endl;
    }
    test_data_file << "      \"OutputFile\": \"TestHistory.csv\"" << std::endl;
    test_data_file << "   }" << std::endl;
    test_data_file << "}" << std::endl;
    test_data_file.close();
}

//---------------------------------------------------------------------------//
// input_parse_tests
//---------------------------------------------------------------------------//
void testInputsRequired() {

    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    std::string input_filename = "TestInputsRequired.json";
    writeTestData(input_filename, false);
    Inputs inputs(id, input_filename);

    EXPECT_EQ(inputs.file_name, input_filename);
    EXPECT_EQ(inputs.snapshots.directory, "VTK");
    // Defaults for everything not given
    EXPECT_EQ(inputs.snapshots.temperature_field, "T");
    EXPECT_TRUE(inputs.snapshots.field_names.empty());
    EXPECT_DOUBLE_EQ(inputs.snapshots.time_scale, 1.0);
    EXPECT_EQ(inputs.snapshots.stride, 1);
    EXPECT_FALSE(inputs.snapshots.use_mask);
    EXPECT_DOUBLE_EQ(inputs.domain.cell_size, 2.5e-06);
    EXPECT_FALSE(inputs.domain.use_fixed_bounds);
    EXPECT_FALSE(inputs.resample.search_radius_given);
    EXPECT_EQ(inputs.resample.interpolation, ResampleInputs::nearest);
    EXPECT_DOUBLE_EQ(inputs.material.liquidus_temperature, 1623.0);
    EXPECT_DOUBLE_EQ(inputs.material.solidus_temperature, 1563.0);
    EXPECT_FALSE(inputs.thermal_history.cooling_rate_magnitude);
    EXPECT_FALSE(inputs.thermal_history.interpolate_melting_time);
    // Transform parameters are only checked when the output table is written
    EXPECT_FALSE(inputs.remap.coordinate_offset_given);
    EXPECT_FALSE(inputs.remap.unit_scale_given);
    EXPECT_EQ(inputs.remap.header_style, RemapInputs::descriptive);
    EXPECT_EQ(inputs.print.path_to_output, "");
    EXPECT_EQ(inputs.print.output_file, "TestHistory.csv");
    EXPECT_FALSE(inputs.print.print_resampled_snapshots);
    EXPECT_FALSE(inputs.print.print_results_vtk);
    EXPECT_FALSE(inputs.print.print_binary);
}

void testInputsOptional() {

    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);
    std::string input_filename = "TestInputsOptional.json";
    writeTestData(input_filename, true);
    Inputs inputs(id, input_filename);

    EXPECT_EQ(inputs.snapshots.temperature_field, "temperature");
    ASSERT_EQ(inputs.snapshots.field_names.size(), 3);
    EXPECT_EQ(inputs.snapshots.field_names[0], "alpha.metal");
    EXPECT_EQ(inputs.snapshots.field_names[2], "p");
    EXPECT_DOUBLE_EQ(inputs.snapshots.time_scale, 0.001);
    EXPECT_EQ(inputs.snapshots.stride, 3);
    EXPECT_TRUE(inputs.snapshots.use_mask);
    EXPECT_EQ(inputs.snapshots.mask_field, "alpha.metal");
    EXPECT_DOUBLE_EQ(inputs.snapshots.mask_threshold, 0.25);
    EXPECT_TRUE(inputs.domain.use_fixed_bounds);
    std::vector<double> expected_bounds = {0.0, 0.001, -0.0005, 0.0005, -0.0002, 0.0};
    for (int n = 0; n < 6; n++)
        EXPECT_DOUBLE_EQ(inputs.domain.bounds[n], expected_bounds[n]);
    EXPECT_TRUE(inputs.resample.search_radius_given);
    EXPECT_DOUBLE_EQ(inputs.resample.search_radius, 5.0e-06);
    EXPECT_EQ(inputs.resample.interpolation, ResampleInputs::inverse_distance);
    EXPECT_DOUBLE_EQ(inputs.resample.inverse_distance_power, 3.0);
    EXPECT_TRUE(inputs.thermal_history.cooling_rate_magnitude);
    EXPECT_TRUE(inputs.thermal_history.interpolate_melting_time);
    EXPECT_TRUE(inputs.remap.coordinate_offset_given);
    EXPECT_DOUBLE_EQ(inputs.remap.coordinate_offset[0], 0.0005);
    EXPECT_DOUBLE_EQ(inputs.remap.coordinate_offset[2], 0.0002);
    EXPECT_TRUE(inputs.remap.unit_scale_given);
    EXPECT_DOUBLE_EQ(inputs.remap.unit_scale, 1000.0);
    EXPECT_EQ(inputs.remap.axis_order[0], 1);
    EXPECT_EQ(inputs.remap.axis_order[1], 0);
    EXPECT_EQ(inputs.remap.axis_order[2], 2);
    EXPECT_EQ(inputs.remap.header_style, RemapInputs::exaca);
    // Separator added to the output path
    EXPECT_EQ(inputs.print.path_to_output, "THoutput/");
    EXPECT_TRUE(inputs.print.print_resampled_snapshots);
    EXPECT_TRUE(inputs.print.print_results_vtk);
    EXPECT_TRUE(inputs.print.print_binary);
}

void testInputsInvalid() {

    int id;
    MPI_Comm_rank(MPI_COMM_WORLD, &id);

    // No such file
    EXPECT_THROW(Inputs inputs(id, "TestInputsMissing.json"), InputError);

    // Missing required input
    std::string input_filename = "TestInputsInvalid.json";
    std::ofstream test_data_file(input_filename);
    test_data_file << "{ \"Snapshots\": { \"Directory\": \"VTK\" }, \"Domain\": { \"CellSize\": 1.0 }, "
                      "\"Material\": { \"LiquidusTemperature\": 1623 }, \"Printing\": { \"OutputFile\": \"T.csv\" } }"
                   << std::endl;
    test_data_file.close();
    EXPECT_THROW(Inputs inputs(id, input_filename), InputError);

    // Not valid json
    test_data_file.open(input_filename);
    test_data_file << "{ \"Snapshots\": { \"Directory\": \"VTK\" " << std::endl;
    test_data_file.close();
    EXPECT_THROW(Inputs inputs(id, input_filename), InputError);

    // Liquidus below solidus
    test_data_file.open(input_filename);
    test_data_file << "{ \"Snapshots\": { \"Directory\": \"VTK\" }, \"Domain\": { \"CellSize\": 1.0 }, "
                      "\"Material\": { \"LiquidusTemperature\": 1500, \"SolidusTemperature\": 1600 }, "
                      "\"Printing\": { \"OutputFile\": \"T.csv\" } }"
                   << std::endl;
    test_data_file.close();
    EXPECT_THROW(Inputs inputs(id, input_filename), InputError);

    // Snapshot stride below 1
    test_data_file.open(input_filename);
    test_data_file << "{ \"Snapshots\": { \"Directory\": \"VTK\", \"Stride\": 0 }, \"Domain\": { \"CellSize\": 1.0 }, "
                      "\"Material\": { \"LiquidusTemperature\": 1623, \"SolidusTemperature\": 1563 }, "
                      "\"Printing\": { \"OutputFile\": \"T.csv\" } }"
                   << std::endl;
    test_data_file.close();
    EXPECT_THROW(Inputs inputs(id, input_filename), InputError);

    // Unknown interpolation type
    test_data_file.open(input_filename);
    test_data_file << "{ \"Snapshots\": { \"Directory\": \"VTK\" }, \"Domain\": { \"CellSize\": 1.0 }, "
                      "\"Resampling\": { \"Interpolation\": \"Linear\" }, "
                      "\"Material\": { \"LiquidusTemperature\": 1623, \"SolidusTemperature\": 1563 }, "
                      "\"Printing\": { \"OutputFile\": \"T.csv\" } }"
                   << std::endl;
    test_data_file.close();
    EXPECT_THROW(Inputs inputs(id, input_filename), InputError);

    // Invalid transform parameters are schema errors
    writeTestData(input_filename, false,
                  "   \"Remap\": { \"CoordinateOffset\": [0, 0, 0], \"UnitScale\": 1, \"AxisOrder\": [\"x\", \"w\", "
                  "\"z\"] },");
    EXPECT_THROW(Inputs inputs(id, input_filename), SchemaMismatch);
    writeTestData(input_filename, false, "   \"Remap\": { \"CoordinateOffset\": [0, 0], \"UnitScale\": 1 },");
    EXPECT_THROW(Inputs inputs(id, input_filename), SchemaMismatch);
}

void testInputEnums() {

    EXPECT_EQ(getInterpolationType("Nearest"), ResampleInputs::nearest);
    EXPECT_EQ(getInterpolationType("InverseDistance"), ResampleInputs::inverse_distance);
    EXPECT_THROW(getInterpolationType("nearest"), InputError);
    EXPECT_EQ(getHeaderStyle("Descriptive"), RemapInputs::descriptive);
    EXPECT_EQ(getHeaderStyle("ExaCA"), RemapInputs::exaca);
    EXPECT_THROW(getHeaderStyle("Short"), InputError);
    EXPECT_EQ(getAxisIndex("x"), 0);
    EXPECT_EQ(getAxisIndex("Y"), 1);
    EXPECT_EQ(getAxisIndex("z"), 2);
    EXPECT_THROW(getAxisIndex("r"), SchemaMismatch);
}

//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, input_parse_tests) {
    testInputsRequired();
    testInputsOptional();
    testInputsInvalid();
    testInputEnums();
}
} // end namespace Test
