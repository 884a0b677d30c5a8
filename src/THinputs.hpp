// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_INPUTS_HPP
#define THERMALHISTORY_INPUTS_HPP

#include "THerrors.hpp"
#include "THgrid.hpp"
#include "THinfo.hpp"
#include "THinputdata.hpp"
#include "THtimers.hpp"
#include "THtypes.hpp"

#include "mpi.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

// Error if a required input is not present in the given section of the input file
inline void checkRequiredInput(const nlohmann::json &input_data, const std::string section, const std::string key) {
    if (!input_data.contains(section))
        throw InputError("Inputs", "required section \"" + section + "\" not found in input file");
    if (!input_data.at(section).contains(key))
        throw InputError("Inputs", "required input \"" + key + "\" not found in \"" + section + "\"");
}

struct Inputs {

    SnapshotInputs snapshots;
    DomainInputs domain;
    ResampleInputs resample;
    MaterialInputs material;
    ThermalHistoryInputs thermal_history;
    RemapInputs remap;
    PrintInputs print;
    std::string file_name;

    // Creates input struct with uninitialized/default values, used in unit tests
    Inputs(){};

    Inputs(const int id, const std::string input_file)
        : file_name(input_file) {

        // Open and read JSON input file
        std::ifstream input_data_stream(input_file);
        if (!input_data_stream.is_open())
            throw InputError("Inputs", "could not open input file \"" + input_file + "\"");
        try {
            nlohmann::json input_data = nlohmann::json::parse(input_data_stream);
            parseInputs(id, input_data);
        }
        catch (const nlohmann::json::exception &error) {
            throw InputError("Inputs", "could not read \"" + input_file + "\": " + error.what());
        }
        if (id == 0)
            std::cout << "Parsed input file \"" << input_file << "\"" << std::endl;
    }

    void parseInputs(const int id, const nlohmann::json &input_data) {

        // Snapshot inputs:
        checkRequiredInput(input_data, "Snapshots", "Directory");
        const nlohmann::json &snapshot_data = input_data["Snapshots"];
        snapshots.directory = snapshot_data["Directory"];
        if (snapshot_data.contains("TemperatureField"))
            snapshots.temperature_field = snapshot_data["TemperatureField"];
        if (snapshot_data.contains("FieldNames"))
            snapshots.field_names = snapshot_data["FieldNames"].get<std::vector<std::string>>();
        if (snapshot_data.contains("TimeScale"))
            snapshots.time_scale = snapshot_data["TimeScale"];
        if (!(snapshots.time_scale > 0.0))
            throw InputError("Inputs", "\"TimeScale\" must be positive");
        if (snapshot_data.contains("Stride"))
            snapshots.stride = snapshot_data["Stride"];
        if (snapshots.stride < 1)
            throw InputError("Inputs", "\"Stride\" must be at least 1");
        if (snapshot_data.contains("MaskField")) {
            snapshots.use_mask = true;
            snapshots.mask_field = snapshot_data["MaskField"];
            if (snapshot_data.contains("MaskThreshold"))
                snapshots.mask_threshold = snapshot_data["MaskThreshold"];
        }
        else if ((snapshot_data.contains("MaskThreshold")) && (id == 0))
            std::cout << "Note: Input MaskThreshold is unused without MaskField" << std::endl;

        // Domain inputs:
        // Cell size - given in the length unit of the snapshot coordinates
        checkRequiredInput(input_data, "Domain", "CellSize");
        domain.cell_size = input_data["Domain"]["CellSize"];
        if (input_data["Domain"].contains("DomainBounds")) {
            std::vector<double> bounds = input_data["Domain"]["DomainBounds"].get<std::vector<double>>();
            if (bounds.size() != 6)
                throw InputError("Inputs", "\"DomainBounds\" must contain 6 values: x_min, x_max, y_min, y_max, "
                                           "z_min, z_max");
            domain.use_fixed_bounds = true;
            for (int n = 0; n < 6; n++)
                domain.bounds[n] = bounds[n];
        }

        // Resampling inputs:
        if (input_data.contains("Resampling")) {
            const nlohmann::json &resample_data = input_data["Resampling"];
            if (resample_data.contains("SearchRadius")) {
                resample.search_radius_given = true;
                resample.search_radius = resample_data["SearchRadius"];
            }
            if (resample_data.contains("Interpolation"))
                resample.interpolation = getInterpolationType(resample_data["Interpolation"]);
            if (resample_data.contains("InverseDistancePower")) {
                resample.inverse_distance_power = resample_data["InverseDistancePower"];
                if (!(resample.inverse_distance_power > 0.0))
                    throw InputError("Inputs", "\"InverseDistancePower\" must be positive");
                if ((resample.interpolation == ResampleInputs::nearest) && (id == 0))
                    std::cout << "Note: Input InverseDistancePower is unused with Nearest interpolation" << std::endl;
            }
        }

        // Material inputs:
        checkRequiredInput(input_data, "Material", "LiquidusTemperature");
        checkRequiredInput(input_data, "Material", "SolidusTemperature");
        material.liquidus_temperature = input_data["Material"]["LiquidusTemperature"];
        material.solidus_temperature = input_data["Material"]["SolidusTemperature"];
        if (material.liquidus_temperature < material.solidus_temperature)
            throw InputError("Inputs", "\"LiquidusTemperature\" must not be below \"SolidusTemperature\"");

        // Thermal history inputs:
        if (input_data.contains("ThermalHistory")) {
            if (input_data["ThermalHistory"].contains("CoolingRateMagnitude"))
                thermal_history.cooling_rate_magnitude = input_data["ThermalHistory"]["CoolingRateMagnitude"];
            if (input_data["ThermalHistory"].contains("InterpolateMeltingTime"))
                thermal_history.interpolate_melting_time = input_data["ThermalHistory"]["InterpolateMeltingTime"];
        }

        // Remap inputs: missing transform parameters are reported by the Remapper
        if (input_data.contains("Remap")) {
            const nlohmann::json &remap_data = input_data["Remap"];
            if (remap_data.contains("CoordinateOffset")) {
                std::vector<double> offset = remap_data["CoordinateOffset"].get<std::vector<double>>();
                if (offset.size() != 3)
                    throw SchemaMismatch("\"CoordinateOffset\" must contain 3 values");
                remap.coordinate_offset_given = true;
                for (int a = 0; a < 3; a++)
                    remap.coordinate_offset[a] = offset[a];
            }
            if (remap_data.contains("UnitScale")) {
                remap.unit_scale_given = true;
                remap.unit_scale = remap_data["UnitScale"];
            }
            if (remap_data.contains("AxisOrder")) {
                std::vector<std::string> axis_order = remap_data["AxisOrder"].get<std::vector<std::string>>();
                if (axis_order.size() != 3)
                    throw SchemaMismatch("\"AxisOrder\" must contain 3 values");
                for (int a = 0; a < 3; a++)
                    remap.axis_order[a] = getAxisIndex(axis_order[a]);
            }
            if (remap_data.contains("HeaderStyle"))
                remap.header_style = getHeaderStyle(remap_data["HeaderStyle"]);
        }

        // Printing inputs:
        checkRequiredInput(input_data, "Printing", "OutputFile");
        const nlohmann::json &print_data = input_data["Printing"];
        print.output_file = print_data["OutputFile"];
        if (print_data.contains("PathToOutput")) {
            print.path_to_output = print_data["PathToOutput"];
            if ((!print.path_to_output.empty()) && (print.path_to_output.back() != '/'))
                print.path_to_output += "/";
        }
        if (print_data.contains("PrintResampledSnapshots"))
            print.print_resampled_snapshots = print_data["PrintResampledSnapshots"];
        if (print_data.contains("PrintResultsVTK"))
            print.print_results_vtk = print_data["PrintResultsVTK"];
        if (print_data.contains("PrintBinary"))
            print.print_binary = print_data["PrintBinary"];
    }

    // Print a log file for this run in json format, on rank 0
    void printThermalHistoryLog(const int id, const int np, const std::string log_filename, const Grid &grid,
                                Timers timers, const HistorySummary &summary,
                                const std::vector<std::string> &snapshot_paths) const {

        std::vector<int> num_points_local_allranks(np);
        std::vector<int> point_offset_allranks(np);
        MPI_Gather(&grid.num_points_local, 1, MPI_INT, num_points_local_allranks.data(), 1, MPI_INT, 0,
                   MPI_COMM_WORLD);
        MPI_Gather(&grid.point_offset, 1, MPI_INT, point_offset_allranks.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);

        if (id == 0) {
            std::cout << "Printing ThermalHistory log file" << std::endl;
            std::ofstream log;
            log.open(log_filename);
            log << "{" << std::endl;
            log << "   \"ThermalHistoryVersion\": \"" << version() << "\", " << std::endl;
            log << "   \"ThermalHistoryCommitHash\": \"" << gitCommitHash() << "\", " << std::endl;
            log << "   \"KokkosVersion\": \"" << kokkosVersion() << "\", " << std::endl;
            log << "   \"InputFile\": \"" << file_name << "\", " << std::endl;
            log << "   \"Snapshots\": {" << std::endl;
            log << "      \"Directory\": \"" << snapshots.directory << "\"," << std::endl;
            log << "      \"TemperatureField\": \"" << snapshots.temperature_field << "\"," << std::endl;
            log << "      \"TimeScale\": " << snapshots.time_scale << "," << std::endl;
            log << "      \"Stride\": " << snapshots.stride << "," << std::endl;
            if (snapshots.use_mask) {
                log << "      \"MaskField\": \"" << snapshots.mask_field << "\"," << std::endl;
                log << "      \"MaskThreshold\": " << snapshots.mask_threshold << "," << std::endl;
            }
            log << "      \"Files\": [";
            for (std::size_t n = 0; n < snapshot_paths.size(); n++)
                log << "\"" << snapshot_paths[n] << "\"" << ((n == snapshot_paths.size() - 1) ? "" : ", ");
            log << "]" << std::endl;
            log << "   }," << std::endl;
            log << "   \"Domain\": {" << std::endl;
            log << "      \"Nx\": " << grid.nx << "," << std::endl;
            log << "      \"Ny\": " << grid.ny << "," << std::endl;
            log << "      \"Nz\": " << grid.nz << "," << std::endl;
            log << "      \"CellSize\": " << grid.deltax << "," << std::endl;
            log << "      \"XBounds\": [" << grid.x_min << "," << grid.x_max << "]," << std::endl;
            log << "      \"YBounds\": [" << grid.y_min << "," << grid.y_max << "]," << std::endl;
            log << "      \"ZBounds\": [" << grid.z_min << "," << grid.z_max << "]" << std::endl;
            log << "   }," << std::endl;
            log << "   \"Resampling\": {" << std::endl;
            log << "      \"Interpolation\": \""
                << ((resample.interpolation == ResampleInputs::nearest) ? "Nearest" : "InverseDistance") << "\","
                << std::endl;
            log << "      \"SearchRadius\": " << (resample.search_radius_given ? resample.search_radius : grid.deltax)
                << std::endl;
            log << "   }," << std::endl;
            log << "   \"Material\": {" << std::endl;
            log << "      \"LiquidusTemperature\": " << material.liquidus_temperature << "," << std::endl;
            log << "      \"SolidusTemperature\": " << material.solidus_temperature << std::endl;
            log << "   }," << std::endl;
            log << "   \"ThermalHistory\": {" << std::endl;
            log << "      \"GridPoints\": " << summary.num_points << "," << std::endl;
            log << "      \"Solidified\": " << summary.solidified << "," << std::endl;
            log << "      \"Remelted\": " << summary.remelted << "," << std::endl;
            log << "      \"NotMelted\": " << summary.not_melted << "," << std::endl;
            log << "      \"IncompleteSolidification\": " << summary.incomplete_solidification << "," << std::endl;
            log << "      \"NoData\": " << summary.no_data << "," << std::endl;
            log << "      \"Masked\": " << summary.masked << "," << std::endl;
            log << "      \"MinMaxMeanCoolingRate\": [" << summary.min_cooling_rate << "," << summary.max_cooling_rate
                << "," << summary.mean_cooling_rate << "]," << std::endl;
            log << "      \"MedianCoolingRate\": " << summary.median_cooling_rate << "," << std::endl;
            log << "      \"MeltingTimeRange\": [" << summary.min_melting_time << "," << summary.max_melting_time
                << "]," << std::endl;
            log << "      \"SolidificationTimeRange\": [" << summary.min_solidification_time << ","
                << summary.max_solidification_time << "]" << std::endl;
            log << "   }," << std::endl;
            log << "   \"Remap\": {" << std::endl;
            log << "      \"CoordinateOffset\": [" << remap.coordinate_offset[0] << "," << remap.coordinate_offset[1]
                << "," << remap.coordinate_offset[2] << "]," << std::endl;
            log << "      \"UnitScale\": " << remap.unit_scale << "," << std::endl;
            log << "      \"AxisOrder\": [" << remap.axis_order[0] << "," << remap.axis_order[1] << ","
                << remap.axis_order[2] << "]" << std::endl;
            log << "   }," << std::endl;
            log << "   \"NumberMPIRanks\": " << np << "," << std::endl;
            log << "   \"Decomposition\": {" << std::endl;
            log << "       \"NumPointsLocal\": [";
            for (int i = 0; i < np - 1; i++)
                log << num_points_local_allranks[i] << ",";
            log << num_points_local_allranks[np - 1] << "]," << std::endl;
            log << "       \"PointOffset\": [";
            for (int i = 0; i < np - 1; i++)
                log << point_offset_allranks[i] << ",";
            log << point_offset_allranks[np - 1] << "]" << std::endl;
            log << "   }," << std::endl;
            log << timers.printLog() << std::endl;
            log << "}" << std::endl;
            log.close();
        }
    }
};

#endif
