// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_INPUTDATA_HPP
#define THERMALHISTORY_INPUTDATA_HPP

#include "THerrors.hpp"

#include <array>
#include <string>
#include <vector>

// Structs to organize data within inputs struct
struct SnapshotInputs {
    // Directory containing the snapshot files (.vtk or .csv)
    std::string directory = "";
    // Name of the temperature field in the snapshot files
    std::string temperature_field = "T";
    // Additional scalar fields to resample onto the grid
    std::vector<std::string> field_names;
    // Multiplies the time parsed from each filename
    double time_scale = 1.0;
    // Only every stride-th snapshot in time order is used, starting with the first
    int stride = 1;
    // Optional field used to exclude grid points from the output (i.e., metal volume fraction)
    bool use_mask = false;
    std::string mask_field = "";
    double mask_threshold = 0.5;
};

struct DomainInputs {
    // Grid spacing, in the length unit of the snapshot coordinates
    double cell_size = 0.0;
    // If false, bounds are the union of the bounds of all snapshots
    bool use_fixed_bounds = false;
    // x_min, x_max, y_min, y_max, z_min, z_max
    std::array<double, 6> bounds = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
};

struct ResampleInputs {
    // If not given, the cell size is used
    bool search_radius_given = false;
    double search_radius = 0.0;
    enum InterpolationTypes {
        nearest = 0,
        inverse_distance = 1,
    };
    int interpolation = nearest;
    double inverse_distance_power = 2.0;
};

struct MaterialInputs {
    double liquidus_temperature = 0.0;
    double solidus_temperature = 0.0;
};

struct ThermalHistoryInputs {
    // Report the cooling rate as a positive number
    bool cooling_rate_magnitude = false;
    // Interpolate the melting time between the samples bracketing the liquidus crossing
    bool interpolate_melting_time = false;
};

struct RemapInputs {
    // Both the offset and the unit scale are required to write the output table
    bool coordinate_offset_given = false;
    std::array<double, 3> coordinate_offset = {0.0, 0.0, 0.0};
    bool unit_scale_given = false;
    double unit_scale = 1.0;
    // Input axis used for each output axis
    std::array<int, 3> axis_order = {0, 1, 2};
    enum HeaderStyles {
        descriptive = 0,
        exaca = 1,
    };
    int header_style = descriptive;
};

struct PrintInputs {
    // Path to and name of the output thermal history table
    std::string path_to_output = "";
    std::string output_file = "";
    // Resampled grid data for each snapshot
    bool print_resampled_snapshots = false;
    // Point cloud of the final table
    bool print_results_vtk = false;
    // Binary (big endian) VTK output
    bool print_binary = false;
};

// Error if this is not a valid interpolation type, otherwise return the enum value
inline int getInterpolationType(std::string interpolation) {
    if (interpolation == "Nearest")
        return ResampleInputs::nearest;
    else if (interpolation == "InverseDistance")
        return ResampleInputs::inverse_distance;
    else
        throw InputError("Inputs", "unknown interpolation type \"" + interpolation +
                                       "\", valid options are \"Nearest\" and \"InverseDistance\"");
}

// Error if this is not a valid output header style, otherwise return the enum value
inline int getHeaderStyle(std::string header_style) {
    if (header_style == "Descriptive")
        return RemapInputs::descriptive;
    else if (header_style == "ExaCA")
        return RemapInputs::exaca;
    else
        throw InputError("Inputs", "unknown header style \"" + header_style +
                                       "\", valid options are \"Descriptive\" and \"ExaCA\"");
}

// Convert an axis label to its index
inline int getAxisIndex(std::string axis) {
    if ((axis == "x") || (axis == "X"))
        return 0;
    else if ((axis == "y") || (axis == "Y"))
        return 1;
    else if ((axis == "z") || (axis == "Z"))
        return 2;
    else
        throw SchemaMismatch("unknown axis \"" + axis + "\" in AxisOrder, valid options are \"x\", \"y\", \"z\"");
}

#endif
