// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "THremap.hpp"

#include "THparsefiles.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

// Both the coordinate offset and the unit scale must be given explicitly, even if they leave the coordinates unchanged
Remapper::Remapper(RemapInputs inputs)
    : _inputs(inputs) {

    if (!_inputs.coordinate_offset_given)
        throw SchemaMismatch("required input \"CoordinateOffset\" not found in \"Remap\"");
    if (!_inputs.unit_scale_given)
        throw SchemaMismatch("required input \"UnitScale\" not found in \"Remap\"");
    if (!(_inputs.unit_scale > 0.0) || !std::isfinite(_inputs.unit_scale))
        throw SchemaMismatch("\"UnitScale\" must be a positive number, got " + std::to_string(_inputs.unit_scale));
    for (int a = 0; a < 3; a++) {
        if (!std::isfinite(_inputs.coordinate_offset[a]))
            throw SchemaMismatch("\"CoordinateOffset\" values must be finite");
    }
    bool axis_used[3] = {false, false, false};
    for (int a = 0; a < 3; a++) {
        int axis = _inputs.axis_order[a];
        if ((axis < 0) || (axis > 2) || (axis_used[axis]))
            throw SchemaMismatch("\"AxisOrder\" must list each of x, y, and z once");
        axis_used[axis] = true;
    }
}

// Output coordinate a is input coordinate axis_order[a], shifted by the offset and then scaled
std::array<double, 3> Remapper::transformCoordinates(const std::array<double, 3> coordinates) const {
    std::array<double, 3> transformed;
    for (int a = 0; a < 3; a++)
        transformed[a] = (coordinates[_inputs.axis_order[a]] + _inputs.coordinate_offset[a]) * _inputs.unit_scale;
    return transformed;
}

// Transform the coordinates of each row in place. Row order and the melting time, solidification time, and cooling
// rate columns are unchanged
void Remapper::remapRows(std::vector<double> &rows) const {
    std::size_t num_rows = rows.size() / num_columns;
    for (std::size_t row = 0; row < num_rows; row++) {
        std::array<double, 3> coordinates = {rows[num_columns * row], rows[num_columns * row + 1],
                                             rows[num_columns * row + 2]};
        std::array<double, 3> transformed = transformCoordinates(coordinates);
        for (int a = 0; a < 3; a++)
            rows[num_columns * row + a] = transformed[a];
    }
}

std::vector<std::string> Remapper::getColumnNames() const {
    if (_inputs.header_style == RemapInputs::exaca)
        return {"x", "y", "z", "tm", "ts", "cr"};
    else
        return {"x", "y", "z", "melting_time", "solidification_time", "cooling_rate"};
}

// Write the table as comma-separated values with a header line, or, for a .catemp file, as binary doubles without a
// header. The table is written to a temporary file that replaces any existing file only once it is complete
void Remapper::writeTable(const std::string filename, const std::vector<double> &rows) const {

    bool binary_output = checkBinaryOutputFormat(filename);
    std::string temporary_filename = filename + ".tmp";
    std::ofstream table;
    if (binary_output)
        table.open(temporary_filename, std::ios::out | std::ios::binary);
    else
        table.open(temporary_filename);
    if (!table.is_open())
        throw ThermalHistoryError("Remapper", "could not open \"" + temporary_filename + "\" for writing");

    std::size_t num_rows = rows.size() / num_columns;
    if (binary_output) {
        table.write(reinterpret_cast<const char *>(rows.data()), rows.size() * sizeof(double));
    }
    else {
        std::vector<std::string> column_names = getColumnNames();
        for (int n = 0; n < num_columns; n++)
            table << column_names[n] << ((n == num_columns - 1) ? "\n" : ",");
        table << std::setprecision(15);
        for (std::size_t row = 0; row < num_rows; row++) {
            for (int n = 0; n < num_columns; n++)
                table << rows[num_columns * row + n] << ((n == num_columns - 1) ? "\n" : ",");
        }
    }
    table.close();
    if (!table) {
        std::filesystem::remove(temporary_filename);
        throw ThermalHistoryError("Remapper", "error while writing \"" + temporary_filename + "\"");
    }
    std::filesystem::rename(temporary_filename, filename);
    std::cout << "Wrote " << num_rows << " rows to \"" << filename << "\"" << std::endl;
}
