// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "THparsefiles.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <regex>
#include <stdexcept>

// Functions that are used to simplify the parsing of input and snapshot files

//*****************************************************************************/
// Remove whitespace from "line", optional argument to take only portion of the line after position "pos"
std::string removeWhitespace(std::string line, int pos) {

    std::string val = line.substr(pos + 1, std::string::npos);
    std::regex r("\\s+");
    val = std::regex_replace(val, r, "");
    return val;
}

// Convert string "val_input" to double value multiplied by 10^(factor)
double getInputDouble(std::string val_input, int factor) {
    double DoubleFromString = std::stod(val_input.c_str()) * pow(10, factor);
    return DoubleFromString;
}

// Given a string ("line"), parse at "separator" (commas used by default)
// Modifies "parsed_line" to hold the separated values
// expected_num_values may be larger than parsed_line_size, if only a portion of the line is being parsed
void splitString(const std::string line, std::vector<std::string> &parsed_line, std::size_t expected_num_values,
                 char separator) {
    // Make sure the right number of values are present on the line - one more than the number of separators
    std::size_t actual_num_values = std::count(line.begin(), line.end(), separator) + 1;
    if (expected_num_values != actual_num_values) {
        std::string error = "Error: Expected " + std::to_string(expected_num_values) +
                            " values while reading file; but " + std::to_string(actual_num_values) + " were found";
        throw std::runtime_error(error);
    }
    // Separate the line into its components, now that the number of values has been checked
    std::size_t parsed_line_size = parsed_line.size();
    // Make a copy that we can modify
    std::string line_copy = line;
    for (std::size_t n = 0; n < parsed_line_size - 1; n++) {
        std::size_t pos = line_copy.find(separator);
        parsed_line[n] = line_copy.substr(0, pos);
        line_copy = line_copy.substr(pos + 1, std::string::npos);
    }
    parsed_line[parsed_line_size - 1] = line_copy;
}

// Check that the first three column names of a point table header are x, y, z (case insensitive) and return the
// names of all columns, whitespace removed. Columns after the coordinates are the point fields
std::vector<std::string> checkForCoordinateHeader(std::string header_line) {

    // Header values from file - number of commas plus one is the size of the header
    std::size_t header_size = std::count(header_line.begin(), header_line.end(), ',') + 1;
    std::vector<std::string> header_values(header_size, "");
    splitString(header_line, header_values, header_size);

    std::vector<std::string> expected_values = {"x", "y", "z"};
    std::size_t num_expected_values = expected_values.size();
    if (num_expected_values > header_size)
        throw std::runtime_error("Error: Fewer values than expected found in point file header");
    for (std::size_t n = 0; n < header_size; n++) {
        header_values[n] = removeWhitespace(header_values[n]);
        if (n < num_expected_values) {
            auto val = header_values[n];
            std::transform(val.begin(), val.end(), val.begin(), ::tolower);
            if (val != expected_values[n])
                throw std::runtime_error("Error: " + expected_values[n] + " not found in point file header");
            header_values[n] = val;
        }
    }
    return header_values;
}

// Check if the thermal history table should be written as ASCII or binary
bool checkBinaryOutputFormat(std::string filename) {
    std::size_t found = filename.find(".catemp");
    if (found == std::string::npos)
        return false;
    else
        return true;
}

// Lower case extension of a filename including the leading ".", or an empty string if there is none
std::string getFileExtension(std::string filename) {
    std::size_t slash = filename.find_last_of('/');
    std::size_t dot = filename.find_last_of('.');
    if ((dot == std::string::npos) || ((slash != std::string::npos) && (dot < slash)))
        return "";
    std::string extension = filename.substr(dot);
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
    return extension;
}

// Filename without leading directories and without extension
std::string getFileStem(std::string filename) {
    std::size_t slash = filename.find_last_of('/');
    if (slash != std::string::npos)
        filename = filename.substr(slash + 1);
    std::size_t dot = filename.find_last_of('.');
    if (dot != std::string::npos)
        filename = filename.substr(0, dot);
    return filename;
}

// Shortest decimal form of a snapshot time that reads back as the same double, independent of how the time was
// written in the snapshot filename
std::string canonicalTimeString(const double time) {
    char buffer[32];
    for (int precision = 1; precision < 17; precision++) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, time);
        if (std::strtod(buffer, nullptr) == time)
            return std::string(buffer);
    }
    std::snprintf(buffer, sizeof(buffer), "%.17g", time);
    return std::string(buffer);
}

// Extract the time from a snapshot filename. The time is the number ending the filename stem, written either as a
// plain decimal ("data-0.000120.vtk") or with an exponent ("data-1.2e-04.vtk", "T_1.2E-4.csv"). std::stod rounds
// to the nearest double, so equal times written two different ways compare equal. Returns false if the stem does not
// end in a number
bool parseSnapshotTime(const std::string filename, double &time) {
    std::string stem = getFileStem(filename);
    std::regex time_pattern("([0-9]+(\\.[0-9]*)?([eE][-+]?[0-9]+)?)$");
    std::smatch match;
    if (!std::regex_search(stem, match, time_pattern))
        return false;
    double parsed_time;
    try {
        parsed_time = std::stod(match[1].str());
    }
    catch (const std::out_of_range &) {
        return false;
    }
    if (!std::isfinite(parsed_time))
        return false;
    time = parsed_time;
    return true;
}
