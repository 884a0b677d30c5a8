// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "THsnapshots.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

//*****************************************************************************/
// Legacy VTK files (ASCII or big endian binary). Only point coordinates and single component point data arrays are
// kept: cells, cell data, and multi-component arrays are read past

// Size in bytes of one value of a legacy VTK data type
int getVTKTypeSize(const std::string data_type) {
    if ((data_type == "unsigned_char") || (data_type == "char"))
        return 1;
    else if ((data_type == "unsigned_short") || (data_type == "short"))
        return 2;
    else if ((data_type == "unsigned_int") || (data_type == "int") || (data_type == "float"))
        return 4;
    else if ((data_type == "unsigned_long") || (data_type == "long") || (data_type == "double") ||
             (data_type == "vtktypeint64") || (data_type == "vtktypeuint64") || (data_type == "vtkIdType"))
        return 8;
    else
        throw InputError("SnapshotStore", "unsupported VTK data type \"" + data_type + "\"");
}

// Read one big endian binary value of the given VTK data type, converted to double
double readVTKBinaryValue(std::ifstream &input_data_stream, const std::string data_type) {
    if (data_type == "unsigned_char")
        return static_cast<double>(readBinaryData<std::uint8_t>(input_data_stream, true));
    else if (data_type == "char")
        return static_cast<double>(readBinaryData<std::int8_t>(input_data_stream, true));
    else if (data_type == "unsigned_short")
        return static_cast<double>(readBinaryData<std::uint16_t>(input_data_stream, true));
    else if (data_type == "short")
        return static_cast<double>(readBinaryData<std::int16_t>(input_data_stream, true));
    else if (data_type == "unsigned_int")
        return static_cast<double>(readBinaryData<std::uint32_t>(input_data_stream, true));
    else if (data_type == "int")
        return static_cast<double>(readBinaryData<std::int32_t>(input_data_stream, true));
    else if (data_type == "float")
        return static_cast<double>(readBinaryData<float>(input_data_stream, true));
    else if (data_type == "double")
        return readBinaryData<double>(input_data_stream, true);
    else if ((data_type == "unsigned_long") || (data_type == "vtktypeuint64"))
        return static_cast<double>(readBinaryData<std::uint64_t>(input_data_stream, true));
    else if ((data_type == "long") || (data_type == "vtktypeint64") || (data_type == "vtkIdType"))
        return static_cast<double>(readBinaryData<std::int64_t>(input_data_stream, true));
    else
        throw InputError("SnapshotStore", "unsupported VTK data type \"" + data_type + "\"");
}

// Read num_values values of type data_type, as whitespace-separated ASCII or as big endian binary
std::vector<double> readVTKValues(std::ifstream &input_data_stream, const bool binary, const std::string data_type,
                                  const long num_values) {
    std::vector<double> values(num_values);
    if (binary) {
        for (long n = 0; n < num_values; n++)
            values[n] = readVTKBinaryValue(input_data_stream, data_type);
    }
    else {
        std::string value;
        for (long n = 0; n < num_values; n++) {
            input_data_stream >> value;
            if (!input_data_stream)
                break;
            try {
                values[n] = std::stod(value);
            }
            catch (const std::exception &) {
                throw InputError("SnapshotStore", "could not parse VTK value \"" + value + "\"");
            }
        }
    }
    if (!input_data_stream)
        throw InputError("SnapshotStore", "unexpected end of VTK file while reading " + std::to_string(num_values) +
                                              " values of type " + data_type);
    return values;
}

// Read past num_values values of type data_type
void skipVTKValues(std::ifstream &input_data_stream, const bool binary, const std::string data_type,
                   const long num_values) {
    if (binary) {
        input_data_stream.ignore(num_values * getVTKTypeSize(data_type));
        if (!input_data_stream)
            throw InputError("SnapshotStore", "unexpected end of VTK file while reading " +
                                                  std::to_string(num_values) + " values of type " + data_type);
    }
    else
        readVTKValues(input_data_stream, false, data_type, num_values);
}

// Get the next non-empty line of the file, returning false at the end of the file
bool getNextVTKLine(std::ifstream &input_data_stream, std::string &line) {
    while (std::getline(input_data_stream, line)) {
        if (!line.empty() && (line.back() == '\r'))
            line.pop_back();
        if (line.find_first_not_of(" \t") != std::string::npos)
            return true;
    }
    return false;
}

// Cell connectivity list following a CELLS/POLYGONS/LINES/VERTICES/TRIANGLE_STRIPS keyword. Version 5.1 files
// give separate OFFSETS and CONNECTIVITY arrays; older files give a single list of ints. Returns the number of cells
long skipVTKCellList(std::ifstream &input_data_stream, const bool binary, const bool offsets_format,
                     std::istringstream &keyword_line) {
    long size_1, size_2;
    keyword_line >> size_1 >> size_2;
    if (offsets_format) {
        for (int array_num = 0; array_num < 2; array_num++) {
            std::string line, array_keyword, data_type;
            if (!getNextVTKLine(input_data_stream, line))
                throw InputError("SnapshotStore", "missing OFFSETS/CONNECTIVITY array in VTK file");
            std::istringstream ss(line);
            ss >> array_keyword >> data_type;
            if ((array_keyword != "OFFSETS") && (array_keyword != "CONNECTIVITY"))
                throw InputError("SnapshotStore", "expected OFFSETS/CONNECTIVITY in VTK file, found \"" +
                                                      array_keyword + "\"");
            skipVTKValues(input_data_stream, binary, data_type, (array_keyword == "OFFSETS") ? size_1 : size_2);
        }
        return std::max(size_1 - 1, 0L);
    }
    else {
        skipVTKValues(input_data_stream, binary, "int", size_2);
        return size_1;
    }
}

PointData readVTKPointData(const std::string filename) {

    std::ifstream input_data_stream(filename, std::ios::binary);
    if (!input_data_stream.is_open())
        throw InputError("SnapshotStore", "could not open snapshot file \"" + filename + "\"");

    // Header: version line, title line, and data format
    std::string version_line, title_line, format_line;
    std::getline(input_data_stream, version_line);
    std::getline(input_data_stream, title_line);
    std::getline(input_data_stream, format_line);
    std::size_t version_pos = version_line.find("Version");
    if ((version_line.find("vtk DataFile") == std::string::npos) || (version_pos == std::string::npos))
        throw InputError("SnapshotStore", "\"" + filename + "\" is not a legacy VTK file");
    double file_version = getInputDouble(removeWhitespace(version_line, version_pos + 6));
    // VTK 5.1 and later write cell connectivity as separate offsets and connectivity arrays
    bool offsets_format = (file_version >= 5.0);
    std::string format = removeWhitespace(format_line);
    std::transform(format.begin(), format.end(), format.begin(), ::toupper);
    bool binary;
    if (format == "ASCII")
        binary = false;
    else if (format == "BINARY")
        binary = true;
    else
        throw InputError("SnapshotStore", "unknown VTK data format \"" + format + "\" in \"" + filename + "\"");

    PointData point_data;
    std::string dataset = "";
    long num_points = -1, num_cells = 0;
    // Structured points and rectilinear grids give coordinates implicitly
    std::array<long, 3> dimensions = {1, 1, 1};
    std::array<double, 3> origin = {0.0, 0.0, 0.0}, spacing = {1.0, 1.0, 1.0};
    std::array<std::vector<double>, 3> axis_coordinates;
    // Which attribute section the reader is in: dataset structure, point data, or cell data
    enum { structure_section, point_section, cell_section };
    int section = structure_section;

    // Generate coordinates of structured points/rectilinear grids, X fastest
    auto generateCoordinates = [&]() {
        if ((dataset != "STRUCTURED_POINTS") && (dataset != "RECTILINEAR_GRID"))
            return;
        num_points = dimensions[0] * dimensions[1] * dimensions[2];
        point_data.coordinates.resize(3 * num_points);
        for (long k = 0; k < dimensions[2]; k++) {
            for (long j = 0; j < dimensions[1]; j++) {
                for (long i = 0; i < dimensions[0]; i++) {
                    long index = i + dimensions[0] * (j + dimensions[1] * k);
                    std::array<long, 3> ijk = {i, j, k};
                    for (int a = 0; a < 3; a++) {
                        if (dataset == "STRUCTURED_POINTS")
                            point_data.coordinates[3 * index + a] = origin[a] + ijk[a] * spacing[a];
                        else
                            point_data.coordinates[3 * index + a] = axis_coordinates[a][ijk[a]];
                    }
                }
            }
        }
    };
    // Keep single component point data arrays spanning all points
    auto storeArray = [&](const std::string name, const int num_components, std::vector<double> &values) {
        if ((section == point_section) && (num_components == 1) && (static_cast<long>(values.size()) == num_points)) {
            point_data.field_names.push_back(name);
            point_data.field_values.push_back(std::move(values));
        }
    };
    auto numTuples = [&]() { return (section == cell_section) ? num_cells : num_points; };

    std::string line;
    while (getNextVTKLine(input_data_stream, line)) {
        std::istringstream ss(line);
        std::string keyword;
        ss >> keyword;
        if (keyword == "DATASET") {
            ss >> dataset;
            if ((dataset != "UNSTRUCTURED_GRID") && (dataset != "POLYDATA") && (dataset != "STRUCTURED_GRID") &&
                (dataset != "STRUCTURED_POINTS") && (dataset != "RECTILINEAR_GRID"))
                throw InputError("SnapshotStore", "unsupported VTK dataset type \"" + dataset + "\" in \"" +
                                                      filename + "\"");
        }
        else if (keyword == "POINTS") {
            std::string data_type;
            ss >> num_points >> data_type;
            point_data.coordinates = readVTKValues(input_data_stream, binary, data_type, 3 * num_points);
        }
        else if (keyword == "DIMENSIONS")
            ss >> dimensions[0] >> dimensions[1] >> dimensions[2];
        else if (keyword == "ORIGIN")
            ss >> origin[0] >> origin[1] >> origin[2];
        else if ((keyword == "SPACING") || (keyword == "ASPECT_RATIO"))
            ss >> spacing[0] >> spacing[1] >> spacing[2];
        else if ((keyword == "X_COORDINATES") || (keyword == "Y_COORDINATES") || (keyword == "Z_COORDINATES")) {
            long num_values;
            std::string data_type;
            ss >> num_values >> data_type;
            axis_coordinates[keyword[0] - 'X'] = readVTKValues(input_data_stream, binary, data_type, num_values);
        }
        else if (keyword == "CELLS")
            num_cells = skipVTKCellList(input_data_stream, binary, offsets_format, ss);
        else if ((keyword == "VERTICES") || (keyword == "LINES") || (keyword == "POLYGONS") ||
                 (keyword == "TRIANGLE_STRIPS"))
            num_cells += skipVTKCellList(input_data_stream, binary, offsets_format, ss);
        else if (keyword == "CELL_TYPES") {
            long num_values;
            ss >> num_values;
            skipVTKValues(input_data_stream, binary, "int", num_values);
        }
        else if (keyword == "POINT_DATA") {
            if (num_points < 0)
                generateCoordinates();
            long num_values;
            ss >> num_values;
            if (num_values != num_points)
                throw InputError("SnapshotStore", "POINT_DATA size " + std::to_string(num_values) +
                                                      " does not match the number of points " +
                                                      std::to_string(num_points) + " in \"" + filename + "\"");
            section = point_section;
        }
        else if (keyword == "CELL_DATA") {
            if (num_points < 0)
                generateCoordinates();
            ss >> num_cells;
            section = cell_section;
        }
        else if (keyword == "SCALARS") {
            std::string name, data_type;
            int num_components = 1;
            ss >> name >> data_type;
            if (!(ss >> num_components))
                num_components = 1;
            // Lookup table name normally follows the SCALARS line
            std::string lookup_line;
            std::streampos data_start = input_data_stream.tellg();
            if (!getNextVTKLine(input_data_stream, lookup_line) || (lookup_line.find("LOOKUP_TABLE") != 0)) {
                input_data_stream.clear();
                input_data_stream.seekg(data_start);
            }
            std::vector<double> values =
                readVTKValues(input_data_stream, binary, data_type, numTuples() * num_components);
            storeArray(name, num_components, values);
        }
        else if (keyword == "LOOKUP_TABLE") {
            // Color table definition: rgba per entry, unsigned char in binary files
            std::string name;
            long table_size;
            ss >> name >> table_size;
            skipVTKValues(input_data_stream, binary, binary ? "unsigned_char" : "float", 4 * table_size);
        }
        else if (keyword == "COLOR_SCALARS") {
            std::string name;
            int num_components;
            ss >> name >> num_components;
            skipVTKValues(input_data_stream, binary, binary ? "unsigned_char" : "float", numTuples() * num_components);
        }
        else if ((keyword == "VECTORS") || (keyword == "NORMALS") || (keyword == "TENSORS") ||
                 (keyword == "TENSORS6")) {
            std::string name, data_type;
            ss >> name >> data_type;
            int num_components = 3;
            if (keyword == "TENSORS")
                num_components = 9;
            else if (keyword == "TENSORS6")
                num_components = 6;
            skipVTKValues(input_data_stream, binary, data_type, numTuples() * num_components);
        }
        else if (keyword == "TEXTURE_COORDINATES") {
            std::string name, data_type;
            int num_components;
            ss >> name >> num_components >> data_type;
            skipVTKValues(input_data_stream, binary, data_type, numTuples() * num_components);
        }
        else if (keyword == "FIELD") {
            std::string name;
            int num_arrays;
            ss >> name >> num_arrays;
            for (int n = 0; n < num_arrays; n++) {
                std::string array_line;
                if (!getNextVTKLine(input_data_stream, array_line))
                    throw InputError("SnapshotStore", "unexpected end of VTK file in FIELD " + name);
                std::istringstream array_ss(array_line);
                std::string array_name, data_type;
                int num_components;
                long num_tuples;
                array_ss >> array_name;
                if (array_name == "NULL_ARRAY")
                    continue;
                array_ss >> num_components >> num_tuples >> data_type;
                std::vector<double> values =
                    readVTKValues(input_data_stream, binary, data_type, num_components * num_tuples);
                storeArray(array_name, num_components, values);
            }
        }
        else if (keyword == "METADATA") {
            // Metadata block ends at the next empty line
            std::string metadata_line;
            while (std::getline(input_data_stream, metadata_line)) {
                if (!metadata_line.empty() && (metadata_line.back() == '\r'))
                    metadata_line.pop_back();
                if (metadata_line.empty())
                    break;
            }
        }
        else
            throw InputError("SnapshotStore", "unexpected VTK keyword \"" + keyword + "\" in \"" + filename + "\"");
    }
    if (num_points < 0)
        generateCoordinates();
    if (num_points < 0)
        throw InputError("SnapshotStore", "no points found in \"" + filename + "\"");
    return point_data;
}

//*****************************************************************************/
// Comma-separated point files: header line x,y,z,<field 1>,<field 2>,... followed by one line per point
PointData readCSVPointData(const std::string filename) {

    std::ifstream input_data_stream(filename);
    if (!input_data_stream.is_open())
        throw InputError("SnapshotStore", "could not open snapshot file \"" + filename + "\"");
    std::string header_line;
    std::getline(input_data_stream, header_line);
    if (!header_line.empty() && (header_line.back() == '\r'))
        header_line.pop_back();
    if (header_line.empty())
        throw InputError("SnapshotStore", "first line of file \"" + filename + "\" appears empty");
    std::vector<std::string> column_names;
    try {
        column_names = checkForCoordinateHeader(header_line);
    }
    catch (const std::runtime_error &error) {
        throw InputError("SnapshotStore", std::string(error.what()) + " (\"" + filename + "\")");
    }
    std::size_t vals_per_line = column_names.size();
    std::size_t num_fields = vals_per_line - 3;

    PointData point_data;
    point_data.field_names.assign(column_names.begin() + 3, column_names.end());
    point_data.field_values.resize(num_fields);
    std::vector<std::string> parsed_line(vals_per_line);
    std::string read_line;
    long line_number = 1;
    while (std::getline(input_data_stream, read_line)) {
        line_number++;
        if (!read_line.empty() && (read_line.back() == '\r'))
            read_line.pop_back();
        if (read_line.find_first_not_of(" \t") == std::string::npos)
            continue;
        try {
            splitString(read_line, parsed_line, vals_per_line);
            for (int a = 0; a < 3; a++)
                point_data.coordinates.push_back(getInputDouble(parsed_line[a]));
            for (std::size_t n = 0; n < num_fields; n++)
                point_data.field_values[n].push_back(getInputDouble(parsed_line[3 + n]));
        }
        catch (const std::exception &error) {
            throw InputError("SnapshotStore", "could not parse line " + std::to_string(line_number) + " of \"" +
                                                  filename + "\": " + error.what());
        }
    }
    return point_data;
}

// Read a snapshot file, selecting the reader based on the file extension
PointData readPointData(const std::string filename) {
    std::string extension = getFileExtension(filename);
    if (extension == ".vtk")
        return readVTKPointData(filename);
    else if (extension == ".csv")
        return readCSVPointData(filename);
    else
        throw InputError("SnapshotStore", "unsupported snapshot file type \"" + extension + "\" for \"" + filename +
                                              "\", snapshots must be .vtk or .csv files");
}

// Read a snapshot file and copy the coordinates and requested fields into a snapshot
Snapshot loadSnapshot(const SnapshotFile &file, const std::vector<std::string> &requested_fields) {

    PointData point_data = readPointData(file.path);
    int num_requested_fields = requested_fields.size();
    std::vector<int> field_index(num_requested_fields);
    for (int n = 0; n < num_requested_fields; n++) {
        field_index[n] = point_data.getFieldIndex(requested_fields[n]);
        if (field_index[n] == -1)
            throw InputError("SnapshotStore",
                             "field \"" + requested_fields[n] + "\" not found in snapshot \"" + file.path + "\"");
    }
    int num_points = point_data.numPoints();
    Snapshot snapshot(file.path, file.time, num_points, requested_fields);
    for (int p = 0; p < num_points; p++) {
        for (int a = 0; a < 3; a++)
            snapshot.points(p, a) = point_data.coordinates[3 * p + a];
        for (int n = 0; n < num_requested_fields; n++)
            snapshot.fields(p, n) = point_data.field_values[field_index[n]][p];
    }
    return snapshot;
}

//*****************************************************************************/
// Sort snapshot files by time. Two files at the same time cannot be ordered
void sortSnapshotFiles(std::vector<SnapshotFile> &files) {
    std::stable_sort(files.begin(), files.end(),
                     [](const SnapshotFile &a, const SnapshotFile &b) { return a.time < b.time; });
    for (std::size_t n = 1; n < files.size(); n++) {
        if (files[n].time == files[n - 1].time)
            throw MalformedSnapshotName("snapshots \"" + files[n - 1].path + "\" and \"" + files[n].path +
                                        "\" have the same time " + canonicalTimeString(files[n].time));
    }
}

// List the snapshot files (.vtk or .csv) in the directory, with the time of each parsed from its name and multiplied
// by time_scale, sorted by time. With a stride larger than 1, only every stride-th file of the sorted list is kept
std::vector<SnapshotFile> findSnapshotFiles(const int id, const std::string directory, const double time_scale,
                                           const int stride) {

    std::error_code error_code;
    if (!std::filesystem::is_directory(directory, error_code))
        throw InputError("SnapshotStore", "snapshot directory \"" + directory + "\" not found");

    // Directory order is unspecified: collect all names before parsing so that warnings are printed in a repeatable
    // order
    std::vector<std::string> candidates;
    for (const auto &entry : std::filesystem::directory_iterator(directory)) {
        if (!entry.is_regular_file())
            continue;
        std::string extension = getFileExtension(entry.path().filename().string());
        if ((extension == ".vtk") || (extension == ".csv"))
            candidates.push_back(entry.path().string());
    }
    std::sort(candidates.begin(), candidates.end());

    std::vector<SnapshotFile> files;
    for (auto &candidate : candidates) {
        double time;
        if (parseSnapshotTime(candidate, time)) {
            SnapshotFile file;
            file.path = candidate;
            file.time = time * time_scale;
            files.push_back(file);
        }
        else if (id == 0)
            std::cout << "Warning: skipping \"" << candidate << "\", no time found in file name" << std::endl;
    }
    if (files.empty())
        throw MalformedSnapshotName("no file in \"" + directory +
                                    "\" has a name ending in a time (i.e., \"data-1.5e-05.vtk\")");
    sortSnapshotFiles(files);
    if (stride > 1) {
        std::vector<SnapshotFile> sampled_files;
        for (std::size_t n = 0; n < files.size(); n += stride)
            sampled_files.push_back(files[n]);
        files = sampled_files;
    }
    if (files.size() < 2)
        throw EmptySequence("found " + std::to_string(files.size()) + " snapshot in \"" + directory +
                            "\" with stride " + std::to_string(stride) + ", at least 2 are needed");
    return files;
}
