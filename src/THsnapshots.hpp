// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_SNAPSHOTS_HPP
#define THERMALHISTORY_SNAPSHOTS_HPP

#include "THerrors.hpp"
#include "THinputdata.hpp"
#include "THparsefiles.hpp"

#include "mpi.h"

#include <Kokkos_Core.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

// Name and time of a snapshot file found in the snapshot directory
struct SnapshotFile {
    std::string path = "";
    double time = 0.0;
};

// Point coordinates and all single component point fields read from a snapshot file
struct PointData {
    // x, y, z of each point, stored consecutively
    std::vector<double> coordinates;
    std::vector<std::string> field_names;
    std::vector<std::vector<double>> field_values;

    long numPoints() const { return static_cast<long>(coordinates.size() / 3); }
    // Index of the named field, or -1 if not present
    int getFieldIndex(const std::string name) const {
        for (std::size_t n = 0; n < field_names.size(); n++) {
            if (field_names[n] == name)
                return static_cast<int>(n);
        }
        return -1;
    }
};

// Irregular point cloud with the requested scalar fields at a single time, stored on the host
struct Snapshot {

    using view_type_double_2d_host = Kokkos::View<double **, Kokkos::HostSpace>;

    double time = 0.0;
    std::string filename = "";
    int num_points = 0;
    // Coordinates (num_points, 3)
    view_type_double_2d_host points;
    // Field values (num_points, number of fields), columns ordered as field_names
    std::vector<std::string> field_names;
    view_type_double_2d_host fields;

    // Creates an empty snapshot, used in unit tests
    Snapshot(){};

    Snapshot(const std::string filename_in, const double time_in, const int num_points_in,
             const std::vector<std::string> field_names_in)
        : time(time_in)
        , filename(filename_in)
        , num_points(num_points_in)
        , points(view_type_double_2d_host(Kokkos::ViewAllocateWithoutInitializing("snapshot_points"), num_points_in,
                                          3))
        , field_names(field_names_in)
        , fields(view_type_double_2d_host(Kokkos::ViewAllocateWithoutInitializing("snapshot_fields"), num_points_in,
                                          field_names_in.size())) {}

    // Index of the named field, or -1 if not present
    int getFieldIndex(const std::string name) const {
        for (std::size_t n = 0; n < field_names.size(); n++) {
            if (field_names[n] == name)
                return static_cast<int>(n);
        }
        return -1;
    }

    // { x_min, x_max, y_min, y_max, z_min, z_max }
    std::array<double, 6> getBounds() const {
        std::array<double, 6> bounds = {std::numeric_limits<double>::max(),    std::numeric_limits<double>::lowest(),
                                        std::numeric_limits<double>::max(),    std::numeric_limits<double>::lowest(),
                                        std::numeric_limits<double>::max(),    std::numeric_limits<double>::lowest()};
        for (int n = 0; n < num_points; n++) {
            for (int a = 0; a < 3; a++) {
                bounds[2 * a] = std::min(bounds[2 * a], points(n, a));
                bounds[2 * a + 1] = std::max(bounds[2 * a + 1], points(n, a));
            }
        }
        return bounds;
    }
};

std::vector<double> readVTKValues(std::ifstream &input_data_stream, const bool binary, const std::string data_type,
                                  const long num_values);
PointData readVTKPointData(const std::string filename);
PointData readCSVPointData(const std::string filename);
PointData readPointData(const std::string filename);
Snapshot loadSnapshot(const SnapshotFile &file, const std::vector<std::string> &requested_fields);
void sortSnapshotFiles(std::vector<SnapshotFile> &files);
std::vector<SnapshotFile> findSnapshotFiles(const int id, const std::string directory, const double time_scale,
                                           const int stride = 1);

// Time-sorted sequence of snapshot files. Files are listed once on construction and each snapshot is read from disk
// only when it is loaded
struct SnapshotStore {

    SnapshotInputs _inputs;
    std::vector<SnapshotFile> files;

    SnapshotStore(const int id, SnapshotInputs inputs)
        : _inputs(inputs) {
        files = findSnapshotFiles(id, _inputs.directory, _inputs.time_scale, _inputs.stride);
        if (id == 0)
            std::cout << "Found " << files.size() << " snapshots in \"" << _inputs.directory << "\", spanning times "
                      << canonicalTimeString(files.front().time) << " through "
                      << canonicalTimeString(files.back().time) << std::endl;
    }

    int size() const { return static_cast<int>(files.size()); }

    std::vector<double> getTimes() const {
        std::vector<double> times(files.size());
        for (std::size_t n = 0; n < files.size(); n++)
            times[n] = files[n].time;
        return times;
    }

    std::vector<std::string> getPaths() const {
        std::vector<std::string> paths(files.size());
        for (std::size_t n = 0; n < files.size(); n++)
            paths[n] = files[n].path;
        return paths;
    }

    // Read snapshot n, keeping only the requested fields
    Snapshot load(const int n, const std::vector<std::string> &requested_fields) const {
        return loadSnapshot(files[n], requested_fields);
    }

    // Union of the bounds of all snapshots. Each rank reads a subset of the files, and bounds are reduced across ranks
    std::array<double, 6> findDataBounds(const int id, const int np) const {

        std::array<double, 3> low = {std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
                                     std::numeric_limits<double>::max()};
        std::array<double, 3> high = {std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest(),
                                      std::numeric_limits<double>::lowest()};
        for (int n = id; n < size(); n += np) {
            PointData point_data = readPointData(files[n].path);
            long num_points = point_data.numPoints();
            for (long p = 0; p < num_points; p++) {
                for (int a = 0; a < 3; a++) {
                    low[a] = std::min(low[a], point_data.coordinates[3 * p + a]);
                    high[a] = std::max(high[a], point_data.coordinates[3 * p + a]);
                }
            }
        }
        std::array<double, 3> global_low, global_high;
        MPI_Allreduce(low.data(), global_low.data(), 3, MPI_DOUBLE, MPI_MIN, MPI_COMM_WORLD);
        MPI_Allreduce(high.data(), global_high.data(), 3, MPI_DOUBLE, MPI_MAX, MPI_COMM_WORLD);
        if (global_low[0] > global_high[0])
            throw InputError("SnapshotStore", "no points found in any snapshot in \"" + _inputs.directory + "\"");
        std::array<double, 6> bounds = {global_low[0], global_high[0], global_low[1],
                                        global_high[1], global_low[2], global_high[2]};
        if (id == 0)
            std::cout << "Snapshot data spans X = " << bounds[0] << " through " << bounds[1] << ", Y = " << bounds[2]
                      << " through " << bounds[3] << ", Z = " << bounds[4] << " through " << bounds[5] << std::endl;
        return bounds;
    }
};

#endif
