// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_GRID_HPP
#define THERMALHISTORY_GRID_HPP

#include "THerrors.hpp"
#include "THinputdata.hpp"

#include "mpi.h"

#include <Kokkos_Core.hpp>

#include <algorithm>
#include <array>
#include <climits>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

// Fixed resolution grid spanning the physical domain, and its decomposition across MPI ranks
struct Grid {

    // Global domain: nx * ny * nz points, X fastest, then Y, then Z
    int nx = 0, ny = 0, nz = 0, domain_size = 0;
    double deltax = 0.0, x_min = 0.0, x_max = 0.0, y_min = 0.0, y_max = 0.0, z_min = 0.0, z_max = 0.0;

    // Variables characterizing local processor grids relative to global domain
    // 1D decomposition of the global point index: Each MPI rank owns num_points_local consecutive points, starting at
    // global index point_offset
    int num_points_local = 0, point_offset = 0;

    // Domain inputs from file
    DomainInputs _inputs;

    // Creates grid struct with uninitialized values, used in unit tests
    Grid(){};

    // Constructor for grid spanning either the bounds given in the inputs (restricted to the snapshot data) or the
    // bounds of the snapshot data
    Grid(const int id, const int np, DomainInputs inputs, const std::array<double, 6> data_bounds)
        : _inputs(inputs) {

        deltax = _inputs.cell_size;
        std::array<double, 6> bounds = data_bounds;
        if (_inputs.use_fixed_bounds)
            bounds = restrictToDataBounds(id, _inputs.bounds, data_bounds);
        x_min = bounds[0];
        x_max = bounds[1];
        y_min = bounds[2];
        y_max = bounds[3];
        z_min = bounds[4];
        z_max = bounds[5];
        checkResolution();
        nx = calcNumPoints(x_min, x_max);
        ny = calcNumPoints(y_min, y_max);
        nz = calcNumPoints(z_min, z_max);
        long domain_size_long = static_cast<long>(nx) * static_cast<long>(ny) * static_cast<long>(nz);
        if (domain_size_long > INT_MAX)
            throw InvalidResolution("cell size " + std::to_string(deltax) + " results in " +
                                    std::to_string(domain_size_long) + " grid points, more than the supported maximum");
        domain_size = static_cast<int>(domain_size_long);
        // Domain decomposition
        decomposeDomain(id, np);
        MPI_Barrier(MPI_COMM_WORLD);
        if (id == 0)
            std::cout << "Mesh initialized: " << domain_size << " grid points" << std::endl;
    };

    // Requested bounds that extend past the snapshot data are moved to the data bounds
    std::array<double, 6> restrictToDataBounds(const int id, const std::array<double, 6> requested,
                                               const std::array<double, 6> data_bounds) const {
        std::array<double, 6> bounds = requested;
        std::string axis_names[3] = {"X", "Y", "Z"};
        for (int a = 0; a < 3; a++) {
            if (requested[2 * a] > requested[2 * a + 1])
                throw InputError("GridBuilder", "lower domain bound in " + axis_names[a] +
                                                    " is larger than the upper domain bound");
            if (requested[2 * a] < data_bounds[2 * a]) {
                bounds[2 * a] = data_bounds[2 * a];
                if (id == 0)
                    std::cout << "Warning: lower domain bound in " << axis_names[a] << " of " << requested[2 * a]
                              << " is outside of the snapshot data, using " << bounds[2 * a] << std::endl;
            }
            if (requested[2 * a + 1] > data_bounds[2 * a + 1]) {
                bounds[2 * a + 1] = data_bounds[2 * a + 1];
                if (id == 0)
                    std::cout << "Warning: upper domain bound in " << axis_names[a] << " of " << requested[2 * a + 1]
                              << " is outside of the snapshot data, using " << bounds[2 * a + 1] << std::endl;
            }
            if (bounds[2 * a] > bounds[2 * a + 1])
                throw InputError("GridBuilder", "domain bounds in " + axis_names[a] +
                                                    " do not overlap the snapshot data");
        }
        return bounds;
    }

    // The cell size must be positive and no larger than the largest extent of the domain. A domain that is a single
    // point has no extent, and is represented by one grid point for any positive cell size
    void checkResolution() const {
        if (!(deltax > 0.0) || !std::isfinite(deltax))
            throw InvalidResolution("cell size must be positive, got " + std::to_string(deltax));
        double max_extent = std::max({x_max - x_min, y_max - y_min, z_max - z_min});
        if ((max_extent > 0.0) && (deltax > max_extent))
            throw InvalidResolution("cell size " + std::to_string(deltax) + " exceeds the largest domain extent " +
                                    std::to_string(max_extent));
    }

    // Number of grid points spanning min through max (inclusive of both ends when the extent is a multiple of the cell
    // size)
    int calcNumPoints(const double min, const double max) const {
        long num_points = static_cast<long>(std::floor((max - min) / deltax + 1.0e-8)) + 1;
        if (num_points > INT_MAX)
            throw InvalidResolution("cell size " + std::to_string(deltax) + " is too small for the domain extent");
        return static_cast<int>(num_points);
    }

    // Perform domain decomposition
    void decomposeDomain(const int id, const int np) {

        if (id == 0) {
            std::cout << "Domain size: " << nx << " by " << ny << " by " << nz << std::endl;
            std::cout << "X Limits of domain: " << x_min << " and " << x_min + (nx - 1) * deltax << std::endl;
            std::cout << "Y Limits of domain: " << y_min << " and " << y_min + (ny - 1) * deltax << std::endl;
            std::cout << "Z Limits of domain: " << z_min << " and " << z_min + (nz - 1) * deltax << std::endl;
            std::cout << "================================================================" << std::endl;
        }
        if ((np > domain_size) && (id == 0))
            std::cout << "Warning: more MPI ranks than grid points, some ranks will not own any points" << std::endl;

        point_offset = getPointOffset(id, np);
        num_points_local = getNumPointsLocal(id, np);

        // Gather num_points_local and point_offset information on rank 0 to print to screen in rank order
        std::vector<int> global_offset(np);
        std::vector<int> global_size(np);
        MPI_Gather(&point_offset, 1, MPI_INT, global_offset.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);
        MPI_Gather(&num_points_local, 1, MPI_INT, global_size.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);
        if (id == 0) {
            for (int pid = 0; pid < np; pid++)
                std::cout << "Rank " << pid << " spans grid points " << global_offset[pid] << " through "
                          << global_offset[pid] + global_size[pid] - 1 << std::endl;
        }
    }

    // Get the number of grid points owned by rank id, out of domain_size points split across np ranks
    int getNumPointsLocal(const int id, const int np) const {
        int num_points_est = domain_size / np;
        int remainder = domain_size % np;
        if (remainder > id)
            return num_points_est + 1;
        else
            return num_points_est;
    }

    // Get the global index of the first grid point owned by rank id
    int getPointOffset(const int id, const int np) const {
        int num_points_est = domain_size / np;
        int remainder = domain_size % np;
        if (remainder > id)
            return id * (num_points_est + 1);
        else
            return remainder * (num_points_est + 1) + (id - remainder) * num_points_est;
    }

    // Convert global 1D index to X, Y, Z indices and coordinates
    KOKKOS_INLINE_FUNCTION int getCoordX(const int index) const { return index % nx; }
    KOKKOS_INLINE_FUNCTION int getCoordY(const int index) const { return (index / nx) % ny; }
    KOKKOS_INLINE_FUNCTION int getCoordZ(const int index) const { return index / (nx * ny); }
    KOKKOS_INLINE_FUNCTION int get1DIndex(const int coord_x, const int coord_y, const int coord_z) const {
        return coord_x + nx * (coord_y + ny * coord_z);
    }
    std::array<double, 3> getCoordinates(const int index) const {
        std::array<double, 3> coordinates = {x_min + getCoordX(index) * deltax, y_min + getCoordY(index) * deltax,
                                             z_min + getCoordZ(index) * deltax};
        return coordinates;
    }
};

#endif
