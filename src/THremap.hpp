// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_REMAP_HPP
#define THERMALHISTORY_REMAP_HPP

#include "THerrors.hpp"
#include "THgrid.hpp"
#include "THinputdata.hpp"
#include "THthermalhistory.hpp"
#include "THtypes.hpp"

#include "mpi.h"

#include <Kokkos_Core.hpp>

#include <array>
#include <string>
#include <vector>

// Converts the thermal history of each melted and solidified grid point into a row of the table read by ExaCA:
// x, y, z, melting time, solidification time, cooling rate
struct Remapper {

    // Values per output row
    static const int num_columns = 6;
    RemapInputs _inputs;

    Remapper(RemapInputs inputs);

    std::array<double, 3> transformCoordinates(const std::array<double, 3> coordinates) const;
    void remapRows(std::vector<double> &rows) const;
    std::vector<std::string> getColumnNames() const;
    void writeTable(const std::string filename, const std::vector<double> &rows) const;

    // Gather x, y, z, melting time, solidification time, and cooling rate of all solidified grid points on rank 0, in
    // global grid point order. Other ranks return an empty list
    template <typename MemorySpace>
    std::vector<double> collectRows(const int id, const int np, const Grid &grid,
                                    const ThermalHistory<MemorySpace> &thermal_history) const {

        auto status_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), thermal_history.status);
        auto melting_time_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), thermal_history.melting_time);
        auto solidification_time_host =
            Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), thermal_history.solidification_time);
        auto cooling_rate_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), thermal_history.cooling_rate);

        std::vector<double> local_rows;
        for (int point = 0; point < grid.num_points_local; point++) {
            if (status_host(point) != Solidified)
                continue;
            std::array<double, 3> coordinates = grid.getCoordinates(grid.point_offset + point);
            local_rows.insert(local_rows.end(), coordinates.begin(), coordinates.end());
            local_rows.push_back(melting_time_host(point));
            local_rows.push_back(solidification_time_host(point));
            local_rows.push_back(cooling_rate_host(point));
        }

        // Ranks own consecutive grid points in rank order, so rank order is grid point order
        int send_size = local_rows.size();
        std::vector<int> recv_sizes(np), recv_offsets(np);
        MPI_Gather(&send_size, 1, MPI_INT, recv_sizes.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);
        std::vector<double> rows;
        if (id == 0) {
            int total_size = 0;
            for (int rank = 0; rank < np; rank++) {
                recv_offsets[rank] = total_size;
                total_size += recv_sizes[rank];
            }
            rows.resize(total_size);
        }
        MPI_Gatherv(local_rows.data(), send_size, MPI_DOUBLE, rows.data(), recv_sizes.data(), recv_offsets.data(),
                    MPI_DOUBLE, 0, MPI_COMM_WORLD);
        return rows;
    }
};

#endif
