// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "THprint.hpp"

#include "THerrors.hpp"

#include <iomanip>

void Print::openVTKFile(std::ofstream &output_fstream, std::string filename) const {
    if (_inputs.print_binary)
        output_fstream.open(filename, std::ios::out | std::ios::binary);
    else
        output_fstream.open(filename);
    if (!output_fstream.is_open())
        throw ThermalHistoryError("Print", "could not open \"" + filename + "\" for writing");
    output_fstream << "# vtk DataFile Version 3.0" << std::endl;
    output_fstream << "vtk output" << std::endl;
    if (_inputs.print_binary)
        output_fstream << "BINARY" << std::endl;
    else
        output_fstream << "ASCII" << std::endl;
    output_fstream << std::setprecision(15);
}

// Header for data on the full grid, written as structured points
void Print::writeHeader(std::ofstream &output_fstream, std::string filename, const Grid &grid) const {
    openVTKFile(output_fstream, filename);
    output_fstream << "DATASET STRUCTURED_POINTS" << std::endl;
    output_fstream << "DIMENSIONS " << grid.nx << " " << grid.ny << " " << grid.nz << std::endl;
    output_fstream << "ORIGIN " << grid.x_min << " " << grid.y_min << " " << grid.z_min << std::endl;
    output_fstream << "SPACING " << grid.deltax << " " << grid.deltax << " " << grid.deltax << std::endl;
    output_fstream << "POINT_DATA " << grid.domain_size << std::endl;
}

// Called on all ranks: the values at each rank's grid points are gathered on rank 0 in global grid point order.
// Other ranks return an empty list
std::vector<double> Print::collectGridData(const int id, const int np, const Grid &grid,
                                           std::vector<double> &data_this_rank) const {
    std::vector<int> recv_sizes(np), recv_offsets(np);
    for (int rank = 0; rank < np; rank++) {
        recv_sizes[rank] = grid.getNumPointsLocal(rank, np);
        recv_offsets[rank] = grid.getPointOffset(rank, np);
    }
    std::vector<double> data_whole_domain;
    if (id == 0)
        data_whole_domain.resize(grid.domain_size);
    MPI_Gatherv(data_this_rank.data(), grid.num_points_local, MPI_DOUBLE, data_whole_domain.data(), recv_sizes.data(),
                recv_offsets.data(), MPI_DOUBLE, 0, MPI_COMM_WORLD);
    return data_whole_domain;
}

// Called on rank 0: print the rows of the thermal history table as a point cloud, with the coordinates from the first
// three columns and a point field for each remaining column
void Print::printResultsVTK(const std::string filename, const std::vector<double> &rows, const int num_columns,
                            const std::vector<std::string> &column_names) const {

    int num_rows = rows.size() / num_columns;
    std::ofstream output_fstream;
    openVTKFile(output_fstream, filename);
    output_fstream << "DATASET POLYDATA" << std::endl;
    output_fstream << "POINTS " << num_rows << " double" << std::endl;
    for (int row = 0; row < num_rows; row++) {
        for (int a = 0; a < 3; a++)
            writeData(output_fstream, rows[num_columns * row + a], _inputs.print_binary, true);
        if (!(_inputs.print_binary))
            output_fstream << std::endl;
    }
    if (_inputs.print_binary)
        output_fstream << std::endl;
    // One vertex cell per point
    output_fstream << "VERTICES " << num_rows << " " << 2 * num_rows << std::endl;
    for (int row = 0; row < num_rows; row++) {
        int vertex_size = 1;
        writeData(output_fstream, vertex_size, _inputs.print_binary, true);
        writeData(output_fstream, row, _inputs.print_binary, true);
        if (!(_inputs.print_binary))
            output_fstream << std::endl;
    }
    if (_inputs.print_binary)
        output_fstream << std::endl;
    output_fstream << "POINT_DATA " << num_rows << std::endl;
    for (int n = 3; n < num_columns; n++) {
        output_fstream << "SCALARS " << column_names[n] << " double 1" << std::endl;
        output_fstream << "LOOKUP_TABLE default" << std::endl;
        for (int row = 0; row < num_rows; row++)
            writeData(output_fstream, rows[num_columns * row + n], _inputs.print_binary, true);
        output_fstream << std::endl;
    }
    output_fstream.close();
    if (!output_fstream)
        throw ThermalHistoryError("Print", "error while writing \"" + filename + "\"");
    std::cout << "Wrote point cloud of " << num_rows << " rows to \"" << filename << "\"" << std::endl;
}
