// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_PRINT_HPP
#define THERMALHISTORY_PRINT_HPP

#include "THgrid.hpp"
#include "THinputdata.hpp"
#include "THparsefiles.hpp"
#include "THresample.hpp"

#include "mpi.h"

#include <Kokkos_Core.hpp>

#include <cmath>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

// Write data of type PrintType as ascii or binary, with option to convert between big and small endian binary
template <typename PrintType>
void writeData(std::ofstream &outstream, PrintType print_value, bool print_binary, bool swap_endian_yn = false) {
    if (print_binary) {
        if (swap_endian_yn)
            swapEndian(print_value);
        int var_size = sizeof(PrintType);
        outstream.write((char *)&print_value, var_size);
    }
    else
        outstream << print_value << " ";
}

// Struct to hold data printing options and functions
struct Print {

    // Holds print options from input file
    PrintInputs _inputs;
    // Combined path/file prefix for output files
    std::string path_base_filename;

    Print(PrintInputs inputs)
        : _inputs(inputs)
        , path_base_filename(inputs.path_to_output + getFileStem(inputs.output_file)) {}

    std::string getOutputFilename() const { return _inputs.path_to_output + _inputs.output_file; }
    std::string getLogFilename() const { return path_base_filename + ".json"; }
    std::string getResultsVTKFilename() const { return path_base_filename + ".vtk"; }
    std::string getResampledFilename(const double time) const {
        return _inputs.path_to_output + "resampled_" + canonicalTimeString(time) + ".vtk";
    }

    void openVTKFile(std::ofstream &output_fstream, std::string filename) const;
    void writeHeader(std::ofstream &output_fstream, std::string filename, const Grid &grid) const;
    std::vector<double> collectGridData(const int id, const int np, const Grid &grid,
                                        std::vector<double> &data_this_rank) const;
    void printResultsVTK(const std::string filename, const std::vector<double> &rows, const int num_columns,
                         const std::vector<std::string> &column_names) const;

    // Print the most recently stored values of all resampled fields on the grid, gathered on rank 0. Grid points
    // without a sample are written as 0 and marked by the "HasSample" field
    template <typename MemorySpace>
    void printResampledSnapshot(const int id, const int np, const Grid &grid, const Resampler<MemorySpace> &resampler,
                                const double time) const {

        auto current_fields_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), resampler.current_fields);
        int num_fields = resampler.field_names.size();
        std::vector<std::vector<double>> fields_whole_domain(num_fields);
        std::vector<double> data_this_rank(grid.num_points_local);
        for (int n = 0; n < num_fields; n++) {
            for (int point = 0; point < grid.num_points_local; point++)
                data_this_rank[point] = current_fields_host(point, n);
            fields_whole_domain[n] = collectGridData(id, np, grid, data_this_rank);
        }
        if (id != 0)
            return;

        std::string filename = getResampledFilename(time);
        std::ofstream output_fstream;
        writeHeader(output_fstream, filename, grid);
        output_fstream << "SCALARS HasSample short 1" << std::endl;
        output_fstream << "LOOKUP_TABLE default" << std::endl;
        for (int index = 0; index < grid.domain_size; index++) {
            short has_sample = std::isnan(fields_whole_domain[0][index]) ? 0 : 1;
            writeData(output_fstream, has_sample, _inputs.print_binary, true);
        }
        if (!(_inputs.print_binary))
            output_fstream << std::endl;
        for (int n = 0; n < num_fields; n++) {
            output_fstream << "SCALARS " << resampler.field_names[n] << " double 1" << std::endl;
            output_fstream << "LOOKUP_TABLE default" << std::endl;
            for (int index = 0; index < grid.domain_size; index++) {
                double writeval = std::isnan(fields_whole_domain[n][index]) ? 0.0 : fields_whole_domain[n][index];
                writeData(output_fstream, writeval, _inputs.print_binary, true);
            }
            // Do not insert newline character if using binary writing, as this will break the binary data read by
            // adding a blank line
            if (!(_inputs.print_binary))
                output_fstream << std::endl;
        }
        output_fstream.close();
    }
};

#endif
