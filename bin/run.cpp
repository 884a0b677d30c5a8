// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "ThermalHistory.hpp"
#include "runTH.hpp"

#include <Kokkos_Core.hpp>

#include "mpi.h"

#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char *argv[]) {
    // Initialize MPI
    int id, np;
    MPI_Init(&argc, &argv);
    // Initialize Kokkos
    Kokkos::initialize(argc, argv);
    {
        using memory_space = Kokkos::DefaultExecutionSpace::memory_space;

        // Get number of processes
        MPI_Comm_size(MPI_COMM_WORLD, &np);
        // Get individual process ID
        MPI_Comm_rank(MPI_COMM_WORLD, &id);

        if (id == 0) {
            std::cout << "ThermalHistory version: " << version() << " \nThermalHistory commit:  " << gitCommitHash()
                      << "\nKokkos version: " << kokkosVersion() << std::endl;
            Kokkos::DefaultExecutionSpace().print_configuration(std::cout);
            std::cout << "Number of MPI ranks = " << np << std::endl;
        }
        if (argc < 2) {
            throw std::runtime_error("Error: Must provide path to input file on the command line.");
        }
        else {
            // Stop cleanly between snapshots on SIGINT/SIGTERM
            installInterruptHandlers();

            // Create timers
            Timers timers(id);

            try {
                // Read input file
                std::string input_file = argv[1];
                Inputs inputs(id, input_file);

                // Extract, analyze, and write the thermal history of each grid point
                runThermalHistory<memory_space>(id, np, inputs, timers);
            }
            catch (const ThermalHistoryError &error) {
                // Report the stage that failed, and stop all ranks
                std::cerr << "Rank " << id << ": " << error.what() << std::endl;
                std::cerr << "ThermalHistory stopped in stage " << error.stage() << ", no output table was written"
                          << std::endl;
                MPI_Abort(MPI_COMM_WORLD, 1);
            }
        }
    }
    // Finalize Kokkos
    Kokkos::finalize();
    // Finalize MPI
    MPI_Finalize();
    return 0;
}
