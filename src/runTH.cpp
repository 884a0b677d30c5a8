// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "runTH.hpp"

#include <csignal>

// Set by SIGINT/SIGTERM, checked between snapshots
static volatile std::sig_atomic_t interrupt_requested = 0;

void handleInterruptSignal(int) { interrupt_requested = 1; }

void installInterruptHandlers() {
    std::signal(SIGINT, handleInterruptSignal);
    std::signal(SIGTERM, handleInterruptSignal);
}

void resetInterrupt() { interrupt_requested = 0; }

// True on all ranks if any rank received an interrupt signal
bool checkForInterrupt() {
    int interrupt_local = interrupt_requested ? 1 : 0;
    int interrupt_global;
    MPI_Allreduce(&interrupt_local, &interrupt_global, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);
    return (interrupt_global == 1);
}
