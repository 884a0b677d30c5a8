// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "THinfo.hpp"

#include <string>

// Functions for printing for ThermalHistory/Kokkos version
std::string version() { return ThermalHistory_VERSION; }

std::string gitCommitHash() { return ThermalHistory_GIT_COMMIT_HASH; }

std::string kokkosVersion() { return ThermalHistory_Kokkos_VERSION_STRING; }
