// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_INFO_HPP
#define THERMALHISTORY_INFO_HPP

#include "THconfig.hpp"

#include <string>

// Functions for printing for ThermalHistory/Kokkos version
std::string version();
std::string gitCommitHash();
std::string kokkosVersion();

#endif
