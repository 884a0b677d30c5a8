// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_HPP
#define THERMALHISTORY_HPP

#include "THerrors.hpp"
#include "THgrid.hpp"
#include "THinfo.hpp"
#include "THinputdata.hpp"
#include "THinputs.hpp"
#include "THparsefiles.hpp"
#include "THprint.hpp"
#include "THremap.hpp"
#include "THresample.hpp"
#include "THsnapshots.hpp"
#include "THthermalhistory.hpp"
#include "THtimers.hpp"
#include "THtypes.hpp"

#endif
