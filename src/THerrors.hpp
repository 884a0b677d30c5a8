// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_ERRORS_HPP
#define THERMALHISTORY_ERRORS_HPP

#include <stdexcept>
#include <string>

// Base class for fatal errors raised by a stage of the pipeline. The stage name is included in the message and kept
// so that the driver can report where the run stopped
class ThermalHistoryError : public std::runtime_error {
    std::string _stage;

  public:
    ThermalHistoryError(const std::string stage, const std::string message)
        : std::runtime_error("Error (" + stage + "): " + message)
        , _stage(stage) {}

    const std::string &stage() const { return _stage; }
};

// A snapshot filename does not encode a time, or two snapshots encode the same time
class MalformedSnapshotName : public ThermalHistoryError {
  public:
    MalformedSnapshotName(const std::string message)
        : ThermalHistoryError("SnapshotStore", message) {}
};

// Fewer than two snapshots were found
class EmptySequence : public ThermalHistoryError {
  public:
    EmptySequence(const std::string message)
        : ThermalHistoryError("SnapshotStore", message) {}
};

// The cell size is non-positive or too coarse to resolve the domain
class InvalidResolution : public ThermalHistoryError {
  public:
    InvalidResolution(const std::string message)
        : ThermalHistoryError("GridBuilder", message) {}
};

// A snapshot was handed to the resampler out of time order
class UnorderedSnapshots : public ThermalHistoryError {
  public:
    UnorderedSnapshots(const std::string message)
        : ThermalHistoryError("Resampler", message) {}
};

// A coordinate transform parameter needed to write the output table is missing or invalid
class SchemaMismatch : public ThermalHistoryError {
  public:
    SchemaMismatch(const std::string message)
        : ThermalHistoryError("Remapper", message) {}
};

// The run was stopped by SIGINT/SIGTERM between two snapshots
class RunInterrupted : public ThermalHistoryError {
  public:
    RunInterrupted(const std::string message)
        : ThermalHistoryError("Resampler", message) {}
};

// Invalid input file settings or unreadable/inconsistent snapshot data
class InputError : public ThermalHistoryError {
  public:
    InputError(const std::string stage, const std::string message)
        : ThermalHistoryError(stage, message) {}
};

#endif
