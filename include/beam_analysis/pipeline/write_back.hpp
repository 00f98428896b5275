#pragma once

#include "beam_analysis/io/measurement.hpp"
#include "beam_analysis/io/result_writer.hpp"

#include <string>
#include <vector>

namespace beam_analysis::pipeline {

struct WriteBackTargets {
    fs::path measurement;
    io::MeasurementFormat format = io::MeasurementFormat::HDF5;
    fs::path sidecar;  // empty = none
};

// Writes the JSON sidecar first and the measurement (HDF5 only, in place)
// last, so a failed sidecar write leaves the measurement untouched.
// Returns "<file>:<destination>" for every stored value. Throws WriteError
// or IOError on the first failure.
std::vector<std::string> write_back(const std::vector<io::ResultDescriptor>& descriptors,
                                    const WriteBackTargets& targets);

} // namespace beam_analysis::pipeline
