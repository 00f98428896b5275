#pragma once

#include "beam_analysis/config/configuration.hpp"
#include "beam_analysis/io/result_writer.hpp"
#include "beam_analysis/pipeline/beam_pipeline.hpp"

#include <vector>

namespace beam_analysis::pipeline {

// Ordered descriptors for a finished analysis: center of mass, flux and,
// when enabled, the weighted center of mass.
std::vector<io::ResultDescriptor> build_result_descriptors(const BeamAnalysisResult& result,
                                                           const config::OutputConfig& output);

} // namespace beam_analysis::pipeline
