#pragma once

#include "beam_analysis/core/types.hpp"

namespace beam_analysis::image {

// Averages `stack` over axis 0 once. Requires rank >= 3.
DetectorStack mean_over_leading_axis(const DetectorStack& stack);

// Collapses a rank >= 2 stack to a single frame by repeated averaging over
// axis 0. A rank-2 input is returned as-is. Throws ShapeError for rank < 2,
// zero-length axes or inconsistent data.
Matrix2Dd reduce_to_2d(const DetectorStack& stack);

} // namespace beam_analysis::image
