#pragma once

#include "beam_analysis/core/types.hpp"

namespace beam_analysis::image {

constexpr double kDefaultThresholdFraction = 1.0e-4;
constexpr double kDefaultThresholdFloor = 1.0;

struct SegmentationResult {
    double threshold = 0.0;
    double peak_value = 0.0;    // max of the masked frame
    MaskMatrix foreground;      // 1 where masked > threshold
    long foreground_pixels = 0;
};

// threshold = max(floor, fraction * max(masked)); an empty frame has max 0.
double compute_threshold(const Matrix2Dd& masked, double fraction = kDefaultThresholdFraction,
                         double floor = kDefaultThresholdFloor);

// Foreground is strictly above the threshold. An all-zero frame yields an
// empty foreground, not an error.
SegmentationResult segment_peak(const Matrix2Dd& masked,
                                double fraction = kDefaultThresholdFraction,
                                double floor = kDefaultThresholdFloor);

} // namespace beam_analysis::image
