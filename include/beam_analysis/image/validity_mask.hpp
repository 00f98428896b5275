#pragma once

#include "beam_analysis/core/types.hpp"

namespace beam_analysis::image {

// Default upper bound of the sensor-valid range (overflow marker)
constexpr double kDefaultValidMax = 1.0e6;

struct ValidityMaskResult {
    MaskMatrix valid;   // 1 where valid_min <= v <= valid_max
    Matrix2Dd masked;   // frame * valid
    long valid_pixels = 0;
    long invalid_pixels = 0;
};

MaskMatrix compute_validity_mask(const Matrix2Dd& frame, double valid_min = 0.0,
                                 double valid_max = kDefaultValidMax);

// Zeroes pixels outside [valid_min, valid_max]. NaN is never valid.
ValidityMaskResult apply_validity_mask(const Matrix2Dd& frame, double valid_min = 0.0,
                                       double valid_max = kDefaultValidMax);

} // namespace beam_analysis::image
