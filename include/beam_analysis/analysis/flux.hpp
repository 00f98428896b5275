#pragma once

#include "beam_analysis/core/types.hpp"

namespace beam_analysis::analysis {

constexpr int kDefaultRoiSize = 25;

struct FluxResult {
    PixelWindow roi;                 // clamped, inclusive
    long roi_pixels = 0;
    double integrated_intensity = 0.0;
    double exposure_time = 0.0;
    double flux = 0.0;               // integrated_intensity / exposure_time
};

// Throws InvalidExposureTime unless exposure_time > 0.
void check_exposure_time(double exposure_time);

// Square window [floor(c - roi_size), floor(c + roi_size)] on both axes,
// truncated to the frame. No wraparound, no padding; a window entirely
// outside the frame is empty.
PixelWindow compute_roi_window(const PixelPosition& center, int roi_size, int rows, int cols);

FluxResult integrate_flux(const Matrix2Dd& masked, const PixelPosition& center,
                          double exposure_time, int roi_size = kDefaultRoiSize);

} // namespace beam_analysis::analysis
