#include "beam_analysis/analysis/flux.hpp"
#include "beam_analysis/core/errors.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace beam_analysis::analysis {

void check_exposure_time(double exposure_time) {
    if (!(exposure_time > 0.0)) {
        std::ostringstream oss;
        oss << "exposure time must be > 0, got " << exposure_time;
        throw InvalidExposureTime(oss.str());
    }
}

PixelWindow compute_roi_window(const PixelPosition& center, int roi_size, int rows, int cols) {
    if (roi_size < 0) {
        throw ValidationError("roi_size must be >= 0");
    }
    if (!std::isfinite(center.row) || !std::isfinite(center.col)) {
        throw ValidationError("ROI center must be finite");
    }

    PixelWindow w;
    if (rows <= 0 || cols <= 0) {
        return w;
    }

    // Truncate [floor(c - R), floor(c + R)] to [0, hi]; a window entirely
    // off one axis selects nothing.
    auto truncate_axis = [](double c, int r, int hi, int& lo_out, int& hi_out) {
        const double lo = std::floor(c - r);
        const double up = std::floor(c + r);
        if (up < 0.0 || lo > static_cast<double>(hi)) {
            return false;
        }
        lo_out = lo < 0.0 ? 0 : static_cast<int>(lo);
        hi_out = up > static_cast<double>(hi) ? hi : static_cast<int>(up);
        return true;
    };

    if (!truncate_axis(center.row, roi_size, rows - 1, w.row_min, w.row_max) ||
        !truncate_axis(center.col, roi_size, cols - 1, w.col_min, w.col_max)) {
        return PixelWindow{};
    }
    return w;
}

FluxResult integrate_flux(const Matrix2Dd& masked, const PixelPosition& center,
                          double exposure_time, int roi_size) {
    check_exposure_time(exposure_time);

    const int h = static_cast<int>(masked.rows());
    const int w = static_cast<int>(masked.cols());

    FluxResult out;
    out.exposure_time = exposure_time;
    out.roi = compute_roi_window(center, roi_size, h, w);

    if (!out.roi.empty()) {
        cv::Mat view(h, w, CV_64F, const_cast<double*>(masked.data()));
        cv::Rect rect(out.roi.col_min, out.roi.row_min, out.roi.cols(), out.roi.rows());
        out.integrated_intensity = cv::sum(view(rect))[0];
        out.roi_pixels = static_cast<long>(out.roi.rows()) * out.roi.cols();
    }

    out.flux = out.integrated_intensity / exposure_time;
    return out;
}

} // namespace beam_analysis::analysis
