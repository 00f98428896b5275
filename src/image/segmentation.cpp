#include "beam_analysis/image/segmentation.hpp"
#include "beam_analysis/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace beam_analysis::image {

namespace {

double frame_max(const Matrix2Dd& masked) {
    if (masked.size() == 0) return 0.0;
    cv::Mat view(static_cast<int>(masked.rows()), static_cast<int>(masked.cols()), CV_64F,
                 const_cast<double*>(masked.data()));
    double min_v = 0.0;
    double max_v = 0.0;
    cv::minMaxLoc(view, &min_v, &max_v);
    return max_v;
}

void check_threshold_params(double fraction, double floor) {
    if (!(fraction >= 0.0) || !std::isfinite(fraction)) {
        throw ValidationError("threshold fraction must be a finite value >= 0");
    }
    if (!(floor > 0.0) || !std::isfinite(floor)) {
        throw ValidationError("threshold floor must be a finite value > 0");
    }
}

} // namespace

double compute_threshold(const Matrix2Dd& masked, double fraction, double floor) {
    check_threshold_params(fraction, floor);
    return std::max(floor, fraction * frame_max(masked));
}

SegmentationResult segment_peak(const Matrix2Dd& masked, double fraction, double floor) {
    check_threshold_params(fraction, floor);

    SegmentationResult out;
    out.peak_value = frame_max(masked);
    out.threshold = std::max(floor, fraction * out.peak_value);
    out.foreground = MaskMatrix::Zero(masked.rows(), masked.cols());
    if (masked.size() == 0) {
        return out;
    }

    const int h = static_cast<int>(masked.rows());
    const int w = static_cast<int>(masked.cols());
    cv::Mat src(h, w, CV_64F, const_cast<double*>(masked.data()));
    cv::Mat fg(h, w, CV_8U, out.foreground.data());

    // THRESH_BINARY keeps src > thresh strictly
    cv::Mat binary;
    cv::threshold(src, binary, out.threshold, 1.0, cv::THRESH_BINARY);
    binary.convertTo(fg, CV_8U);

    out.foreground_pixels = cv::countNonZero(fg);
    return out;
}

} // namespace beam_analysis::image
