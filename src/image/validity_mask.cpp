#include "beam_analysis/image/validity_mask.hpp"
#include "beam_analysis/core/errors.hpp"

namespace beam_analysis::image {

MaskMatrix compute_validity_mask(const Matrix2Dd& frame, double valid_min, double valid_max) {
    if (valid_min > valid_max) {
        throw ValidationError("valid_min must be <= valid_max");
    }
    MaskMatrix mask(frame.rows(), frame.cols());
    const double* src = frame.data();
    uint8_t* dst = mask.data();
    for (Eigen::Index i = 0; i < frame.size(); ++i) {
        const double v = src[i];
        dst[i] = (v >= valid_min && v <= valid_max) ? 1 : 0;
    }
    return mask;
}

ValidityMaskResult apply_validity_mask(const Matrix2Dd& frame, double valid_min, double valid_max) {
    ValidityMaskResult out;
    out.valid = compute_validity_mask(frame, valid_min, valid_max);
    out.masked = Matrix2Dd::Zero(frame.rows(), frame.cols());

    const double* src = frame.data();
    const uint8_t* m = out.valid.data();
    double* dst = out.masked.data();
    for (Eigen::Index i = 0; i < frame.size(); ++i) {
        // select instead of multiply so NaN/inf never leak through
        if (m[i]) {
            dst[i] = src[i];
            ++out.valid_pixels;
        } else {
            ++out.invalid_pixels;
        }
    }
    return out;
}

} // namespace beam_analysis::image
