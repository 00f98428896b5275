#include "beam_analysis/image/frame_reduction.hpp"
#include "beam_analysis/core/errors.hpp"

namespace beam_analysis::image {

DetectorStack mean_over_leading_axis(const DetectorStack& stack) {
    if (stack.rank() < 3) {
        throw ShapeError("cannot average over axis 0 of a rank-" +
                         std::to_string(stack.rank()) + " array");
    }
    stack.validate();

    const size_t n = stack.shape[0];
    if (n == 0) {
        throw ShapeError("axis 0 has length 0 in shape " + shape_to_string(stack.shape));
    }

    DetectorStack out;
    out.shape.assign(stack.shape.begin() + 1, stack.shape.end());
    const size_t slab = out.element_count();
    out.data.assign(slab, 0.0);

    for (size_t k = 0; k < n; ++k) {
        const double* src = stack.data.data() + k * slab;
        for (size_t i = 0; i < slab; ++i) {
            out.data[i] += src[i];
        }
    }
    const double inv_n = 1.0 / static_cast<double>(n);
    for (double& v : out.data) {
        v *= inv_n;
    }
    return out;
}

Matrix2Dd reduce_to_2d(const DetectorStack& stack) {
    if (stack.rank() < 2) {
        throw ShapeError("detector data must have at least 2 dimensions, got shape " +
                         shape_to_string(stack.shape));
    }
    stack.validate();
    for (size_t d : stack.shape) {
        if (d == 0) {
            throw ShapeError("zero-length axis in shape " + shape_to_string(stack.shape));
        }
    }

    DetectorStack current = stack;
    while (current.rank() > 2) {
        current = mean_over_leading_axis(current);
    }

    const auto rows = static_cast<Eigen::Index>(current.shape[0]);
    const auto cols = static_cast<Eigen::Index>(current.shape[1]);
    return Eigen::Map<const Matrix2Dd>(current.data.data(), rows, cols);
}

} // namespace beam_analysis::image
