#include "beam_analysis/core/types.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/utils.hpp"

#include <sstream>

namespace beam_analysis {

size_t DetectorStack::element_count() const {
    if (shape.empty()) return 0;
    size_t n = 1;
    for (size_t d : shape) {
        n *= d;
    }
    return n;
}

void DetectorStack::validate() const {
    if (element_count() != data.size()) {
        throw ShapeError("data holds " + std::to_string(data.size()) +
                         " values but shape " + shape_to_string(shape) +
                         " needs " + std::to_string(element_count()));
    }
}

DetectorStack DetectorStack::from_frame(const Matrix2Dd& frame) {
    DetectorStack stack;
    stack.shape = {static_cast<size_t>(frame.rows()), static_cast<size_t>(frame.cols())};
    stack.data.assign(frame.data(), frame.data() + frame.size());
    return stack;
}

std::string shape_to_string(const std::vector<size_t>& shape) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    oss << ")";
    return oss.str();
}

bool string_to_region_selection(const std::string& s, RegionSelection& out) {
    const std::string norm = core::to_lower(core::trim(s));
    if (norm == "largest") {
        out = RegionSelection::LARGEST;
        return true;
    }
    if (norm == "first") {
        out = RegionSelection::FIRST;
        return true;
    }
    if (norm == "merge") {
        out = RegionSelection::MERGE;
        return true;
    }
    return false;
}

} // namespace beam_analysis
