#include "beam_analysis/io/result_writer.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/types.hpp"

namespace beam_analysis::io {

bool is_known_data_type(const std::string& data_type) {
    return data_type == "float32" || data_type == "float64" || data_type == "float" ||
           data_type == "int32" || data_type == "int64";
}

std::vector<size_t> ResultDescriptor::storage_shape() const {
    std::vector<size_t> dims = shape;
    while (static_cast<int>(dims.size()) < minimum_dimensionality) {
        dims.insert(dims.begin(), 1);
    }
    return dims;
}

void ResultDescriptor::validate() const {
    if (destination.empty() || destination.front() != '/') {
        throw WriteError("destination must be an absolute path: '" + destination + "'");
    }
    if (destination.back() == '/') {
        throw WriteError("destination must name a dataset: '" + destination + "'");
    }
    if (minimum_dimensionality < 0) {
        throw WriteError("negative minimum dimensionality for " + destination);
    }
    if (!is_known_data_type(data_type)) {
        throw WriteError("unsupported data type '" + data_type + "' for " + destination);
    }
    size_t expected = 1;
    for (size_t d : shape) {
        expected *= d;
    }
    if (expected != values.size()) {
        throw WriteError(destination + ": " + std::to_string(values.size()) +
                         " values do not fit shape " + shape_to_string(shape));
    }
}

} // namespace beam_analysis::io
