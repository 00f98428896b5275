#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace beam_analysis::io {

// One derived value destined for the measurement's hierarchical store.
struct ResultDescriptor {
    std::string destination;             // absolute path, e.g. /entry/sample/beam/...
    int minimum_dimensionality = 1;
    std::string data_type = "float64";   // float32 | float64 | float | int32 | int64
    std::vector<double> values;          // row-major
    std::vector<size_t> shape;           // empty = scalar
    std::string units;
    std::map<std::string, std::string> attributes;

    // Shape padded with leading 1s up to minimum_dimensionality
    std::vector<size_t> storage_shape() const;

    // Throws WriteError on an inconsistent descriptor
    void validate() const;
};

// Write-back boundary. attach() stores one descriptor at its destination,
// creating intermediate structure and replacing a previous value at the
// same path; sibling values are left untouched. Failures throw WriteError.
class ResultWriter {
public:
    virtual ~ResultWriter() = default;

    virtual void attach(const ResultDescriptor& descriptor) = 0;

    void attach_all(const std::vector<ResultDescriptor>& descriptors) {
        for (const auto& d : descriptors) {
            attach(d);
        }
    }
};

bool is_known_data_type(const std::string& data_type);

} // namespace beam_analysis::io
