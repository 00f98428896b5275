#pragma once

#include "beam_analysis/config/configuration.hpp"
#include "beam_analysis/core/types.hpp"

#include <string>
#include <vector>

namespace beam_analysis::io {

enum class MeasurementFormat {
    HDF5,
    FITS
};

struct MeasurementInput {
    MeasurementFormat format = MeasurementFormat::HDF5;
    DetectorStack stack;
    std::vector<double> exposure_values;  // as stored
    double exposure_time = 0.0;           // mean of exposure_values
    std::string image_source;             // dataset path or FITS HDU description
    std::string exposure_source;
};

// Extensions accepted for measurement files (case-insensitive)
const std::vector<std::string>& measurement_extensions();

MeasurementFormat detect_measurement_format(const fs::path& path);

// Reads detector data and exposure time. Throws IOError (missing data or
// exposure), ShapeError (rank < 2).
MeasurementInput load_measurement(const fs::path& path, const config::InputConfig& input);

} // namespace beam_analysis::io
