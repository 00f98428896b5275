#include "beam_analysis/io/measurement.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/io/fits_io.hpp"
#include "beam_analysis/io/hdf5_io.hpp"

#include <numeric>

namespace beam_analysis::io {

const std::vector<std::string>& measurement_extensions() {
    static const std::vector<std::string> exts = {
        ".h5", ".hdf5", ".nxs", ".fit", ".fits", ".fts"
    };
    return exts;
}

MeasurementFormat detect_measurement_format(const fs::path& path) {
    if (is_hdf5_path(path)) return MeasurementFormat::HDF5;
    if (is_fits_image_path(path)) return MeasurementFormat::FITS;
    throw IOError("Unsupported measurement file type: " + path.string());
}

MeasurementInput load_measurement(const fs::path& path, const config::InputConfig& input) {
    MeasurementInput m;
    m.format = detect_measurement_format(path);

    if (m.format == MeasurementFormat::HDF5) {
        m.stack = read_hdf5_stack(path, input.image_dataset);
        m.exposure_values = read_hdf5_values(path, input.exposure_time_dataset);
        m.image_source = input.image_dataset;
        m.exposure_source = input.exposure_time_dataset;
    } else {
        auto [stack, header] = read_fits_stack(path);
        m.stack = std::move(stack);
        auto exposure = detect_exposure_time(header);
        if (!exposure) {
            throw IOError("No EXPTIME/EXPOSURE/ITIME keyword in " + path.string());
        }
        m.exposure_values = {*exposure};
        m.image_source = "primary HDU";
        m.exposure_source = "header";
    }

    if (m.exposure_values.empty()) {
        throw IOError("Exposure time dataset " + input.exposure_time_dataset + " is empty");
    }
    m.exposure_time = std::accumulate(m.exposure_values.begin(), m.exposure_values.end(), 0.0) /
                      static_cast<double>(m.exposure_values.size());
    return m;
}

} // namespace beam_analysis::io
