#include "beam_analysis/pipeline/write_back.hpp"
#include "beam_analysis/io/hdf5_io.hpp"
#include "beam_analysis/io/json_writer.hpp"

namespace beam_analysis::pipeline {

std::vector<std::string> write_back(const std::vector<io::ResultDescriptor>& descriptors,
                                    const WriteBackTargets& targets) {
    std::vector<std::string> written;

    if (!targets.sidecar.empty()) {
        io::JsonResultWriter sidecar(targets.sidecar);
        sidecar.attach_all(descriptors);
        for (const auto& d : descriptors) {
            written.push_back(targets.sidecar.string() + ":" + d.destination);
        }
    }

    if (targets.format == io::MeasurementFormat::HDF5) {
        io::Hdf5ResultWriter writer(targets.measurement);
        writer.attach_all(descriptors);
        writer.flush();
        for (const auto& d : descriptors) {
            written.push_back(targets.measurement.string() + ":" + d.destination);
        }
    }
    return written;
}

} // namespace beam_analysis::pipeline
