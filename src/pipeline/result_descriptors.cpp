#include "beam_analysis/pipeline/result_descriptors.hpp"

namespace beam_analysis::pipeline {

static io::ResultDescriptor position_descriptor(const std::string& destination,
                                                const PixelPosition& p,
                                                const config::OutputConfig& output) {
    io::ResultDescriptor d;
    d.destination = destination;
    d.minimum_dimensionality = 1;
    d.data_type = "float32";
    d.values = {p.row, p.col};
    d.shape = {2};
    d.units = output.position_units;
    d.attributes["note"] = output.note;
    return d;
}

std::vector<io::ResultDescriptor> build_result_descriptors(const BeamAnalysisResult& result,
                                                           const config::OutputConfig& output) {
    std::vector<io::ResultDescriptor> out;

    out.push_back(position_descriptor(output.center_of_mass_dataset,
                                      result.center_of_mass(), output));

    io::ResultDescriptor flux;
    flux.destination = output.flux_dataset;
    flux.minimum_dimensionality = 1;
    flux.data_type = "float";
    flux.values = {result.flux.flux};
    flux.units = output.flux_units;
    flux.attributes["note"] = output.note;
    out.push_back(flux);

    if (output.write_weighted_center_of_mass) {
        out.push_back(position_descriptor(output.weighted_center_of_mass_dataset,
                                          result.weighted_center_of_mass(), output));
    }

    for (const auto& d : out) {
        d.validate();
    }
    return out;
}

} // namespace beam_analysis::pipeline
