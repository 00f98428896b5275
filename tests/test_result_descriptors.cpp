#include "beam_analysis/config/configuration.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/pipeline/beam_pipeline.hpp"
#include "beam_analysis/pipeline/result_descriptors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using beam_analysis::config::OutputConfig;
using beam_analysis::io::ResultDescriptor;
using beam_analysis::pipeline::BeamAnalysisResult;
using beam_analysis::pipeline::build_result_descriptors;

namespace {

BeamAnalysisResult sample_result() {
    BeamAnalysisResult r;
    r.regions.primary.centroid = {12.0, 34.0};
    r.regions.primary.weighted_centroid = {12.5, 33.5};
    r.flux.flux = 987.5;
    return r;
}

} // namespace

TEST_CASE("descriptors_default_layout") {
    OutputConfig out;
    auto ds = build_result_descriptors(sample_result(), out);

    REQUIRE(ds.size() == 2);

    const auto& com = ds[0];
    REQUIRE(com.destination == "/entry/sample/beam/beamAnalysis/centerOfMass");
    REQUIRE(com.data_type == "float32");
    REQUIRE(com.units == "px");
    REQUIRE(com.minimum_dimensionality == 1);
    REQUIRE(com.values == std::vector<double>{12.0, 34.0});
    REQUIRE(com.storage_shape() == std::vector<size_t>{2});
    REQUIRE(com.attributes.at("note") == "Determined by a post-translation processing script.");

    const auto& flux = ds[1];
    REQUIRE(flux.destination == "/entry/sample/beam/beamAnalysis/flux");
    REQUIRE(flux.data_type == "float");
    REQUIRE(flux.units == "counts/s");
    REQUIRE(flux.shape.empty());
    REQUIRE(flux.storage_shape() == std::vector<size_t>{1});
    REQUIRE(flux.values[0] == Catch::Approx(987.5));
}

TEST_CASE("descriptors_optional_weighted_center") {
    OutputConfig out;
    out.write_weighted_center_of_mass = true;
    auto ds = build_result_descriptors(sample_result(), out);

    REQUIRE(ds.size() == 3);
    REQUIRE(ds[2].destination == out.weighted_center_of_mass_dataset);
    REQUIRE(ds[2].values == std::vector<double>{12.5, 33.5});
}

TEST_CASE("descriptor_validation") {
    ResultDescriptor d;
    d.destination = "/entry/x";
    d.values = {1.0, 2.0};
    d.shape = {2};
    REQUIRE_NOTHROW(d.validate());

    d.shape = {3};
    REQUIRE_THROWS_AS(d.validate(), beam_analysis::WriteError);

    d.shape = {2};
    d.destination = "entry/x";
    REQUIRE_THROWS_AS(d.validate(), beam_analysis::WriteError);

    d.destination = "/entry/x";
    d.data_type = "complex64";
    REQUIRE_THROWS_AS(d.validate(), beam_analysis::WriteError);

    d.data_type = "float64";
    d.minimum_dimensionality = 3;
    REQUIRE(d.storage_shape() == std::vector<size_t>{1, 1, 2});
}

TEST_CASE("descriptors_reject_relative_destinations") {
    OutputConfig out;
    out.flux_dataset = "flux";
    REQUIRE_THROWS_AS(build_result_descriptors(sample_result(), out), beam_analysis::WriteError);
}
