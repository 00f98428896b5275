#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/utils.hpp"
#include "beam_analysis/io/json_writer.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using beam_analysis::io::JsonResultWriter;
using beam_analysis::io::ResultDescriptor;
using nlohmann::json;

namespace {

ResultDescriptor flux_descriptor(double value) {
    ResultDescriptor d;
    d.destination = "/entry/sample/beam/beamAnalysis/flux";
    d.data_type = "float";
    d.values = {value};
    d.units = "counts/s";
    d.attributes["note"] = "test";
    return d;
}

} // namespace

TEST_CASE("json_sidecar_collects_descriptors_by_destination") {
    const fs::path path = fs::temp_directory_path() / "beam_analysis_test_sidecar.json";
    fs::remove(path);

    ResultDescriptor com;
    com.destination = "/entry/sample/beam/beamAnalysis/centerOfMass";
    com.data_type = "float32";
    com.values = {1.5, 2.5};
    com.shape = {2};
    com.units = "px";

    JsonResultWriter w(path);
    w.attach_all({com, flux_descriptor(10.0)});
    w.attach(flux_descriptor(20.0));

    json doc = json::parse(beam_analysis::core::read_text(path));
    REQUIRE(doc.size() == 2);

    const auto& flux = doc["/entry/sample/beam/beamAnalysis/flux"];
    REQUIRE(flux["values"][0] == 20.0);
    REQUIRE(flux["shape"] == json::array({1}));
    REQUIRE(flux["units"] == "counts/s");
    REQUIRE(flux["attributes"]["note"] == "test");

    const auto& c = doc["/entry/sample/beam/beamAnalysis/centerOfMass"];
    REQUIRE(c["values"] == json::array({1.5, 2.5}));
    REQUIRE(c["data_type"] == "float32");

    fs::remove(path);
}

TEST_CASE("json_sidecar_rejects_corrupt_files") {
    const fs::path path = fs::temp_directory_path() / "beam_analysis_test_corrupt.json";
    beam_analysis::core::write_text(path, "[1, 2, 3]");

    JsonResultWriter w(path);
    REQUIRE_THROWS_AS(w.attach(flux_descriptor(1.0)), beam_analysis::WriteError);

    beam_analysis::core::write_text(path, "{ not json");
    REQUIRE_THROWS_AS(w.attach(flux_descriptor(1.0)), beam_analysis::WriteError);

    fs::remove(path);
}
