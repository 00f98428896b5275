#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/utils.hpp"
#include "beam_analysis/io/hdf5_io.hpp"
#include "beam_analysis/pipeline/write_back.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using beam_analysis::io::Hdf5ResultWriter;
using beam_analysis::io::ResultDescriptor;
using beam_analysis::pipeline::WriteBackTargets;
using beam_analysis::pipeline::write_back;

namespace {

const std::string kFlux = "/entry/sample/beam/beamAnalysis/flux";

std::vector<ResultDescriptor> flux_only(double value) {
    ResultDescriptor d;
    d.destination = kFlux;
    d.data_type = "float";
    d.values = {value};
    d.units = "counts/s";
    return {d};
}

fs::path make_measurement(const std::string& name) {
    const fs::path path = fs::temp_directory_path() / name;
    ResultDescriptor t;
    t.destination = "/entry/instrument/detector/count_time";
    t.values = {1.0};
    t.minimum_dimensionality = 0;
    Hdf5ResultWriter w(path, Hdf5ResultWriter::OpenMode::Truncate);
    w.attach(t);
    return path;
}

} // namespace

TEST_CASE("write_back_stores_sidecar_then_measurement") {
    const fs::path h5 = make_measurement("beam_analysis_test_wb_ok.h5");
    const fs::path sidecar = fs::temp_directory_path() / "beam_analysis_test_wb_ok.json";
    fs::remove(sidecar);

    WriteBackTargets targets;
    targets.measurement = h5;
    targets.sidecar = sidecar;
    auto written = write_back(flux_only(12.5), targets);

    REQUIRE(written.size() == 2);
    REQUIRE(written[0] == sidecar.string() + ":" + kFlux);
    REQUIRE(written[1] == h5.string() + ":" + kFlux);
    REQUIRE(beam_analysis::io::read_hdf5_values(h5, kFlux)[0] == Catch::Approx(12.5));
    REQUIRE(fs::exists(sidecar));

    fs::remove(h5);
    fs::remove(sidecar);
}

TEST_CASE("write_back_failed_sidecar_leaves_measurement_untouched") {
    const fs::path h5 = make_measurement("beam_analysis_test_wb_fail.h5");
    const fs::path sidecar = fs::temp_directory_path() / "beam_analysis_test_wb_fail.json";
    beam_analysis::core::write_text(sidecar, "{ broken");

    WriteBackTargets targets;
    targets.measurement = h5;
    targets.sidecar = sidecar;
    REQUIRE_THROWS_AS(write_back(flux_only(1.0), targets), beam_analysis::WriteError);

    REQUIRE_FALSE(beam_analysis::io::hdf5_object_exists(h5, kFlux));

    fs::remove(h5);
    fs::remove(sidecar);
}

TEST_CASE("write_back_fits_goes_to_sidecar_only") {
    const fs::path sidecar = fs::temp_directory_path() / "beam_analysis_test_wb_fits.json";
    fs::remove(sidecar);

    WriteBackTargets targets;
    targets.measurement = fs::temp_directory_path() / "beam_analysis_never_opened.fits";
    targets.format = beam_analysis::io::MeasurementFormat::FITS;
    targets.sidecar = sidecar;
    auto written = write_back(flux_only(3.0), targets);

    REQUIRE(written.size() == 1);
    REQUIRE_FALSE(fs::exists(targets.measurement));

    fs::remove(sidecar);
}
