#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/events.hpp"
#include "beam_analysis/core/utils.hpp"
#include "beam_analysis/io/measurement.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
namespace core = beam_analysis::core;

TEST_CASE("parse_key_values_splits_on_first_equals") {
    auto kv = core::parse_key_values({"roi_size=30", " note = a=b ", "empty="});

    REQUIRE(kv.size() == 3);
    REQUIRE(kv.at("roi_size") == "30");
    REQUIRE(kv.at("note") == "a=b");
    REQUIRE(kv.at("empty").empty());

    REQUIRE_THROWS_AS(core::parse_key_values({"roi_size"}), beam_analysis::ConfigError);
    REQUIRE_THROWS_AS(core::parse_key_values({"=5"}), beam_analysis::ConfigError);
}

TEST_CASE("measurement_extensions_are_case_insensitive") {
    const auto& exts = beam_analysis::io::measurement_extensions();

    REQUIRE(core::has_extension("scan.h5", exts));
    REQUIRE(core::has_extension("scan.HDF5", exts));
    REQUIRE(core::has_extension("scan.Nxs", exts));
    REQUIRE(core::has_extension("frame.fits", exts));
    REQUIRE_FALSE(core::has_extension("scan.tif", exts));
    REQUIRE_FALSE(core::has_extension("scan", exts));

    REQUIRE_THROWS_AS(core::file_check_extension("scan.txt", exts), beam_analysis::IOError);
    REQUIRE_NOTHROW(core::file_check_extension("scan.NXS", exts));
}

TEST_CASE("file_exists_and_is_file_rejects_directories_and_missing_paths") {
    const fs::path dir = fs::temp_directory_path();
    REQUIRE_THROWS_AS(core::file_exists_and_is_file(dir), beam_analysis::IOError);
    REQUIRE_THROWS_AS(core::file_exists_and_is_file(dir / "beam_analysis_no_such_file.h5"),
                      beam_analysis::IOError);

    const fs::path file = dir / "beam_analysis_test_exists.txt";
    core::write_text(file, "x");
    REQUIRE_NOTHROW(core::file_exists_and_is_file(file));
    fs::remove(file);
}

TEST_CASE("sha256_of_known_input") {
    const std::string abc = "abc";
    std::vector<uint8_t> bytes(abc.begin(), abc.end());
    REQUIRE(core::sha256_bytes(bytes) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("string_helpers") {
    REQUIRE(core::trim("  a b \t") == "a b");
    REQUIRE(core::to_lower("NeXus") == "nexus");
    REQUIRE(core::split("a,b,,c", ',') == std::vector<std::string>{"a", "b", "", "c"});
    REQUIRE(core::join({"x", "y"}, ", ") == "x, y");
    REQUIRE(core::starts_with("analysis.roi_size", "analysis."));
    REQUIRE(core::ends_with("scan.nxs", ".nxs"));
}

TEST_CASE("event_emitter_filters_by_level") {
    core::EventEmitter emitter(core::LogLevel::WARNING);
    std::ostringstream out;

    emitter.info("run", "hidden", out);
    emitter.phase_start("run", beam_analysis::Phase::MASK, out);
    REQUIRE(out.str().empty());

    emitter.warning("run", "shown", out);
    auto ev = nlohmann::json::parse(out.str());
    REQUIRE(ev["type"] == "warning");
    REQUIRE(ev["message"] == "shown");
    REQUIRE(ev["run_id"] == "run");

    out.str("");
    emitter.log("run", core::LogLevel::ERROR, "failed", {{"code", 3}}, out);
    auto le = nlohmann::json::parse(out.str());
    REQUIRE(le["type"] == "log");
    REQUIRE(le["level"] == "error");
    REQUIRE(le["code"] == 3);

    out.str("");
    emitter.phase_end("run", beam_analysis::Phase::REGION, "error", {{"error", "boom"}}, out);
    auto pe = nlohmann::json::parse(out.str());
    REQUIRE(pe["type"] == "phase_end");
    REQUIRE(pe["phase_name"] == "REGION");
    REQUIRE(pe["status"] == "error");
}

TEST_CASE("verbosity_maps_to_log_levels") {
    REQUIRE(core::log_level_from_verbosity(0) == core::LogLevel::WARNING);
    REQUIRE(core::log_level_from_verbosity(1) == core::LogLevel::INFO);
    REQUIRE(core::log_level_from_verbosity(2) == core::LogLevel::DEBUG);
    REQUIRE(core::log_level_from_verbosity(5) == core::LogLevel::DEBUG);
}
