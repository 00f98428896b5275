#include "beam_analysis/config/configuration.hpp"
#include "beam_analysis/core/errors.hpp"

#include <filesystem>
#include <map>
#include <string>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using beam_analysis::ConfigError;
using beam_analysis::ValidationError;
using beam_analysis::config::Config;

TEST_CASE("config_defaults_are_valid") {
    Config cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.analysis.roi_size == 25);
    REQUIRE(cfg.analysis.valid_max == Catch::Approx(1.0e6));
    REQUIRE(cfg.analysis.region_selection == "largest");
    REQUIRE(cfg.input.image_dataset == "/entry/data/data_000001");
    REQUIRE(cfg.input.exposure_time_dataset == "/entry/instrument/detector/count_time");
}

TEST_CASE("config_from_yaml_overrides_only_given_fields") {
    YAML::Node node = YAML::Load(R"(
analysis:
  roi_size: 40
  connectivity: 4
  region_selection: merge
output:
  write_weighted_center_of_mass: true
  flux_units: photons/s
)");

    Config cfg = Config::from_yaml(node);

    REQUIRE(cfg.analysis.roi_size == 40);
    REQUIRE(cfg.analysis.connectivity == 4);
    REQUIRE(cfg.analysis.region_selection == "merge");
    REQUIRE(cfg.analysis.threshold_fraction == Catch::Approx(1.0e-4));
    REQUIRE(cfg.output.write_weighted_center_of_mass);
    REQUIRE(cfg.output.flux_units == "photons/s");
    REQUIRE(cfg.output.position_units == "px");
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_yaml_round_trip_through_file") {
    Config cfg;
    cfg.analysis.roi_size = 12;
    cfg.input.image_dataset = "/entry/data/data_000002";

    const auto path = std::filesystem::temp_directory_path() / "beam_analysis_test_config.yaml";
    cfg.save(path);
    Config loaded = Config::load(path);
    std::filesystem::remove(path);

    REQUIRE(loaded.analysis.roi_size == 12);
    REQUIRE(loaded.input.image_dataset == "/entry/data/data_000002");
}

TEST_CASE("config_bad_yaml_types_raise_config_error") {
    YAML::Node node = YAML::Load("analysis:\n  roi_size: wide\n");
    REQUIRE_THROWS_AS(Config::from_yaml(node), ConfigError);
    REQUIRE_THROWS_AS(Config::load("/nonexistent/beam_analysis.yaml"), ConfigError);
}

TEST_CASE("config_key_value_overrides") {
    Config cfg;
    cfg.apply_overrides({{"roi_size", "30"},
                         {"analysis.threshold_floor", "2.5"},
                         {"region_selection", "first"},
                         {"write_weighted_center_of_mass", "yes"}});

    REQUIRE(cfg.analysis.roi_size == 30);
    REQUIRE(cfg.analysis.threshold_floor == Catch::Approx(2.5));
    REQUIRE(cfg.analysis.region_selection == "first");
    REQUIRE(cfg.output.write_weighted_center_of_mass);

    REQUIRE_THROWS_AS(cfg.apply_overrides({{"roi_size", "30px"}}), ConfigError);
    REQUIRE_THROWS_AS(cfg.apply_overrides({{"beam_energy", "12"}}), ConfigError);
}

TEST_CASE("config_validate_rejects_out_of_range_values") {
    Config cfg;

    cfg.analysis.roi_size = -1;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    cfg = Config{};

    cfg.analysis.valid_min = 10.0;
    cfg.analysis.valid_max = 5.0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    cfg = Config{};

    cfg.analysis.connectivity = 6;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    cfg = Config{};

    cfg.analysis.threshold_floor = 0.0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    cfg = Config{};

    cfg.analysis.region_selection = "brightest";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    cfg = Config{};

    cfg.output.flux_dataset = "relative/flux";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("config_schema_is_json") {
    auto schema = nlohmann::json::parse(beam_analysis::config::get_schema_json());
    REQUIRE(schema["type"] == "object");
    REQUIRE(schema["properties"].contains("analysis"));
}
