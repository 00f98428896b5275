#include "beam_analysis/config/configuration.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/utils.hpp"
#include "beam_analysis/core/types.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace beam_analysis::config {

static int parse_int_value(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw ConfigError("trailing characters in integer for '" + key + "': " + value);
        }
        return v;
    } catch (const std::invalid_argument&) {
        throw ConfigError("invalid integer for '" + key + "': " + value);
    } catch (const std::out_of_range&) {
        throw ConfigError("integer out of range for '" + key + "': " + value);
    }
}

static double parse_double_value(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        double v = std::stod(value, &pos);
        if (pos != value.size()) {
            throw ConfigError("trailing characters in number for '" + key + "': " + value);
        }
        return v;
    } catch (const std::invalid_argument&) {
        throw ConfigError("invalid number for '" + key + "': " + value);
    } catch (const std::out_of_range&) {
        throw ConfigError("number out of range for '" + key + "': " + value);
    }
}

static bool parse_bool_value(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ConfigError("invalid boolean for '" + key + "': " + value);
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }

    try {
        if (node["input"]) {
            auto i = node["input"];
            if (i["image_dataset"]) cfg.input.image_dataset = i["image_dataset"].as<std::string>();
            if (i["exposure_time_dataset"]) {
                cfg.input.exposure_time_dataset = i["exposure_time_dataset"].as<std::string>();
            }
        }

        if (node["analysis"]) {
            auto a = node["analysis"];
            if (a["roi_size"]) cfg.analysis.roi_size = a["roi_size"].as<int>();
            if (a["valid_min"]) cfg.analysis.valid_min = a["valid_min"].as<double>();
            if (a["valid_max"]) cfg.analysis.valid_max = a["valid_max"].as<double>();
            if (a["threshold_fraction"]) cfg.analysis.threshold_fraction = a["threshold_fraction"].as<double>();
            if (a["threshold_floor"]) cfg.analysis.threshold_floor = a["threshold_floor"].as<double>();
            if (a["connectivity"]) cfg.analysis.connectivity = a["connectivity"].as<int>();
            if (a["region_selection"]) cfg.analysis.region_selection = a["region_selection"].as<std::string>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["center_of_mass_dataset"]) {
                cfg.output.center_of_mass_dataset = o["center_of_mass_dataset"].as<std::string>();
            }
            if (o["weighted_center_of_mass_dataset"]) {
                cfg.output.weighted_center_of_mass_dataset =
                    o["weighted_center_of_mass_dataset"].as<std::string>();
            }
            if (o["flux_dataset"]) cfg.output.flux_dataset = o["flux_dataset"].as<std::string>();
            if (o["write_weighted_center_of_mass"]) {
                cfg.output.write_weighted_center_of_mass = o["write_weighted_center_of_mass"].as<bool>();
            }
            if (o["position_units"]) cfg.output.position_units = o["position_units"].as<std::string>();
            if (o["flux_units"]) cfg.output.flux_units = o["flux_units"].as<std::string>();
            if (o["note"]) cfg.output.note = o["note"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["input"]["image_dataset"] = input.image_dataset;
    node["input"]["exposure_time_dataset"] = input.exposure_time_dataset;

    node["analysis"]["roi_size"] = analysis.roi_size;
    node["analysis"]["valid_min"] = analysis.valid_min;
    node["analysis"]["valid_max"] = analysis.valid_max;
    node["analysis"]["threshold_fraction"] = analysis.threshold_fraction;
    node["analysis"]["threshold_floor"] = analysis.threshold_floor;
    node["analysis"]["connectivity"] = analysis.connectivity;
    node["analysis"]["region_selection"] = analysis.region_selection;

    node["output"]["center_of_mass_dataset"] = output.center_of_mass_dataset;
    node["output"]["weighted_center_of_mass_dataset"] = output.weighted_center_of_mass_dataset;
    node["output"]["flux_dataset"] = output.flux_dataset;
    node["output"]["write_weighted_center_of_mass"] = output.write_weighted_center_of_mass;
    node["output"]["position_units"] = output.position_units;
    node["output"]["flux_units"] = output.flux_units;
    node["output"]["note"] = output.note;

    return node;
}

void Config::save(const fs::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    YAML::Emitter emitter;
    emitter << to_yaml();
    file << emitter.c_str() << "\n";
}

void Config::apply_overrides(const std::map<std::string, std::string>& overrides) {
    for (const auto& [raw_key, value] : overrides) {
        std::string key = raw_key;
        const std::string prefix = "analysis.";
        if (core::starts_with(key, prefix)) {
            key = key.substr(prefix.size());
        }

        if (key == "roi_size") {
            analysis.roi_size = parse_int_value(raw_key, value);
        } else if (key == "valid_min") {
            analysis.valid_min = parse_double_value(raw_key, value);
        } else if (key == "valid_max") {
            analysis.valid_max = parse_double_value(raw_key, value);
        } else if (key == "threshold_fraction") {
            analysis.threshold_fraction = parse_double_value(raw_key, value);
        } else if (key == "threshold_floor") {
            analysis.threshold_floor = parse_double_value(raw_key, value);
        } else if (key == "connectivity") {
            analysis.connectivity = parse_int_value(raw_key, value);
        } else if (key == "region_selection") {
            analysis.region_selection = value;
        } else if (key == "write_weighted_center_of_mass" ||
                   key == "output.write_weighted_center_of_mass") {
            output.write_weighted_center_of_mass = parse_bool_value(raw_key, value);
        } else {
            throw ConfigError("unknown override key '" + raw_key + "'");
        }
    }
}

void Config::validate() const {
    if (input.image_dataset.empty()) {
        throw ValidationError("input.image_dataset must not be empty");
    }
    if (input.exposure_time_dataset.empty()) {
        throw ValidationError("input.exposure_time_dataset must not be empty");
    }

    if (analysis.roi_size < 0) {
        throw ValidationError("analysis.roi_size must be >= 0");
    }
    if (!std::isfinite(analysis.valid_min) || std::isnan(analysis.valid_max)) {
        throw ValidationError("analysis.valid_min/valid_max must be numbers");
    }
    if (analysis.valid_min > analysis.valid_max) {
        throw ValidationError("analysis.valid_min must be <= analysis.valid_max");
    }
    if (!(analysis.threshold_fraction >= 0.0) || !std::isfinite(analysis.threshold_fraction)) {
        throw ValidationError("analysis.threshold_fraction must be >= 0");
    }
    if (!(analysis.threshold_floor > 0.0) || !std::isfinite(analysis.threshold_floor)) {
        throw ValidationError("analysis.threshold_floor must be > 0");
    }
    if (analysis.connectivity != 4 && analysis.connectivity != 8) {
        throw ValidationError("analysis.connectivity must be 4 or 8");
    }
    RegionSelection sel;
    if (!string_to_region_selection(analysis.region_selection, sel)) {
        throw ValidationError("analysis.region_selection must be 'largest', 'first' or 'merge'");
    }

    if (output.center_of_mass_dataset.empty() || output.flux_dataset.empty()) {
        throw ValidationError("output.center_of_mass_dataset and output.flux_dataset must not be empty");
    }
    if (output.write_weighted_center_of_mass && output.weighted_center_of_mass_dataset.empty()) {
        throw ValidationError("output.weighted_center_of_mass_dataset must not be empty");
    }
    if (output.center_of_mass_dataset.front() != '/' || output.flux_dataset.front() != '/') {
        throw ValidationError("output dataset paths must be absolute");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "input": {
      "type": "object",
      "properties": {
        "image_dataset": {"type": "string"},
        "exposure_time_dataset": {"type": "string"}
      }
    },
    "analysis": {
      "type": "object",
      "properties": {
        "roi_size": {"type": "integer", "minimum": 0},
        "valid_min": {"type": "number"},
        "valid_max": {"type": "number"},
        "threshold_fraction": {"type": "number", "minimum": 0},
        "threshold_floor": {"type": "number", "exclusiveMinimum": 0},
        "connectivity": {"type": "integer", "enum": [4, 8]},
        "region_selection": {"type": "string", "enum": ["largest", "first", "merge"]}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "center_of_mass_dataset": {"type": "string"},
        "weighted_center_of_mass_dataset": {"type": "string"},
        "flux_dataset": {"type": "string"},
        "write_weighted_center_of_mass": {"type": "boolean"},
        "position_units": {"type": "string"},
        "flux_units": {"type": "string"},
        "note": {"type": "string"}
      }
    }
  }
})";
}

} // namespace beam_analysis::config
