#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <yaml-cpp/yaml.h>

namespace beam_analysis::config {

namespace fs = std::filesystem;

struct InputConfig {
  std::string image_dataset = "/entry/data/data_000001";
  std::string exposure_time_dataset = "/entry/instrument/detector/count_time";
};

struct AnalysisConfig {
  int roi_size = 25;              // ROI half-width in pixels
  double valid_min = 0.0;         // sensor-valid interval [valid_min, valid_max]
  double valid_max = 1.0e6;       // Eiger overflow / masked marker
  double threshold_fraction = 1.0e-4;
  double threshold_floor = 1.0;
  int connectivity = 8;           // 4 | 8
  std::string region_selection = "largest"; // largest | first | merge
};

struct OutputConfig {
  std::string center_of_mass_dataset = "/entry/sample/beam/beamAnalysis/centerOfMass";
  std::string weighted_center_of_mass_dataset =
      "/entry/sample/beam/beamAnalysis/weightedCenterOfMass";
  std::string flux_dataset = "/entry/sample/beam/beamAnalysis/flux";
  bool write_weighted_center_of_mass = false;
  std::string position_units = "px";
  std::string flux_units = "counts/s";
  std::string note = "Determined by a post-translation processing script.";
};

struct Config {
  InputConfig input;
  AnalysisConfig analysis;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  // Applies `-k key=value` overrides. Keys are analysis.* field names,
  // optionally prefixed with their section ("analysis.roi_size").
  void apply_overrides(const std::map<std::string, std::string> &overrides);

  void validate() const;
};

std::string get_schema_json();

} // namespace beam_analysis::config
