#include "beam_analysis/config/configuration.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/events.hpp"
#include "beam_analysis/core/types.hpp"
#include "beam_analysis/core/utils.hpp"
#include "beam_analysis/io/json_writer.hpp"
#include "beam_analysis/io/measurement.hpp"
#include "beam_analysis/pipeline/beam_pipeline.hpp"
#include "beam_analysis/pipeline/result_descriptors.hpp"
#include "beam_analysis/pipeline/write_back.hpp"

#include "runner_shared.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

using beam_analysis::Phase;
namespace core = beam_analysis::core;
namespace config = beam_analysis::config;
namespace io = beam_analysis::io;
namespace pipeline = beam_analysis::pipeline;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct RunOptions {
  std::string filename;
  std::vector<std::string> auxiliary_files;
  std::string config_path;
  std::vector<std::string> keyvals;
  int verbosity = 0;
  bool very_verbose = false;
  bool log_to_file = false;
  std::string sidecar;
  bool dry_run = false;
};

void print_json(const json &j) { std::cout << j.dump(2) << std::endl; }

fs::path validate_measurement_file(const std::string &p) {
  fs::path path(p);
  core::file_exists_and_is_file(path);
  core::file_check_extension(path, io::measurement_extensions());
  return path;
}

config::Config load_run_config(const RunOptions &opts) {
  config::Config cfg;
  if (!opts.config_path.empty()) {
    cfg = config::Config::load(opts.config_path);
  }
  if (!opts.keyvals.empty()) {
    cfg.apply_overrides(core::parse_key_values(opts.keyvals));
  }
  cfg.validate();
  return cfg;
}

bool all_equal(const std::vector<double> &v) {
  return std::adjacent_find(v.begin(), v.end(), std::not_equal_to<double>()) ==
         v.end();
}

int run_command(const RunOptions &opts) {
  fs::path input;
  std::vector<fs::path> aux;
  config::Config cfg;
  pipeline::AnalysisParams params;
  try {
    input = validate_measurement_file(opts.filename);
    for (const auto &a : opts.auxiliary_files) {
      aux.push_back(validate_measurement_file(a));
    }
    cfg = load_run_config(opts);
    params = pipeline::AnalysisParams::from_config(cfg.analysis);
  } catch (const beam_analysis::BeamAnalysisError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }

  const io::MeasurementFormat format = io::detect_measurement_format(input);
  if (format == io::MeasurementFormat::FITS && opts.sidecar.empty() &&
      !opts.dry_run) {
    std::cerr << "Error: FITS inputs cannot be written back in place; use "
                 "--sidecar <file.json> or --dry-run"
              << std::endl;
    return kExitUsage;
  }

  // Event log: stderr, optionally tee'd into a timestamped file
  std::ofstream log_file_stream;
  std::unique_ptr<beam_analysis::runner::TeeBuf> tee_buf;
  std::ostream log(std::cerr.rdbuf());
  fs::path log_path;
  if (opts.log_to_file) {
    log_path = fs::current_path() /
               ("BeamAnalysis_" + core::get_file_timestamp() + ".log");
    log_file_stream.open(log_path);
    if (!log_file_stream) {
      std::cerr << "Error: cannot open log file " << log_path << std::endl;
      return kExitUsage;
    }
    tee_buf = std::make_unique<beam_analysis::runner::TeeBuf>(std::cerr.rdbuf(),
                                               log_file_stream.rdbuf());
    log.rdbuf(tee_buf.get());
  }

  core::EventEmitter emitter(core::log_level_from_verbosity(
      opts.very_verbose ? 2 : opts.verbosity));
  const std::string run_id = core::get_run_id();

  json start_extra = {{"input", input.string()},
                      {"dry_run", opts.dry_run},
                      {"analysis", params.to_json()}};
  start_extra["auxiliary_files"] = json::array();
  for (const auto &a : aux) {
    start_extra["auxiliary_files"].push_back(a.string());
  }
  if (!opts.config_path.empty()) {
    start_extra["config_path"] = opts.config_path;
    start_extra["config_sha256"] = core::sha256_file(opts.config_path);
  }
  if (!log_path.empty()) {
    start_extra["log_file"] = log_path.string();
  }
  emitter.run_start(run_id, start_extra, log);
  emitter.info(run_id, "Processing input file: " + input.string(), log);
  for (const auto &a : aux) {
    emitter.info(run_id, "Using auxiliary file: " + a.string(), log);
  }

  // LOAD_INPUT
  emitter.phase_start(run_id, Phase::LOAD_INPUT, log);
  io::MeasurementInput measurement;
  try {
    measurement = io::load_measurement(input, cfg.input);
  } catch (const std::exception &e) {
    emitter.phase_end(run_id, Phase::LOAD_INPUT, "error", {{"error", e.what()}},
                      log);
    emitter.error(run_id, e.what(), log);
    emitter.run_end(run_id, false, "error", log);
    return kExitFailure;
  }
  if (measurement.exposure_values.size() > 1 &&
      !all_equal(measurement.exposure_values)) {
    emitter.warning(run_id,
                    "Exposure time dataset holds " +
                        std::to_string(measurement.exposure_values.size()) +
                        " differing values; using their mean",
                    log);
  }
  emitter.phase_end(
      run_id, Phase::LOAD_INPUT, "ok",
      {{"image_source", measurement.image_source},
       {"shape", measurement.stack.shape},
       {"exposure_source", measurement.exposure_source},
       {"exposure_time", measurement.exposure_time}},
      log);

  // REDUCE .. FLUX
  pipeline::BeamAnalyzer analyzer(params);
  analyzer.set_phase_callback(
      [&](Phase phase, const std::string &status, const json &extra) {
        if (status == "start") {
          emitter.phase_start(run_id, phase, log);
        } else {
          emitter.phase_end(run_id, phase, status, extra, log);
        }
      });

  pipeline::BeamAnalysisResult result;
  try {
    result = analyzer.analyze(measurement.stack, measurement.exposure_time);
  } catch (const std::exception &e) {
    emitter.error(run_id, e.what(), log);
    emitter.run_end(run_id, false, "error", log);
    return kExitFailure;
  }

  emitter.debug(run_id, "center of mass",
                {{"center_of_mass",
                  {result.center_of_mass().row, result.center_of_mass().col}},
                 {"weighted_center_of_mass",
                  {result.weighted_center_of_mass().row,
                   result.weighted_center_of_mass().col}}},
                log);
  emitter.debug(run_id, "region intensity",
                {{"integrated_intensity", result.flux.integrated_intensity},
                 {"flux", result.flux.flux},
                 {"flux_units", cfg.output.flux_units}},
                log);

  // WRITE_BACK
  std::vector<io::ResultDescriptor> descriptors;
  json written = json::array();
  emitter.phase_start(run_id, Phase::WRITE_BACK, log);
  try {
    descriptors = pipeline::build_result_descriptors(result, cfg.output);
    if (!opts.dry_run) {
      pipeline::WriteBackTargets targets;
      targets.measurement = input;
      targets.format = format;
      targets.sidecar = opts.sidecar;
      for (const auto &w : pipeline::write_back(descriptors, targets)) {
        written.push_back(w);
      }
    }
  } catch (const std::exception &e) {
    emitter.phase_end(run_id, Phase::WRITE_BACK, "error", {{"error", e.what()}},
                      log);
    emitter.error(run_id, e.what(), log);
    emitter.run_end(run_id, false, "error", log);
    return kExitFailure;
  }
  emitter.phase_end(run_id, Phase::WRITE_BACK, opts.dry_run ? "skipped" : "ok",
                    {{"written", written}}, log);

  json out;
  out["ok"] = true;
  out["run_id"] = run_id;
  out["input"] = input.string();
  out["dry_run"] = opts.dry_run;
  out["result"] = result.summary();
  out["descriptors"] = json::array();
  for (const auto &d : descriptors) {
    json dj = io::descriptor_to_json(d);
    dj["destination"] = d.destination;
    out["descriptors"].push_back(dj);
  }
  out["written"] = written;
  print_json(out);

  emitter.info(run_id, "Post-translation processing complete.", log);
  emitter.run_end(run_id, true, "ok", log);
  return kExitOk;
}

int cmd_validate_config(const std::string &path, bool strict_exit) {
  json result;
  result["valid"] = false;
  result["errors"] = json::array();
  result["path"] = path;

  try {
    config::Config cfg = config::Config::load(path);
    cfg.validate();
    result["valid"] = true;
    YAML::Emitter emitter;
    emitter << cfg.to_yaml();
    result["effective"] = std::string(emitter.c_str());
  } catch (const beam_analysis::BeamAnalysisError &e) {
    result["errors"].push_back(e.what());
  }

  print_json(result);
  if (strict_exit) {
    return result["valid"].get<bool>() ? kExitOk : kExitFailure;
  }
  return kExitOk;
}

int cmd_default_config(const std::string &path) {
  config::Config cfg;
  if (path.empty()) {
    YAML::Emitter emitter;
    emitter << cfg.to_yaml();
    std::cout << emitter.c_str() << std::endl;
    return kExitOk;
  }
  try {
    cfg.save(path);
  } catch (const beam_analysis::BeamAnalysisError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitFailure;
  }
  print_json({{"ok", true}, {"path", path}});
  return kExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Determines beam center and flux from a beamstop-less "
               "measurement and writes them back into the measurement file"};
  app.require_subcommand(1);

  RunOptions run_opts;
  auto run_cmd = app.add_subcommand("run", "Analyze one measurement file");
  run_cmd
      ->add_option("-f,--filename", run_opts.filename,
                   "Input measurement file (HDF5/NeXus or FITS)")
      ->required();
  run_cmd->add_option("-a,--auxilary_files", run_opts.auxiliary_files,
                      "Optional additional files needed for processing "
                      "(read-only)");
  run_cmd->add_option("-c,--config", run_opts.config_path,
                      "YAML configuration file");
  run_cmd->add_option("-k,--keyvals", run_opts.keyvals,
                      "Optional key-value pairs (key=value), e.g. roi_size=30");
  run_cmd->add_flag("-v,--verbose", run_opts.verbosity,
                    "Increase output verbosity (-v INFO, -vv DEBUG)");
  run_cmd->add_flag("--very_verbose", run_opts.very_verbose,
                    "Verbosity at DEBUG level");
  run_cmd->add_flag("-l,--logging", run_opts.log_to_file,
                    "Write the event log to a timestamped file");
  run_cmd->add_option("--sidecar", run_opts.sidecar,
                      "Also write the results into this JSON file");
  run_cmd->add_flag("--dry-run", run_opts.dry_run,
                    "Analyze and print results without writing");

  std::string validate_path;
  bool strict_exit = false;
  auto validate_cmd =
      app.add_subcommand("validate-config", "Validate a YAML configuration");
  validate_cmd->add_option("path", validate_path, "Config file")->required();
  validate_cmd->add_flag("--strict-exit-codes", strict_exit,
                         "Exit with 1 when the config is invalid");

  std::string default_path;
  auto default_cmd = app.add_subcommand(
      "default-config", "Print or save the default configuration");
  default_cmd->add_option("path", default_path, "Output file (optional)");

  auto schema_cmd =
      app.add_subcommand("get-schema", "Print the JSON schema of the config");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(run_opts);
  }
  if (validate_cmd->parsed()) {
    return cmd_validate_config(validate_path, strict_exit);
  }
  if (default_cmd->parsed()) {
    return cmd_default_config(default_path);
  }
  if (schema_cmd->parsed()) {
    std::cout << config::get_schema_json() << std::endl;
    return kExitOk;
  }
  return kExitUsage;
}
