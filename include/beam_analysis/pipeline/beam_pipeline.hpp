#pragma once

#include "beam_analysis/analysis/flux.hpp"
#include "beam_analysis/analysis/region_analysis.hpp"
#include "beam_analysis/config/configuration.hpp"
#include "beam_analysis/core/types.hpp"
#include "beam_analysis/image/segmentation.hpp"
#include "beam_analysis/image/validity_mask.hpp"

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace beam_analysis::pipeline {

// Numeric parameters of one analysis run
struct AnalysisParams {
    int roi_size = analysis::kDefaultRoiSize;
    double valid_min = 0.0;
    double valid_max = image::kDefaultValidMax;
    double threshold_fraction = image::kDefaultThresholdFraction;
    double threshold_floor = image::kDefaultThresholdFloor;
    int connectivity = 8;
    RegionSelection region_selection = RegionSelection::LARGEST;

    // Throws ValidationError on an unknown region_selection string
    static AnalysisParams from_config(const config::AnalysisConfig& cfg);
    nlohmann::json to_json() const;
};

struct BeamAnalysisResult {
    std::vector<size_t> input_shape;
    Matrix2Dd frame;                      // reduced 2-D frame
    image::ValidityMaskResult validity;
    image::SegmentationResult segmentation;
    analysis::RegionAnalysis regions;
    analysis::FluxResult flux;

    const PixelPosition& center_of_mass() const { return regions.primary.centroid; }
    const PixelPosition& weighted_center_of_mass() const { return regions.primary.weighted_centroid; }

    // Scalar summary (no pixel arrays)
    nlohmann::json summary() const;
};

// Called with (phase, status, extra); status is "start", "ok" or "error".
using PhaseCallback =
    std::function<void(Phase, const std::string&, const nlohmann::json&)>;

class BeamAnalyzer {
public:
    BeamAnalyzer() = default;
    explicit BeamAnalyzer(const AnalysisParams& params) : params_(params) {}

    const AnalysisParams& params() const { return params_; }
    void set_phase_callback(PhaseCallback cb) { on_phase_ = std::move(cb); }

    // Runs reduce -> mask -> segment -> region -> flux. Either returns a
    // complete result or throws (ShapeError, NoRegionFound,
    // InvalidExposureTime, ValidationError).
    BeamAnalysisResult analyze(const DetectorStack& stack, double exposure_time) const;

private:
    void notify(Phase phase, const std::string& status, const nlohmann::json& extra) const;

    AnalysisParams params_;
    PhaseCallback on_phase_;
};

} // namespace beam_analysis::pipeline
