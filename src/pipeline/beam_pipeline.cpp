#include "beam_analysis/pipeline/beam_pipeline.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/image/frame_reduction.hpp"

namespace beam_analysis::pipeline {

using json = nlohmann::json;

AnalysisParams AnalysisParams::from_config(const config::AnalysisConfig& cfg) {
    AnalysisParams p;
    p.roi_size = cfg.roi_size;
    p.valid_min = cfg.valid_min;
    p.valid_max = cfg.valid_max;
    p.threshold_fraction = cfg.threshold_fraction;
    p.threshold_floor = cfg.threshold_floor;
    p.connectivity = cfg.connectivity;
    if (!string_to_region_selection(cfg.region_selection, p.region_selection)) {
        throw ValidationError("unknown region selection '" + cfg.region_selection + "'");
    }
    return p;
}

json AnalysisParams::to_json() const {
    return {
        {"roi_size", roi_size},
        {"valid_min", valid_min},
        {"valid_max", valid_max},
        {"threshold_fraction", threshold_fraction},
        {"threshold_floor", threshold_floor},
        {"connectivity", connectivity},
        {"region_selection", region_selection_to_string(region_selection)}
    };
}

static json position_json(const PixelPosition& p) {
    return json::array({p.row, p.col});
}

static json window_json(const PixelWindow& w) {
    return {{"row_min", w.row_min}, {"row_max", w.row_max},
            {"col_min", w.col_min}, {"col_max", w.col_max}};
}

json BeamAnalysisResult::summary() const {
    const auto& r = regions.primary;
    return {
        {"input_shape", input_shape},
        {"frame_shape", json::array({frame.rows(), frame.cols()})},
        {"valid_pixels", validity.valid_pixels},
        {"invalid_pixels", validity.invalid_pixels},
        {"threshold", segmentation.threshold},
        {"peak_value", segmentation.peak_value},
        {"foreground_pixels", segmentation.foreground_pixels},
        {"component_count", regions.component_count},
        {"region", {
            {"label", r.label},
            {"area", r.area},
            {"bbox", window_json(r.bbox)},
            {"total_intensity", r.total_intensity},
            {"max_intensity", r.max_intensity}
        }},
        {"center_of_mass", position_json(r.centroid)},
        {"weighted_center_of_mass", position_json(r.weighted_centroid)},
        {"roi", window_json(flux.roi)},
        {"roi_pixels", flux.roi_pixels},
        {"integrated_intensity", flux.integrated_intensity},
        {"exposure_time", flux.exposure_time},
        {"flux", flux.flux}
    };
}

void BeamAnalyzer::notify(Phase phase, const std::string& status, const json& extra) const {
    if (on_phase_) on_phase_(phase, status, extra);
}

BeamAnalysisResult BeamAnalyzer::analyze(const DetectorStack& stack, double exposure_time) const {
    // Fail before any numerical work
    analysis::check_exposure_time(exposure_time);

    BeamAnalysisResult res;
    res.input_shape = stack.shape;
    Phase current = Phase::REDUCE;

    try {
        notify(Phase::REDUCE, "start", json::object());
        res.frame = image::reduce_to_2d(stack);
        notify(Phase::REDUCE, "ok",
               {{"input_shape", stack.shape},
                {"frame_shape", json::array({res.frame.rows(), res.frame.cols()})}});

        current = Phase::MASK;
        notify(current, "start", json::object());
        res.validity = image::apply_validity_mask(res.frame, params_.valid_min, params_.valid_max);
        notify(current, "ok", {{"valid_pixels", res.validity.valid_pixels},
                               {"invalid_pixels", res.validity.invalid_pixels}});

        current = Phase::SEGMENT;
        notify(current, "start", json::object());
        res.segmentation = image::segment_peak(res.validity.masked, params_.threshold_fraction,
                                               params_.threshold_floor);
        notify(current, "ok", {{"threshold", res.segmentation.threshold},
                               {"peak_value", res.segmentation.peak_value},
                               {"foreground_pixels", res.segmentation.foreground_pixels}});

        current = Phase::REGION;
        notify(current, "start", json::object());
        analysis::RegionAnalysisOptions opts;
        opts.connectivity = params_.connectivity;
        opts.selection = params_.region_selection;
        res.regions = analysis::analyze_regions(res.segmentation.foreground,
                                                res.validity.masked, opts);
        notify(current, "ok",
               {{"component_count", res.regions.component_count},
                {"label", res.regions.primary.label},
                {"area", res.regions.primary.area},
                {"center_of_mass", position_json(res.regions.primary.centroid)},
                {"weighted_center_of_mass", position_json(res.regions.primary.weighted_centroid)}});

        current = Phase::FLUX;
        notify(current, "start", json::object());
        res.flux = analysis::integrate_flux(res.validity.masked, res.regions.primary.weighted_centroid,
                                            exposure_time, params_.roi_size);
        notify(current, "ok", {{"roi", window_json(res.flux.roi)},
                               {"integrated_intensity", res.flux.integrated_intensity},
                               {"flux", res.flux.flux}});
    } catch (const std::exception& e) {
        notify(current, "error", {{"error", e.what()}});
        throw;
    }

    return res;
}

} // namespace beam_analysis::pipeline
