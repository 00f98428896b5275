#pragma once

#include "beam_analysis/core/types.hpp"

#include <vector>

namespace beam_analysis::analysis {

struct ComponentLabels {
    LabelMatrix labels;      // 0 = background, 1..count in canonical order
    int count = 0;
};

// Properties of one connected foreground region
struct RegionProperties {
    int label = 0;
    long area = 0;
    PixelPosition centroid;           // unweighted, all pixels equal
    PixelPosition weighted_centroid;  // intensity-weighted
    PixelWindow bbox;                 // inclusive
    double total_intensity = 0.0;
    double max_intensity = 0.0;
};

struct RegionAnalysisOptions {
    int connectivity = 8;  // 4 | 8
    RegionSelection selection = RegionSelection::LARGEST;
};

struct RegionAnalysis {
    int component_count = 0;
    RegionProperties primary;
};

// Connected-component labeling of a 0/1 mask. Components are numbered by the
// row-major position of their first pixel (top-most row, then left-most
// column), so the numbering does not depend on the labeling backend.
ComponentLabels label_components(const MaskMatrix& foreground, int connectivity = 8);

// Per-label properties; result[i] describes label i + 1.
std::vector<RegionProperties> measure_regions(const ComponentLabels& components,
                                              const Matrix2Dd& intensity);

// Selects the primary region (see RegionSelection) and measures it.
// Throws NoRegionFound if the foreground is empty or the selected region
// carries no intensity.
RegionAnalysis analyze_regions(const MaskMatrix& foreground, const Matrix2Dd& intensity,
                               const RegionAnalysisOptions& options = {});

} // namespace beam_analysis::analysis
