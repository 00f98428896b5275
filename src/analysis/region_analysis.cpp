#include "beam_analysis/analysis/region_analysis.hpp"
#include "beam_analysis/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace beam_analysis::analysis {

namespace {

struct Accumulator {
    long area = 0;
    double sum_row = 0.0;
    double sum_col = 0.0;
    double wsum = 0.0;
    double wsum_row = 0.0;
    double wsum_col = 0.0;
    double max_v = 0.0;
    PixelWindow bbox{0, -1, 0, -1};

    void add(int r, int c, double v) {
        if (area == 0) {
            bbox = {r, r, c, c};
            max_v = v;
        } else {
            bbox.row_min = std::min(bbox.row_min, r);
            bbox.row_max = std::max(bbox.row_max, r);
            bbox.col_min = std::min(bbox.col_min, c);
            bbox.col_max = std::max(bbox.col_max, c);
            max_v = std::max(max_v, v);
        }
        ++area;
        sum_row += r;
        sum_col += c;
        wsum += v;
        wsum_row += v * r;
        wsum_col += v * c;
    }

    RegionProperties finish(int label) const {
        RegionProperties p;
        p.label = label;
        p.area = area;
        p.bbox = bbox;
        p.total_intensity = wsum;
        p.max_intensity = max_v;
        if (area > 0) {
            p.centroid = {sum_row / area, sum_col / area};
        }
        if (wsum > 0.0) {
            p.weighted_centroid = {wsum_row / wsum, wsum_col / wsum};
        }
        return p;
    }
};

void check_same_shape(const MaskMatrix& mask, const Matrix2Dd& intensity) {
    if (mask.rows() != intensity.rows() || mask.cols() != intensity.cols()) {
        throw ShapeError("foreground mask and intensity frame differ in shape");
    }
}

} // namespace

ComponentLabels label_components(const MaskMatrix& foreground, int connectivity) {
    if (connectivity != 4 && connectivity != 8) {
        throw ValidationError("connectivity must be 4 or 8");
    }

    ComponentLabels out;
    out.labels = LabelMatrix::Zero(foreground.rows(), foreground.cols());
    if (foreground.size() == 0) {
        return out;
    }

    const int h = static_cast<int>(foreground.rows());
    const int w = static_cast<int>(foreground.cols());
    cv::Mat fg(h, w, CV_8U, const_cast<uint8_t*>(foreground.data()));
    cv::Mat raw;
    const int n = cv::connectedComponents(fg, raw, connectivity, CV_32S);

    // Renumber in row-major order of each component's first pixel
    std::vector<int32_t> remap(static_cast<size_t>(n), 0);
    int32_t next = 0;
    for (int y = 0; y < h; ++y) {
        const int32_t* src = raw.ptr<int32_t>(y);
        int32_t* dst = out.labels.data() + static_cast<size_t>(y) * w;
        for (int x = 0; x < w; ++x) {
            const int32_t l = src[x];
            if (l == 0) continue;
            int32_t& m = remap[static_cast<size_t>(l)];
            if (m == 0) m = ++next;
            dst[x] = m;
        }
    }
    out.count = next;
    return out;
}

std::vector<RegionProperties> measure_regions(const ComponentLabels& components,
                                              const Matrix2Dd& intensity) {
    if (components.labels.rows() != intensity.rows() ||
        components.labels.cols() != intensity.cols()) {
        throw ShapeError("label image and intensity frame differ in shape");
    }

    std::vector<Accumulator> acc(static_cast<size_t>(components.count));
    const int h = static_cast<int>(intensity.rows());
    const int w = static_cast<int>(intensity.cols());
    for (int r = 0; r < h; ++r) {
        for (int c = 0; c < w; ++c) {
            const int32_t l = components.labels(r, c);
            if (l <= 0 || l > components.count) continue;
            acc[static_cast<size_t>(l - 1)].add(r, c, intensity(r, c));
        }
    }

    std::vector<RegionProperties> props;
    props.reserve(acc.size());
    for (size_t i = 0; i < acc.size(); ++i) {
        props.push_back(acc[i].finish(static_cast<int>(i) + 1));
    }
    return props;
}

RegionAnalysis analyze_regions(const MaskMatrix& foreground, const Matrix2Dd& intensity,
                               const RegionAnalysisOptions& options) {
    check_same_shape(foreground, intensity);

    ComponentLabels components = label_components(foreground, options.connectivity);
    if (components.count == 0) {
        throw NoRegionFound("foreground mask is empty");
    }

    RegionAnalysis out;
    out.component_count = components.count;

    if (options.selection == RegionSelection::MERGE) {
        Accumulator all;
        for (int r = 0; r < foreground.rows(); ++r) {
            for (int c = 0; c < foreground.cols(); ++c) {
                if (foreground(r, c)) all.add(r, c, intensity(r, c));
            }
        }
        out.primary = all.finish(1);
    } else {
        std::vector<RegionProperties> regions = measure_regions(components, intensity);
        size_t pick = 0;
        if (options.selection == RegionSelection::LARGEST) {
            // strict '>' keeps the earliest label on ties
            for (size_t i = 1; i < regions.size(); ++i) {
                if (regions[i].area > regions[pick].area) pick = i;
            }
        }
        out.primary = regions[pick];
    }

    if (!(out.primary.total_intensity > 0.0)) {
        throw NoRegionFound("selected region (label " + std::to_string(out.primary.label) +
                            ") has no intensity for a weighted centroid");
    }
    return out;
}

} // namespace beam_analysis::analysis
