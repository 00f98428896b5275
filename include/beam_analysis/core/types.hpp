#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace beam_analysis {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents)
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MaskMatrix = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using LabelMatrix = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// N-dimensional detector data in row-major (C) order.
// The trailing two axes are (row, col); leading axes are repeats.
struct DetectorStack {
    std::vector<size_t> shape;
    std::vector<double> data;

    size_t rank() const { return shape.size(); }
    size_t element_count() const;

    // Throws ShapeError if data.size() does not match the shape.
    void validate() const;

    static DetectorStack from_frame(const Matrix2Dd& frame);
};

std::string shape_to_string(const std::vector<size_t>& shape);

struct PixelPosition {
    double row = 0.0;
    double col = 0.0;
};

// Inclusive integer bounds
struct PixelWindow {
    int row_min = 0;
    int row_max = -1;
    int col_min = 0;
    int col_max = -1;

    bool empty() const { return row_max < row_min || col_max < col_min; }
    int rows() const { return empty() ? 0 : row_max - row_min + 1; }
    int cols() const { return empty() ? 0 : col_max - col_min + 1; }
    bool contains(double row, double col) const {
        return row >= row_min && row <= row_max && col >= col_min && col <= col_max;
    }
};

// Pipeline phase enumeration
enum class Phase {
    LOAD_INPUT = 0,
    REDUCE = 1,
    MASK = 2,
    SEGMENT = 3,
    REGION = 4,
    FLUX = 5,
    WRITE_BACK = 6,
    DONE = 7
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_INPUT: return "LOAD_INPUT";
        case Phase::REDUCE: return "REDUCE";
        case Phase::MASK: return "MASK";
        case Phase::SEGMENT: return "SEGMENT";
        case Phase::REGION: return "REGION";
        case Phase::FLUX: return "FLUX";
        case Phase::WRITE_BACK: return "WRITE_BACK";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

// Primary region selection when the foreground has several components
enum class RegionSelection {
    LARGEST,  // most pixels, ties -> first in scan order
    FIRST,    // first component in row-major scan order
    MERGE     // all foreground pixels as one region
};

inline std::string region_selection_to_string(RegionSelection sel) {
    switch (sel) {
        case RegionSelection::LARGEST: return "largest";
        case RegionSelection::FIRST: return "first";
        case RegionSelection::MERGE: return "merge";
        default: return "unknown";
    }
}

bool string_to_region_selection(const std::string& s, RegionSelection& out);

} // namespace beam_analysis
