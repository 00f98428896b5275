#pragma once

#include "beam_analysis/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace beam_analysis::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

bool is_fits_image_path(const fs::path& path);

// Reads the primary image (2-D frame or N-D cube). FITS stores NAXIS1
// fastest, so the returned shape is (NAXISn, ..., NAXIS2, NAXIS1).
std::pair<DetectorStack, FitsHeader> read_fits_stack(const fs::path& path);

void write_fits_stack(const fs::path& path, const DetectorStack& stack, const FitsHeader& header);

// EXPTIME, then EXPOSURE, then ITIME (integer or float cards)
std::optional<double> detect_exposure_time(const FitsHeader& header);

} // namespace beam_analysis::io
