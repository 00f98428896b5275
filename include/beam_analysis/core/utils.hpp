#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace beam_analysis::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();
std::string get_file_timestamp();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Throws IOError unless path exists and is a regular file
void file_exists_and_is_file(const fs::path& path);
// Throws IOError unless the extension is one of `allowed` (case-insensitive)
void file_check_extension(const fs::path& path, const std::vector<std::string>& allowed);

bool has_extension(const fs::path& path, const std::vector<std::string>& allowed);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Parses "key=value" items, splitting on the first '='.
// Keys and values are trimmed; a missing '=' or empty key throws ConfigError.
std::map<std::string, std::string> parse_key_values(const std::vector<std::string>& items);

} // namespace beam_analysis::core
