#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace tid_music::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// "2012-12-01T14:00:00Z", "2012-12-01 14:00", "2012-12-01T14:00" or "2012-12-01"
EpochSeconds parse_utc(const std::string& text);
std::string format_utc(EpochSeconds t);
// "20121201.1400"
std::string format_compact_utc(EpochSeconds t);
// "20121201"
std::string format_utc_day(EpochSeconds t);
EpochSeconds utc_day_start(EpochSeconds t);

// File utilities
std::string read_text(const fs::path& path);
// Writes to a sibling temporary file and renames it into place.
void write_text_atomic(const fs::path& path, const std::string& text);
fs::path unique_temp_path(const fs::path& target);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Math utilities
double compute_median(std::vector<double> values);
// Linear interpolation between closest ranks; percentile in [0, 100].
double compute_percentile(std::vector<double> values, double percentile);

// String utilities
std::string to_lower(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string trim(const std::string& s);

} // namespace tid_music::core
