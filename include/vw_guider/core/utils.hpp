#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace vw_guider::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// Parses "YYYY-MM-DDTHH:MM:SS[.ffffff]" (or with a space separator) as UTC.
// Throws ValidationError on malformed input.
TimePoint parse_iso_timestamp(const std::string& text);
std::string format_iso_timestamp(const TimePoint& tp);
TimePoint file_mtime_as_timepoint(const fs::path& path);

// File utilities
std::vector<fs::path> discover_files(const fs::path& dir, const std::string& pattern = "*.fits");
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Math utilities (inputs are expected to be finite)
double median_of(std::vector<double> v);
double mean_of(const std::vector<double>& v);
double stddev_of(const std::vector<double>& v);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace vw_guider::core
