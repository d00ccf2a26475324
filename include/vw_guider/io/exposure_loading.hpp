#pragma once

#include "vw_guider/core/exposure.hpp"

#include <map>
#include <string>
#include <vector>

namespace vw_guider::config {
struct Config;
}

namespace vw_guider::io {

// Builds an Exposure from the primary header of a spectrograph frame.
// Throws IOError/FitsError when the file cannot be read and
// ValidationError when DATE-OBS is missing or malformed.
Exposure load_exposure_from_fits(const fs::path& path, const config::Config& cfg);

// Loads every readable file, sorted by start time. Unreadable files are
// reported on stderr and skipped; duplicate ids throw ValidationError.
std::vector<Exposure> load_exposures(const std::vector<fs::path>& paths,
                                     const config::Config& cfg);

// All *.fits files of a directory
std::vector<Exposure> load_exposures_from_dir(const fs::path& dir, const config::Config& cfg);

// Number of exposures per target
std::map<std::string, int> target_counts(const std::vector<Exposure>& exposures,
                                         bool remove_calibration,
                                         const std::vector<std::string>& calibration_targets);

void sort_by_start_time(std::vector<Exposure>& exposures);

} // namespace vw_guider::io
