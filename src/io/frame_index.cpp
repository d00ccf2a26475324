#include "vw_guider/io/frame_index.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/core/utils.hpp"
#include "vw_guider/io/fits_io.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <set>

namespace vw_guider::io {

using json = nlohmann::json;

namespace {

json number_or_null(double v) {
    if (std::isfinite(v)) return v;
    return nullptr;
}

double number_or_nan(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return kNaN;
    return j[key].get<double>();
}

void append_frame_files(const fs::path& dir, std::vector<fs::path>& files) {
    for (const auto& p : core::discover_files(dir, "*")) {
        if (is_fits_image_path(p)) files.push_back(p);
    }
}

std::vector<fs::path> scan_frame_files(const fs::path& guider_dir) {
    std::vector<fs::path> files;
    append_frame_files(guider_dir, files);
    for (const auto& entry : fs::directory_iterator(guider_dir)) {
        if (entry.is_directory()) {
            append_frame_files(entry.path(), files);
        }
    }
    return files;
}

} // namespace

FrameIndex FrameIndex::from_entries(std::vector<FrameIndexEntry> entries) {
    FrameIndex index;
    index.entries_ = std::move(entries);
    index.sort_entries();
    return index;
}

void FrameIndex::sort_entries() {
    std::stable_sort(entries_.begin(), entries_.end(),
                     [](const FrameIndexEntry& a, const FrameIndexEntry& b) {
                         return a.timestamp < b.timestamp;
                     });
}

FrameIndexEntry FrameIndex::read_entry(const fs::path& frame_path) {
    FitsHeader header = read_fits_header(frame_path);

    FrameIndexEntry entry;
    entry.path = frame_path;
    entry.exptime = header.get_number_or_nan("EXPTIME");
    entry.airmass = header.get_number_or_nan("AIRMASS");

    auto date_obs = header.get_string("DATE-OBS");
    auto ut = header.get_string("UT");
    try {
        if (date_obs && ut) {
            const std::string date = date_obs->substr(0, date_obs->find('T'));
            entry.timestamp = core::parse_iso_timestamp(date + "T" + *ut);
        } else if (date_obs && date_obs->find('T') != std::string::npos) {
            entry.timestamp = core::parse_iso_timestamp(*date_obs);
        } else {
            throw ValidationError("DATE-OBS/UT missing");
        }
    } catch (const ValidationError& e) {
        std::cerr << "[INDEX] " << frame_path.filename().string()
                  << ": cannot read DATE-OBS/UT (" << e.what()
                  << "), using file modification time" << std::endl;
        entry.timestamp = core::file_mtime_as_timepoint(frame_path);
    }
    return entry;
}

FrameIndex FrameIndex::build(const fs::path& guider_dir, const FrameIndexOptions& options) {
    if (!fs::is_directory(guider_dir)) {
        throw IOError("Guider directory does not exist: " + guider_dir.string());
    }

    const fs::path cache_path = guider_dir / options.cache_name;
    FrameIndex index;
    bool changed = false;

    if (fs::exists(cache_path) && !options.force_rebuild) {
        index = load_cache(cache_path);
        if (options.prune_missing) {
            const size_t before = index.entries_.size();
            index.entries_.erase(
                std::remove_if(index.entries_.begin(), index.entries_.end(),
                               [](const FrameIndexEntry& e) { return !fs::exists(e.path); }),
                index.entries_.end());
            if (index.entries_.size() != before) {
                std::cerr << "[INDEX] Removed " << (before - index.entries_.size())
                          << " entries for missing files" << std::endl;
                changed = true;
            }
        }
    }

    std::set<std::string> known;
    for (const auto& e : index.entries_) {
        known.insert(e.path.string());
    }

    std::vector<fs::path> new_files;
    for (const auto& f : scan_frame_files(guider_dir)) {
        if (known.count(f.string()) == 0) {
            new_files.push_back(f);
        }
    }

    if (new_files.size() > 500) {
        std::cerr << "[INDEX] Indexing " << new_files.size()
                  << " new frames, this may take a while" << std::endl;
    }

    for (const auto& f : new_files) {
        try {
            index.entries_.push_back(read_entry(f));
            changed = true;
        } catch (const VwGuiderError& e) {
            std::cerr << "[INDEX] Skipping " << f.string() << ": " << e.what() << std::endl;
        }
    }

    index.sort_entries();
    if (changed || !fs::exists(cache_path)) {
        index.save_cache(cache_path);
    }
    return index;
}

FrameIndex FrameIndex::load_cache(const fs::path& cache_path) {
    std::ifstream in(cache_path);
    if (!in) {
        throw IOError("Cannot open frame index: " + cache_path.string());
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::exception& e) {
        throw IOError("Malformed frame index " + cache_path.string() + ": " + e.what());
    }

    std::vector<FrameIndexEntry> entries;
    try {
        for (const auto& j : doc.at("entries")) {
            FrameIndexEntry e;
            e.path = j.at("path").get<std::string>();
            e.timestamp = core::parse_iso_timestamp(j.at("timestamp").get<std::string>());
            e.exptime = number_or_nan(j, "exptime");
            e.airmass = number_or_nan(j, "airmass");
            entries.push_back(std::move(e));
        }
    } catch (const json::exception& e) {
        throw IOError("Malformed frame index " + cache_path.string() + ": " + e.what());
    }
    return from_entries(std::move(entries));
}

void FrameIndex::save_cache(const fs::path& cache_path) const {
    json doc;
    doc["version"] = 1;
    doc["entries"] = json::array();
    for (const auto& e : entries_) {
        doc["entries"].push_back({
            {"path", e.path.string()},
            {"timestamp", core::format_iso_timestamp(e.timestamp)},
            {"exptime", number_or_null(e.exptime)},
            {"airmass", number_or_null(e.airmass)}
        });
    }
    core::write_text(cache_path, doc.dump(2));
}

std::vector<FrameIndexEntry> FrameIndex::select(const TimePoint& start, const TimePoint& end) const {
    auto lo = std::lower_bound(entries_.begin(), entries_.end(), start,
                               [](const FrameIndexEntry& e, const TimePoint& t) {
                                   return e.timestamp < t;
                               });
    auto hi = std::upper_bound(entries_.begin(), entries_.end(), end,
                               [](const TimePoint& t, const FrameIndexEntry& e) {
                                   return t < e.timestamp;
                               });
    if (lo >= hi) return {};
    return std::vector<FrameIndexEntry>(lo, hi);
}

} // namespace vw_guider::io
