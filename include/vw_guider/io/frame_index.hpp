#pragma once

#include "vw_guider/core/types.hpp"

#include <string>
#include <vector>

namespace vw_guider::io {

struct FrameIndexEntry {
    fs::path path;
    TimePoint timestamp;
    double exptime = kNaN;
    double airmass = kNaN;
};

struct FrameIndexOptions {
    bool force_rebuild = false;  // ignore an existing cache
    bool prune_missing = false;  // drop cached entries whose file is gone
    std::string cache_name = "guider_index.json";
};

// Time-sorted index of guide-camera frames. Built or updated once, then
// queried read-only.
class FrameIndex {
public:
    FrameIndex() = default;

    static FrameIndex from_entries(std::vector<FrameIndexEntry> entries);

    // Scans guider_dir and its immediate subdirectories for FITS frames,
    // reusing and updating the JSON cache stored in guider_dir.
    static FrameIndex build(const fs::path& guider_dir, const FrameIndexOptions& options = {});

    static FrameIndex load_cache(const fs::path& cache_path);
    void save_cache(const fs::path& cache_path) const;

    // Reads timestamp, exposure time and airmass from a frame header.
    // DATE-OBS + UT give the timestamp; the file modification time is used
    // when they are missing or malformed.
    static FrameIndexEntry read_entry(const fs::path& frame_path);

    // Entries with start <= timestamp <= end, ascending
    std::vector<FrameIndexEntry> select(const TimePoint& start, const TimePoint& end) const;

    const std::vector<FrameIndexEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    void sort_entries();

    std::vector<FrameIndexEntry> entries_;
};

} // namespace vw_guider::io
