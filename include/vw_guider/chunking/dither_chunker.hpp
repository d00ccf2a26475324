#pragma once

#include "vw_guider/core/exposure.hpp"
#include "vw_guider/io/records_io.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vw_guider::chunking {

// Consecutive exposures of one target whose dither index rises by one each
class DitherChunk {
public:
    // Throws ValidationError when exposures is empty or contains another target
    DitherChunk(std::string target, int chunk_index, std::vector<Exposure> exposures);

    const std::string& target() const { return target_; }
    int chunk_index() const { return chunk_index_; }
    const std::vector<Exposure>& exposures() const { return exposures_; }
    size_t size() const { return exposures_.size(); }

    // Earliest and latest exposure start
    std::pair<TimePoint, TimePoint> time_range() const;
    // NaN-ignoring mean of the fiducials; std::nullopt when none is finite
    std::optional<Point2D> mean_fiducial() const;
    bool is_sky() const;
    bool is_single_run() const;
    bool contains(const std::string& exposure_id) const;

    io::ChunkRecord to_record() const;

private:
    std::string target_;
    int chunk_index_;
    std::vector<Exposure> exposures_;
};

using ChunkMap = std::map<std::string, std::vector<DitherChunk>>;

// Splits one target's exposures (already in time order) into dither runs.
// A chunk continues only while dither == previous dither + 1. Throws
// ValidationError for an empty list or mixed targets.
std::vector<DitherChunk> chunk_exposures(const std::string& target,
                                         const std::vector<Exposure>& exposures);

// Chunks of one target out of a mixed list
std::vector<DitherChunk> chunk_target(const std::vector<Exposure>& exposures,
                                      const std::string& target);

// Chunks of every target; the list is ordered by start time first
ChunkMap chunk_all_targets(std::vector<Exposure> exposures);

DitherChunk find_chunk(const std::vector<Exposure>& exposures, const std::string& target,
                       int chunk_index);

// Chunk index of an exposure, -1 for calibration exposures and exposures in no chunk
int chunk_index_of(const ChunkMap& chunks, const Exposure& exposure,
                   const std::vector<std::string>& calibration_targets);

std::vector<io::ChunkRecord> chunk_records(const ChunkMap& chunks);

} // namespace vw_guider::chunking
