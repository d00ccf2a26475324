#include "vw_guider/chunking/dither_chunker.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/core/utils.hpp"
#include "vw_guider/io/exposure_loading.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <tuple>

namespace vw_guider::chunking {

DitherChunk::DitherChunk(std::string target, int chunk_index, std::vector<Exposure> exposures)
    : target_(std::move(target)), chunk_index_(chunk_index), exposures_(std::move(exposures)) {
    if (exposures_.empty()) {
        throw ValidationError("Dither chunk " + target_ + "/" + std::to_string(chunk_index_) +
                              " has no exposures");
    }
    for (const auto& e : exposures_) {
        if (e.target != target_) {
            throw ValidationError("Dither chunk for '" + target_ + "' contains exposure " +
                                  e.id + " of target '" + e.target + "'");
        }
    }
}

std::pair<TimePoint, TimePoint> DitherChunk::time_range() const {
    auto [lo, hi] = std::minmax_element(
        exposures_.begin(), exposures_.end(),
        [](const Exposure& a, const Exposure& b) { return a.start < b.start; });
    return {lo->start, hi->start};
}

std::optional<Point2D> DitherChunk::mean_fiducial() const {
    std::vector<double> xs;
    std::vector<double> ys;
    for (const auto& e : exposures_) {
        if (std::isfinite(e.fiducial.x)) xs.push_back(e.fiducial.x);
        if (std::isfinite(e.fiducial.y)) ys.push_back(e.fiducial.y);
    }
    if (xs.empty() || ys.empty()) {
        return std::nullopt;
    }
    return Point2D{core::mean_of(xs), core::mean_of(ys)};
}

bool DitherChunk::is_sky() const {
    return std::all_of(exposures_.begin(), exposures_.end(),
                       [](const Exposure& e) { return e.is_sky_exposure(); });
}

bool DitherChunk::is_single_run() const {
    for (size_t i = 1; i < exposures_.size(); ++i) {
        if (exposures_[i].dither != exposures_[i - 1].dither + 1) return false;
    }
    return true;
}

bool DitherChunk::contains(const std::string& exposure_id) const {
    return std::any_of(exposures_.begin(), exposures_.end(),
                       [&](const Exposure& e) { return e.id == exposure_id; });
}

io::ChunkRecord DitherChunk::to_record() const {
    io::ChunkRecord r;
    r.target = target_;
    r.chunk_index = chunk_index_;
    r.n_exposures = static_cast<int>(exposures_.size());
    std::tie(r.start_time, r.end_time) = time_range();
    r.mean_fiducial = mean_fiducial();
    for (const auto& e : exposures_) {
        r.exposure_ids.push_back(e.id);
        r.exposure_paths.push_back(e.path.string());
    }
    r.is_sky = is_sky();
    return r;
}

std::vector<DitherChunk> chunk_exposures(const std::string& target,
                                         const std::vector<Exposure>& exposures) {
    if (exposures.empty()) {
        throw ValidationError("No exposures to chunk for target '" + target + "'");
    }

    std::vector<std::vector<Exposure>> runs;
    std::vector<Exposure> current{exposures.front()};
    for (size_t i = 1; i < exposures.size(); ++i) {
        if (exposures[i].dither == exposures[i - 1].dither + 1) {
            current.push_back(exposures[i]);
        } else {
            runs.push_back(std::move(current));
            current = {exposures[i]};
        }
    }
    runs.push_back(std::move(current));

    std::vector<DitherChunk> chunks;
    chunks.reserve(runs.size());
    for (size_t i = 0; i < runs.size(); ++i) {
        chunks.emplace_back(target, static_cast<int>(i), std::move(runs[i]));
    }
    return chunks;
}

std::vector<DitherChunk> chunk_target(const std::vector<Exposure>& exposures,
                                      const std::string& target) {
    std::vector<Exposure> selected;
    std::copy_if(exposures.begin(), exposures.end(), std::back_inserter(selected),
                 [&](const Exposure& e) { return e.target == target; });
    if (selected.empty()) {
        throw ValidationError("No exposures found for target '" + target + "'");
    }
    return chunk_exposures(target, selected);
}

ChunkMap chunk_all_targets(std::vector<Exposure> exposures) {
    io::sort_by_start_time(exposures);

    std::map<std::string, std::vector<Exposure>> by_target;
    for (auto& e : exposures) {
        by_target[e.target].push_back(std::move(e));
    }

    ChunkMap chunks;
    for (const auto& [target, list] : by_target) {
        chunks.emplace(target, chunk_exposures(target, list));
    }
    return chunks;
}

DitherChunk find_chunk(const std::vector<Exposure>& exposures, const std::string& target,
                       int chunk_index) {
    for (auto& chunk : chunk_target(exposures, target)) {
        if (chunk.chunk_index() == chunk_index) {
            return chunk;
        }
    }
    throw ValidationError("No dither chunk " + std::to_string(chunk_index) + " for target '" +
                          target + "'");
}

int chunk_index_of(const ChunkMap& chunks, const Exposure& exposure,
                   const std::vector<std::string>& calibration_targets) {
    if (exposure.is_calibration(calibration_targets)) {
        return -1;
    }
    auto it = chunks.find(exposure.target);
    if (it == chunks.end()) {
        return -1;
    }
    for (const auto& chunk : it->second) {
        if (chunk.contains(exposure.id)) {
            return chunk.chunk_index();
        }
    }
    return -1;
}

std::vector<io::ChunkRecord> chunk_records(const ChunkMap& chunks) {
    std::vector<io::ChunkRecord> records;
    for (const auto& [target, list] : chunks) {
        for (const auto& chunk : list) {
            records.push_back(chunk.to_record());
        }
    }
    return records;
}

} // namespace vw_guider::chunking
