#include "vw_guider/pipeline/guide_processing.hpp"
#include "vw_guider/config/configuration.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/io/frame_index.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

namespace vw_guider::pipeline {

int compute_worker_count(int configured, size_t task_count) {
    int workers = configured;
    const int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (workers < 1) {
        workers = cpu_cores > 0 ? cpu_cores : 1;
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(task_count));
    }
    return std::max(1, workers);
}

BatchResult process_exposures(const std::vector<Exposure>& exposures,
                              const io::FrameIndex& index, const config::Config& cfg,
                              GuessMode mode, core::EventEmitter& emitter,
                              const std::string& run_id) {
    BatchResult result;
    result.n_total = static_cast<int>(exposures.size());

    std::vector<size_t> tasks;
    for (size_t i = 0; i < exposures.size(); ++i) {
        const Exposure& e = exposures[i];
        if (!e.is_sky_exposure() || e.is_calibration(cfg.instrument.calibration_targets)) {
            ++result.n_excluded;
            continue;
        }
        tasks.push_back(i);
    }

    std::vector<std::optional<guider::ExposureGuideSequence>> slots(tasks.size());
    std::vector<std::string> skip_reason(tasks.size());

    const int n_workers = compute_worker_count(cfg.runtime.workers, tasks.size());
    std::cout << "[FIT] Using " << n_workers << " parallel workers for " << tasks.size()
              << " exposures" << std::endl;

    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::string error;

    auto worker = [&]() {
        while (true) {
            const size_t ti = next.fetch_add(1);
            if (ti >= tasks.size() || failed.load(std::memory_order_relaxed)) {
                break;
            }
            const Exposure& exp = exposures[tasks[ti]];
            int n_frames = 0;
            try {
                guider::ExposureGuideSequence seq(exp, index, cfg, mode);
                n_frames = static_cast<int>(seq.size());
                if (seq.size() < static_cast<size_t>(cfg.statistics.min_frames)) {
                    skip_reason[ti] = "only " + std::to_string(seq.size()) + " guide frames in " +
                                      exp.time_window()->summary();
                } else {
                    slots[ti].emplace(std::move(seq));
                }
            } catch (const VwGuiderError& e) {
                skip_reason[ti] = e.what();
            } catch (const std::exception& e) {
                failed.store(true, std::memory_order_relaxed);
                std::lock_guard<std::mutex> lock(error_mutex);
                if (error.empty()) {
                    error = exp.id + ": " + e.what();
                }
            }

            if (!skip_reason[ti].empty()) {
                emitter.warning(run_id, "Skipping " + exp.long_name() + ": " + skip_reason[ti]);
            }
            const size_t n_done = done.fetch_add(1) + 1;
            emitter.exposure_processed(run_id, static_cast<int>(n_done),
                                       static_cast<int>(tasks.size()), exp.id, n_frames);
        }
    };

    if (n_workers > 1) {
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    if (failed.load()) {
        throw PipelineError("Fitting aborted: " + error);
    }

    for (size_t ti = 0; ti < tasks.size(); ++ti) {
        if (slots[ti]) {
            result.n_failed_fits += slots[ti]->failed_fits();
            result.sequences.push_back(std::move(*slots[ti]));
        } else {
            ++result.n_skipped;
            result.skipped_ids.push_back(exposures[tasks[ti]].id);
        }
    }
    result.n_processed = static_cast<int>(result.sequences.size());
    return result;
}

std::vector<io::ExposureRecord> exposure_records(const BatchResult& batch,
                                                 const chunking::ChunkMap& chunks,
                                                 const config::Config& cfg) {
    std::vector<io::ExposureRecord> records;
    records.reserve(batch.sequences.size());
    for (const auto& seq : batch.sequences) {
        io::ExposureRecord r = seq.to_record(cfg.statistics.clip_sigma,
                                             cfg.statistics.flux_rate_clip_sigma);
        r.chunk_index = chunking::chunk_index_of(chunks, seq.exposure(),
                                                 cfg.instrument.calibration_targets);
        records.push_back(std::move(r));
    }
    return records;
}

stacking::StackResult stack_chunk(const chunking::DitherChunk& chunk,
                                  std::vector<guider::ExposureGuideSequence>& sequences,
                                  const config::Config& cfg) {
    std::vector<guider::FrameSource> frames;
    std::vector<Point2D> centroids;
    for (auto& seq : sequences) {
        if (seq.exposure().target != chunk.target() || !chunk.contains(seq.exposure().id)) {
            continue;
        }
        const auto pts = seq.centroids(std::nullopt);
        frames.insert(frames.end(), seq.frames().begin(), seq.frames().end());
        centroids.insert(centroids.end(), pts.begin(), pts.end());
    }
    if (frames.empty()) {
        throw ValidationError("Dither chunk " + chunk.target() + "/" +
                              std::to_string(chunk.chunk_index()) + " has no guide frames");
    }
    return stacking::stack_frames(frames, centroids, cfg.stacking.clip_sigma,
                                  cfg.statistics.max_clip_iterations, true);
}

} // namespace vw_guider::pipeline
