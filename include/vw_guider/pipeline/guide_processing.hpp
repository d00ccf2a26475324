#pragma once

#include "vw_guider/chunking/dither_chunker.hpp"
#include "vw_guider/core/events.hpp"
#include "vw_guider/core/exposure.hpp"
#include "vw_guider/guider/exposure_guide_sequence.hpp"
#include "vw_guider/io/records_io.hpp"
#include "vw_guider/stacking/frame_stacker.hpp"

#include <string>
#include <vector>

namespace vw_guider::config {
struct Config;
}

namespace vw_guider::io {
class FrameIndex;
}

namespace vw_guider::pipeline {

struct BatchResult {
    std::vector<guider::ExposureGuideSequence> sequences;  // input order
    int n_total = 0;
    int n_processed = 0;
    int n_excluded = 0;   // calibration or non-sky exposures
    int n_skipped = 0;    // construction failures or too few frames
    int n_failed_fits = 0;
    std::vector<std::string> skipped_ids;
};

int compute_worker_count(int configured, size_t task_count);

// Fits the guide frames of every sky science exposure. Exposures are handled
// in parallel; one that cannot be processed is logged and skipped. Errors
// outside the library's own hierarchy abort the batch with PipelineError.
BatchResult process_exposures(const std::vector<Exposure>& exposures,
                              const io::FrameIndex& index, const config::Config& cfg,
                              GuessMode mode, core::EventEmitter& emitter,
                              const std::string& run_id);

std::vector<io::ExposureRecord> exposure_records(const BatchResult& batch,
                                                 const chunking::ChunkMap& chunks,
                                                 const config::Config& cfg);

// Stacks all frames of the chunk's processed exposures on their unclipped
// centroids. Throws ValidationError when none of them has frames.
stacking::StackResult stack_chunk(const chunking::DitherChunk& chunk,
                                  std::vector<guider::ExposureGuideSequence>& sequences,
                                  const config::Config& cfg);

} // namespace vw_guider::pipeline
