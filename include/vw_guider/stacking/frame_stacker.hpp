#pragma once

#include "vw_guider/core/types.hpp"
#include "vw_guider/guider/frame_source.hpp"

#include <optional>
#include <vector>

namespace vw_guider::stacking {

struct StackResult {
    Matrix2Df image;          // counts per second, averaged over overlapping frames
    int n_frames = 0;         // frames that went into the stack
    std::vector<bool> kept;   // per input frame
};

// Shift-and-add stack. Frames are placed at their rounded centroid offsets
// (centroid minus the smallest kept centroid), each divided by its exposure
// time, and the sum is divided by the per-pixel coverage.
//
// Frames whose centroid is rejected by distance clipping, is not finite, or
// whose exposure time is not positive are left out. Throws ValidationError
// when the inputs differ in length or no frame is left.
StackResult stack_frames(std::vector<guider::FrameSource>& frames,
                         const std::vector<Point2D>& centroids,
                         std::optional<double> sigma,
                         int max_clip_iterations = 5,
                         bool release_after = false);

} // namespace vw_guider::stacking
