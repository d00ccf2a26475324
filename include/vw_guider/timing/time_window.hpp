#pragma once

#include "vw_guider/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vw_guider::io {
class FrameIndex;
}

namespace vw_guider::guider {
class FrameSource;
}

namespace vw_guider::timing {

// Active interval of one exposure, [start, start + duration], inclusive on both ends.
class TimeWindow {
public:
    // Returns std::nullopt unless duration_s is finite and > 0.
    static std::optional<TimeWindow> from_start_and_duration(const TimePoint& start,
                                                             double duration_s);

    const TimePoint& start() const { return start_; }
    const TimePoint& end() const { return end_; }
    double duration_s() const;
    TimePoint mid() const;

    bool contains(const TimePoint& timestamp) const;

    // Frames of the index inside the window, ascending by timestamp.
    // Pixel data is not loaded.
    std::vector<guider::FrameSource> select_frames(const io::FrameIndex& index) const;

    std::string summary() const;

private:
    TimeWindow(const TimePoint& start, const TimePoint& end) : start_(start), end_(end) {}

    TimePoint start_;
    TimePoint end_;
};

} // namespace vw_guider::timing
