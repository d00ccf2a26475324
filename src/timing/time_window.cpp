#include "vw_guider/timing/time_window.hpp"
#include "vw_guider/core/utils.hpp"
#include "vw_guider/guider/frame_source.hpp"
#include "vw_guider/io/frame_index.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace vw_guider::timing {

std::optional<TimeWindow> TimeWindow::from_start_and_duration(const TimePoint& start,
                                                              double duration_s) {
    if (!std::isfinite(duration_s) || !(duration_s > 0.0)) {
        return std::nullopt;
    }
    // end must stay representable on the clock
    const TimePoint from = std::max(start, TimePoint{});
    const double max_span_s = std::chrono::duration<double>(TimePoint::max() - from).count();
    if (duration_s >= max_span_s) {
        return std::nullopt;
    }
    auto duration = std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::duration<double>(duration_s));
    return TimeWindow(start, start + duration);
}

double TimeWindow::duration_s() const {
    return std::chrono::duration<double>(end_ - start_).count();
}

TimePoint TimeWindow::mid() const {
    return start_ + (end_ - start_) / 2;
}

bool TimeWindow::contains(const TimePoint& timestamp) const {
    return start_ <= timestamp && timestamp <= end_;
}

std::vector<guider::FrameSource> TimeWindow::select_frames(const io::FrameIndex& index) const {
    std::vector<guider::FrameSource> frames;
    for (const auto& entry : index.select(start_, end_)) {
        frames.push_back(guider::FrameSource::from_index_entry(entry));
    }
    return frames;
}

std::string TimeWindow::summary() const {
    std::ostringstream oss;
    oss << core::format_iso_timestamp(start_) << " to " << core::format_iso_timestamp(end_)
        << " (duration: " << duration_s() << " s)";
    return oss.str();
}

} // namespace vw_guider::timing
