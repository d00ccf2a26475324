#pragma once

#include "vw_guider/core/types.hpp"
#include "vw_guider/timing/time_window.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vw_guider {

// One logged spectrograph exposure
struct Exposure {
    std::string id;          // file stem, unique within a run
    fs::path path;
    std::string target;
    TimePoint start;
    double exptime = kNaN;   // seconds, NaN when unknown
    int dither = 1;          // >= 1
    Point2D fiducial;        // expected guide-star position, NaN when unknown
    double airmass = kNaN;
    double focus = kNaN;
    std::string comment;

    // std::nullopt when the exposure time is unknown or not positive
    std::optional<timing::TimeWindow> time_window() const;

    bool is_sky_exposure() const { return std::isfinite(airmass); }
    bool is_calibration(const std::vector<std::string>& calibration_targets) const;
    bool has_fiducial() const { return fiducial.is_finite(); }

    // "<id> <target> dither <n>"
    std::string long_name() const;
};

} // namespace vw_guider
