#include "vw_guider/core/exposure.hpp"
#include "vw_guider/core/utils.hpp"

namespace vw_guider {

std::optional<timing::TimeWindow> Exposure::time_window() const {
    return timing::TimeWindow::from_start_and_duration(start, exptime);
}

bool Exposure::is_calibration(const std::vector<std::string>& calibration_targets) const {
    const std::string name = core::to_lower(target);
    for (const auto& cal : calibration_targets) {
        if (!cal.empty() && name.find(core::to_lower(cal)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string Exposure::long_name() const {
    return id + " " + target + " dither " + std::to_string(dither);
}

} // namespace vw_guider
