#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace vw_guider::core {

using json = nlohmann::json;

// Writes one JSON object per line. Safe to call from worker threads.
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out) : out_(&out) {}

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const std::string& status);

    void phase_start(const std::string& run_id, Phase phase);
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        const std::string& message);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra);

    void exposure_processed(const std::string& run_id, int index, int total,
                            const std::string& exposure_id, int n_frames);

    void warning(const std::string& run_id, const std::string& message);
    void error(const std::string& run_id, const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream* out_;
    std::mutex mutex_;
};

} // namespace vw_guider::core
