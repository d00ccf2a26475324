#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace vw_guider {

namespace fs = std::filesystem;

// Matrix types (row = y, column = x)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;

using TimePoint = std::chrono::system_clock::time_point;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Pixel position in frame coordinates
struct Point2D {
    double x = kNaN;
    double y = kNaN;

    bool is_finite() const { return std::isfinite(x) && std::isfinite(y); }
};

// Mean and (population) standard deviation of a 1-D sample
struct MeanStd {
    double mean;
    double std;
};

// Per-axis mean and standard deviation of a centroid cloud
struct CentroidStats {
    Point2D mean;
    Point2D std;
};

// How consecutive frames of one exposure seed their fits
enum class GuessMode {
    FIXED,   // every frame starts from the fiducial position
    CHAINED  // each accepted fit seeds the next frame
};

inline std::string guess_mode_to_string(GuessMode mode) {
    switch (mode) {
        case GuessMode::FIXED: return "fixed";
        case GuessMode::CHAINED: return "chained";
        default: return "unknown";
    }
}

inline std::optional<GuessMode> string_to_guess_mode(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (norm == "fixed") return GuessMode::FIXED;
    if (norm == "chained") return GuessMode::CHAINED;
    return std::nullopt;
}

// Pipeline phase enumeration
enum class Phase {
    INDEX = 0,
    LOAD_EXPOSURES = 1,
    FIT = 2,
    CHUNK = 3,
    STACK = 4,
    WRITE = 5,
    DONE = 6
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::INDEX: return "INDEX";
        case Phase::LOAD_EXPOSURES: return "LOAD_EXPOSURES";
        case Phase::FIT: return "FIT";
        case Phase::CHUNK: return "CHUNK";
        case Phase::STACK: return "STACK";
        case Phase::WRITE: return "WRITE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace vw_guider
