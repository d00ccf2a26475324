#include "vw_guider/stats/robust_statistics.hpp"
#include "vw_guider/core/utils.hpp"

#include <cmath>
#include <limits>

namespace vw_guider::stats {

std::vector<bool> clip_by_value(const std::vector<double>& values,
                                std::optional<double> sigma, int max_iterations) {
    const size_t n = values.size();
    std::vector<bool> keep(n, true);
    if (!sigma || n <= 1) {
        return keep;
    }

    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(values[i])) keep[i] = false;
    }

    for (int iter = 0; iter < max_iterations; ++iter) {
        std::vector<double> kept;
        kept.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            if (keep[i] && std::isfinite(values[i])) kept.push_back(values[i]);
        }
        if (kept.empty()) {
            // only infinities (or nothing) left
            for (size_t i = 0; i < n; ++i) keep[i] = false;
            break;
        }

        const double center = core::median_of(kept);
        const double std = core::stddev_of(kept);
        const double limit = *sigma * std;

        bool changed = false;
        for (size_t i = 0; i < n; ++i) {
            if (!keep[i]) continue;
            if (!std::isfinite(values[i]) || std::fabs(values[i] - center) > limit) {
                keep[i] = false;
                changed = true;
            }
        }
        if (!changed) break;
    }
    return keep;
}

std::vector<bool> clip_by_distance(const std::vector<Point2D>& points,
                                   std::optional<double> sigma, int max_iterations) {
    const size_t n = points.size();
    if (!sigma || n <= 1) {
        return std::vector<bool>(n, true);
    }

    std::vector<double> xs;
    std::vector<double> ys;
    for (const auto& p : points) {
        if (p.is_finite()) {
            xs.push_back(p.x);
            ys.push_back(p.y);
        }
    }
    if (xs.empty()) {
        return std::vector<bool>(n, false);
    }

    const double mx = core::median_of(xs);
    const double my = core::median_of(ys);

    std::vector<double> dist(n);
    for (size_t i = 0; i < n; ++i) {
        const auto& p = points[i];
        dist[i] = p.is_finite() ? std::hypot(p.x - mx, p.y - my)
                                : std::numeric_limits<double>::infinity();
    }
    return clip_by_value(dist, sigma, max_iterations);
}

std::optional<MeanStd> masked_mean_std(const std::vector<double>& values,
                                       const std::vector<bool>& keep) {
    std::vector<double> kept;
    for (size_t i = 0; i < values.size() && i < keep.size(); ++i) {
        if (keep[i] && std::isfinite(values[i])) kept.push_back(values[i]);
    }
    if (kept.empty()) {
        return std::nullopt;
    }
    return MeanStd{core::mean_of(kept), core::stddev_of(kept)};
}

std::optional<CentroidStats> masked_centroid_stats(const std::vector<Point2D>& points,
                                                   const std::vector<bool>& keep) {
    std::vector<double> xs;
    std::vector<double> ys;
    for (size_t i = 0; i < points.size() && i < keep.size(); ++i) {
        if (keep[i] && points[i].is_finite()) {
            xs.push_back(points[i].x);
            ys.push_back(points[i].y);
        }
    }
    if (xs.empty()) {
        return std::nullopt;
    }
    CentroidStats s;
    s.mean = Point2D{core::mean_of(xs), core::mean_of(ys)};
    s.std = Point2D{core::stddev_of(xs), core::stddev_of(ys)};
    return s;
}

} // namespace vw_guider::stats
