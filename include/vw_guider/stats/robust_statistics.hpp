#pragma once

#include "vw_guider/core/types.hpp"

#include <optional>
#include <vector>

namespace vw_guider::stats {

constexpr int kDefaultMaxClipIterations = 5;

// Iterative sigma clipping around the median of the surviving values.
// Returns a keep-mask of the same length as the input. A null sigma, or an
// input of 0 or 1 values, keeps everything. Non-finite values are rejected
// otherwise.
std::vector<bool> clip_by_value(const std::vector<double>& values,
                                std::optional<double> sigma,
                                int max_iterations = kDefaultMaxClipIterations);

// Sigma clipping of 2-D points on their Euclidean distance from the median
// point, so an outlier frame is rejected as a whole.
std::vector<bool> clip_by_distance(const std::vector<Point2D>& points,
                                   std::optional<double> sigma,
                                   int max_iterations = kDefaultMaxClipIterations);

// Mean and population standard deviation of the finite values kept by the
// mask; std::nullopt when nothing is left.
std::optional<MeanStd> masked_mean_std(const std::vector<double>& values,
                                       const std::vector<bool>& keep);

std::optional<CentroidStats> masked_centroid_stats(const std::vector<Point2D>& points,
                                                   const std::vector<bool>& keep);

template <typename T>
std::vector<T> apply_mask(const std::vector<T>& items, const std::vector<bool>& keep) {
    std::vector<T> out;
    for (size_t i = 0; i < items.size() && i < keep.size(); ++i) {
        if (keep[i]) out.push_back(items[i]);
    }
    return out;
}

} // namespace vw_guider::stats
