#include "vw_guider/stacking/frame_stacker.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/stats/robust_statistics.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace vw_guider::stacking {

StackResult stack_frames(std::vector<guider::FrameSource>& frames,
                         const std::vector<Point2D>& centroids,
                         std::optional<double> sigma, int max_clip_iterations,
                         bool release_after) {
    if (frames.size() != centroids.size()) {
        throw ValidationError("stack_frames: " + std::to_string(frames.size()) + " frames but " +
                              std::to_string(centroids.size()) + " centroids");
    }

    StackResult result;
    result.kept = stats::clip_by_distance(centroids, sigma, max_clip_iterations);
    for (size_t i = 0; i < frames.size(); ++i) {
        if (!result.kept[i]) continue;
        if (!centroids[i].is_finite()) {
            result.kept[i] = false;
        } else if (!(frames[i].exptime() > 0.0)) {
            std::cerr << "[STACK] Skipping " << frames[i].name()
                      << ": exposure time is not positive" << std::endl;
            result.kept[i] = false;
        }
    }

    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < frames.size(); ++i) {
        if (!result.kept[i]) continue;
        min_x = std::min(min_x, centroids[i].x);
        min_y = std::min(min_y, centroids[i].y);
    }
    if (!std::isfinite(min_x)) {
        throw ValidationError("stack_frames: no frames left to stack");
    }

    // Canvas extent: union of all kept frames at their offsets
    struct Placement {
        size_t index;
        int x_off;
        int y_off;
    };
    std::vector<Placement> placements;
    int canvas_w = 0;
    int canvas_h = 0;
    for (size_t i = 0; i < frames.size(); ++i) {
        if (!result.kept[i]) continue;
        const double dx = centroids[i].x - min_x;
        const double dy = centroids[i].y - min_y;
        const Matrix2Df& data = frames[i].data();
        canvas_w = std::max(canvas_w, static_cast<int>(std::ceil(dx)) + static_cast<int>(data.cols()));
        canvas_h = std::max(canvas_h, static_cast<int>(std::ceil(dy)) + static_cast<int>(data.rows()));
        placements.push_back({i, static_cast<int>(std::lround(dx)), static_cast<int>(std::lround(dy))});
    }

    cv::Mat sum = cv::Mat::zeros(canvas_h, canvas_w, CV_64F);
    cv::Mat count = cv::Mat::zeros(canvas_h, canvas_w, CV_32S);

    for (const auto& p : placements) {
        auto& frame = frames[p.index];
        const Matrix2Df& data = frame.data();
        const int fw = static_cast<int>(data.cols());
        const int fh = static_cast<int>(data.rows());
        cv::Mat view(fh, fw, CV_32F, const_cast<float*>(data.data()));

        cv::Mat normalized;
        view.convertTo(normalized, CV_64F, 1.0 / frame.exptime());

        const cv::Rect roi(p.x_off, p.y_off, fw, fh);
        cv::Mat sum_roi = sum(roi);
        cv::Mat count_roi = count(roi);
        sum_roi += normalized;
        count_roi += cv::Scalar(1);

        if (release_after) frame.release();
    }

    cv::Mat coverage;
    cv::max(count, 1, count);
    count.convertTo(coverage, CV_64F);
    cv::Mat mean = sum / coverage;

    result.image.resize(canvas_h, canvas_w);
    cv::Mat out(canvas_h, canvas_w, CV_32F, result.image.data());
    mean.convertTo(out, CV_32F);
    result.n_frames = static_cast<int>(placements.size());
    return result;
}

} // namespace vw_guider::stacking
