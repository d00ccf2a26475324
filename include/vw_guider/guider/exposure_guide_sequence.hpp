#pragma once

#include "vw_guider/core/exposure.hpp"
#include "vw_guider/core/types.hpp"
#include "vw_guider/fitting/point_source_fit.hpp"
#include "vw_guider/guider/frame_source.hpp"
#include "vw_guider/io/records_io.hpp"
#include "vw_guider/stats/robust_statistics.hpp"

#include <optional>
#include <vector>

namespace vw_guider::config {
struct Config;
}

namespace vw_guider::io {
class FrameIndex;
}

namespace vw_guider::guider {

constexpr double kDefaultClipSigma = 2.5;

// Guide-star fits of every frame taken during one exposure.
//
// frames() and fits() have the same length and are paired by index. A frame
// whose pixels cannot be read or cut is dropped (and counted in
// skipped_frames()). Statistics of an empty sequence are std::nullopt.
class ExposureGuideSequence {
public:
    // Throws ValidationError when the exposure has no time window or no
    // finite fiducial position.
    ExposureGuideSequence(Exposure exposure, const io::FrameIndex& index,
                          const config::Config& cfg, GuessMode mode = GuessMode::FIXED);

    // Same, for frames selected by the caller
    ExposureGuideSequence(Exposure exposure, std::vector<FrameSource> frames,
                          const config::Config& cfg, GuessMode mode = GuessMode::FIXED);

    size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }

    const Exposure& exposure() const { return exposure_; }
    GuessMode guess_mode() const { return mode_; }
    const std::vector<FrameSource>& frames() const { return frames_; }
    std::vector<FrameSource>& frames() { return frames_; }
    const std::vector<fitting::PointSourceFit>& fits() const { return fits_; }
    int skipped_frames() const { return skipped_frames_; }
    int failed_fits() const;

    std::vector<TimePoint> frame_times() const;

    // Fitted centres, outlier frames removed by distance clipping
    std::vector<Point2D> centroids(std::optional<double> sigma = kDefaultClipSigma) const;
    std::optional<CentroidStats> centroid_stats(std::optional<double> sigma = kDefaultClipSigma) const;

    std::vector<double> fwhms_arcsec(std::optional<double> sigma = kDefaultClipSigma) const;
    std::optional<MeanStd> fwhm_stats(std::optional<double> sigma = kDefaultClipSigma) const;

    std::vector<double> flux_rates(std::optional<double> sigma = std::nullopt) const;
    std::optional<MeanStd> flux_rate_stats(std::optional<double> sigma = std::nullopt) const;

    // Shift-and-add stack of the sequence's frames, aligned on the unclipped
    // centroids. Throws ValidationError when nothing survives clipping.
    Matrix2Df stacked_frame(std::optional<double> sigma = kDefaultClipSigma);

    io::ExposureRecord to_record(std::optional<double> sigma,
                                 std::optional<double> flux_rate_sigma) const;

private:
    void fit_all(std::vector<FrameSource> frames);

    Exposure exposure_;
    GuessMode mode_;
    fitting::PointSourceFitOptions fit_options_;
    int search_size_;
    int pixel_origin_;
    bool refine_at_guess_;
    bool release_frames_;
    int max_clip_iterations_;

    std::vector<FrameSource> frames_;
    std::vector<fitting::PointSourceFit> fits_;
    int skipped_frames_ = 0;
};

} // namespace vw_guider::guider
