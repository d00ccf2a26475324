#pragma once

#include "vw_guider/core/types.hpp"
#include "vw_guider/guider/frame_source.hpp"

#include <optional>
#include <string>

namespace vw_guider::config {
struct Config;
}

namespace vw_guider::fitting {

struct PointSourceFitOptions {
    int window = 20;             // fit sub-window edge length (px)
    double stddev_guess = 3.0;
    double stddev_min = 0.5;
    int max_iterations = 200;    // cap on model evaluations
    double fwhm_fail_px = 30.0;
    double pixel_scale_arcsec = 0.533;
    double timeout_s = 0.0;      // 0 = no wall-clock limit

    static PointSourceFitOptions from_config(const config::Config& cfg);
};

// Elliptical Gaussian plus constant background, in sub-window pixel coordinates
struct GaussianParams {
    double amplitude = kNaN;
    double x0 = kNaN;
    double y0 = kNaN;
    double stddev_x = kNaN;
    double stddev_y = kNaN;
    double background = kNaN;

    double evaluate(double x, double y) const;
};

// Gaussian fit of the brightest point source of a cutout. The result is
// fixed at construction; implausible or non-converged fits are flagged
// through has_failed() and never throw.
class PointSourceFit {
public:
    // guess is in frame coordinates (same convention as the cutout origin).
    // Throws ValidationError for an empty cutout.
    PointSourceFit(guider::Cutout cutout, double exptime,
                   std::optional<Point2D> guess = std::nullopt,
                   const PointSourceFitOptions& options = {});

    const guider::Cutout& cutout() const { return cutout_; }
    const GaussianParams& params() const { return params_; }
    double exptime() const { return exptime_; }

    // Offset of the fitted sub-window inside the cutout
    int window_x0() const { return win_x0_; }
    int window_y0() const { return win_y0_; }

    // Fitted centre in frame coordinates
    Point2D center() const;

    double fwhm_pix() const;
    double fwhm_arcsec() const;
    // Integrated model flux per second
    double total_flux_rate() const;

    bool has_failed() const;
    bool converged() const { return converged_; }
    int evaluations() const { return evaluations_; }
    const std::string& status() const { return status_; }

    // Model evaluated on the full cutout grid
    Matrix2Df model_image() const;
    // Cutout minus model, NaN where the cutout is not finite
    Matrix2Df residuals() const;

private:
    void fit(const std::optional<Point2D>& guess);

    guider::Cutout cutout_;
    double exptime_;
    PointSourceFitOptions options_;

    int win_x0_ = 0;
    int win_y0_ = 0;
    int win_w_ = 0;
    int win_h_ = 0;

    GaussianParams params_;
    bool converged_ = false;
    int evaluations_ = 0;
    std::string status_ = "not started";
};

} // namespace vw_guider::fitting
