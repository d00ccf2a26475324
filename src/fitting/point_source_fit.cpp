#include "vw_guider/fitting/point_source_fit.hpp"
#include "vw_guider/config/configuration.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/core/utils.hpp"

#include <opencv2/core.hpp>
#include <unsupported/Eigen/NonLinearOptimization>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <vector>

namespace vw_guider::fitting {

namespace {

constexpr double kFwhmPerSigma = 2.355;
constexpr int kNumParams = 6;

enum ParamIndex { P_AMP = 0, P_X0, P_Y0, P_SX, P_SY, P_BG };

// Bound handling by change of variables: the solver works on an
// unconstrained u, the model on p(u).
struct ParamBound {
    enum class Kind { NONE, LOWER, BOTH };
    Kind kind = Kind::NONE;
    double lo = 0.0;
    double hi = 0.0;

    double to_param(double u) const {
        switch (kind) {
            case Kind::BOTH: return lo + (hi - lo) * (std::sin(u) + 1.0) * 0.5;
            case Kind::LOWER: return lo - 1.0 + std::sqrt(u * u + 1.0);
            default: return u;
        }
    }

    double dparam_du(double u) const {
        switch (kind) {
            case Kind::BOTH: return (hi - lo) * std::cos(u) * 0.5;
            case Kind::LOWER: return u / std::sqrt(u * u + 1.0);
            default: return 1.0;
        }
    }

    double to_internal(double p) const {
        switch (kind) {
            case Kind::BOTH: {
                const double margin = 1e-3 * (hi - lo);
                p = std::clamp(p, lo + margin, hi - margin);
                return std::asin(2.0 * (p - lo) / (hi - lo) - 1.0);
            }
            case Kind::LOWER: {
                p = std::max(p, lo + 1e-3);
                const double t = p - lo + 1.0;
                return std::sqrt(t * t - 1.0);
            }
            default: return p;
        }
    }
};

struct GaussianResidual {
    typedef double Scalar;

    std::vector<double> xs;
    std::vector<double> ys;
    std::vector<double> zs;
    ParamBound bounds[kNumParams];

    int values() const { return static_cast<int>(zs.size()); }

    GaussianParams params_from(const Eigen::VectorXd& u) const {
        GaussianParams p;
        p.amplitude = bounds[P_AMP].to_param(u[P_AMP]);
        p.x0 = bounds[P_X0].to_param(u[P_X0]);
        p.y0 = bounds[P_Y0].to_param(u[P_Y0]);
        p.stddev_x = bounds[P_SX].to_param(u[P_SX]);
        p.stddev_y = bounds[P_SY].to_param(u[P_SY]);
        p.background = bounds[P_BG].to_param(u[P_BG]);
        return p;
    }

    int operator()(const Eigen::VectorXd& u, Eigen::VectorXd& fvec) const {
        const GaussianParams p = params_from(u);
        for (size_t i = 0; i < zs.size(); ++i) {
            fvec[static_cast<Eigen::Index>(i)] = p.evaluate(xs[i], ys[i]) - zs[i];
        }
        return 0;
    }

    int df(const Eigen::VectorXd& u, Eigen::MatrixXd& fjac) const {
        const GaussianParams p = params_from(u);
        double chain[kNumParams];
        for (int j = 0; j < kNumParams; ++j) {
            chain[j] = bounds[j].dparam_du(u[j]);
        }
        const double sx2 = p.stddev_x * p.stddev_x;
        const double sy2 = p.stddev_y * p.stddev_y;
        for (size_t i = 0; i < zs.size(); ++i) {
            const auto r = static_cast<Eigen::Index>(i);
            const double dx = xs[i] - p.x0;
            const double dy = ys[i] - p.y0;
            const double e = std::exp(-0.5 * (dx * dx / sx2 + dy * dy / sy2));
            const double g = p.amplitude * e;
            fjac(r, P_AMP) = e * chain[P_AMP];
            fjac(r, P_X0) = g * dx / sx2 * chain[P_X0];
            fjac(r, P_Y0) = g * dy / sy2 * chain[P_Y0];
            fjac(r, P_SX) = g * dx * dx / (sx2 * p.stddev_x) * chain[P_SX];
            fjac(r, P_SY) = g * dy * dy / (sy2 * p.stddev_y) * chain[P_SY];
            fjac(r, P_BG) = chain[P_BG];
        }
        return 0;
    }
};

const char* lm_status_to_string(Eigen::LevenbergMarquardtSpace::Status status) {
    using namespace Eigen::LevenbergMarquardtSpace;
    switch (status) {
        case ImproperInputParameters: return "improper input parameters";
        case RelativeReductionTooSmall: return "relative reduction too small";
        case RelativeErrorTooSmall: return "relative error too small";
        case RelativeErrorAndReductionTooSmall: return "relative error and reduction too small";
        case CosinusTooSmall: return "cosinus too small";
        case TooManyFunctionEvaluation: return "too many function evaluations";
        case FtolTooSmall: return "ftol too small";
        case XtolTooSmall: return "xtol too small";
        case GtolTooSmall: return "gtol too small";
        case UserAsked: return "user asked";
        case Running: return "running";
        default: return "not started";
    }
}

} // namespace

PointSourceFitOptions PointSourceFitOptions::from_config(const config::Config& cfg) {
    PointSourceFitOptions o;
    o.window = cfg.fitting.window;
    o.stddev_guess = cfg.fitting.stddev_guess;
    o.stddev_min = cfg.fitting.stddev_min;
    o.max_iterations = cfg.fitting.max_iterations;
    o.fwhm_fail_px = cfg.fitting.fwhm_fail_px;
    o.pixel_scale_arcsec = cfg.instrument.pixel_scale_arcsec;
    o.timeout_s = cfg.fitting.timeout_s;
    return o;
}

double GaussianParams::evaluate(double x, double y) const {
    const double dx = (x - x0) / stddev_x;
    const double dy = (y - y0) / stddev_y;
    return amplitude * std::exp(-0.5 * (dx * dx + dy * dy)) + background;
}

PointSourceFit::PointSourceFit(guider::Cutout cutout, double exptime,
                               std::optional<Point2D> guess,
                               const PointSourceFitOptions& options)
    : cutout_(std::move(cutout)), exptime_(exptime), options_(options) {
    if (cutout_.empty()) {
        throw ValidationError("Cannot fit an empty cutout");
    }
    fit(guess);
}

void PointSourceFit::fit(const std::optional<Point2D>& guess) {
    const int w = cutout_.width();
    const int h = cutout_.height();
    const int half = std::max(1, options_.window / 2);

    // Sub-window centre, cutout-local
    int cx = 0;
    int cy = 0;
    if (guess) {
        if (!guess->is_finite()) {
            status_ = "guess is not finite";
            return;
        }
        const double gx = std::round(guess->x - cutout_.origin_x);
        const double gy = std::round(guess->y - cutout_.origin_y);
        if (gx < 0.0 || gy < 0.0 || gx >= w || gy >= h) {
            status_ = "guess outside cutout";
            return;
        }
        cx = static_cast<int>(gx);
        cy = static_cast<int>(gy);
    } else {
        cv::Mat view(h, w, CV_32F, const_cast<float*>(cutout_.data.data()));
        cv::Mat1b finite(h, w);
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                finite(y, x) = std::isfinite(cutout_.data(y, x)) ? 255 : 0;
            }
        }
        if (cv::countNonZero(finite) == 0) {
            status_ = "no finite pixels";
            return;
        }
        double maxv = 0.0;
        cv::Point peak;
        cv::minMaxLoc(view, nullptr, &maxv, nullptr, &peak, finite);
        cx = peak.x;
        cy = peak.y;
    }

    win_x0_ = std::max(0, cx - half);
    win_y0_ = std::max(0, cy - half);
    win_w_ = std::min(w, cx + half) - win_x0_;
    win_h_ = std::min(h, cy + half) - win_y0_;

    GaussianResidual functor;
    double vmin = 0.0;
    double vmax = 0.0;
    for (int y = 0; y < win_h_; ++y) {
        for (int x = 0; x < win_w_; ++x) {
            const double v = cutout_.data(win_y0_ + y, win_x0_ + x);
            if (!std::isfinite(v)) continue;
            if (functor.zs.empty()) {
                vmin = vmax = v;
            } else {
                vmin = std::min(vmin, v);
                vmax = std::max(vmax, v);
            }
            functor.xs.push_back(x);
            functor.ys.push_back(y);
            functor.zs.push_back(v);
        }
    }

    if (functor.zs.size() < static_cast<size_t>(kNumParams)) {
        status_ = "too few finite pixels";
        return;
    }
    if (!(vmax > vmin)) {
        status_ = "flat sub-window";
        return;
    }

    const double sx_hi = 0.5 * win_w_;
    const double sy_hi = 0.5 * win_h_;
    if (!(sx_hi > options_.stddev_min) || !(sy_hi > options_.stddev_min)) {
        status_ = "sub-window too small";
        return;
    }

    const double background = core::median_of(functor.zs);
    const double amplitude = std::max(vmax - background, 1.0);

    using Kind = ParamBound::Kind;
    functor.bounds[P_AMP] = {Kind::LOWER, 0.0, 0.0};
    functor.bounds[P_X0] = {Kind::BOTH, 0.0, static_cast<double>(win_w_)};
    functor.bounds[P_Y0] = {Kind::BOTH, 0.0, static_cast<double>(win_h_)};
    functor.bounds[P_SX] = {Kind::BOTH, options_.stddev_min, sx_hi};
    functor.bounds[P_SY] = {Kind::BOTH, options_.stddev_min, sy_hi};
    functor.bounds[P_BG] = {Kind::NONE, 0.0, 0.0};

    Eigen::VectorXd u(kNumParams);
    u[P_AMP] = functor.bounds[P_AMP].to_internal(amplitude);
    u[P_X0] = functor.bounds[P_X0].to_internal(cx - win_x0_);
    u[P_Y0] = functor.bounds[P_Y0].to_internal(cy - win_y0_);
    u[P_SX] = functor.bounds[P_SX].to_internal(options_.stddev_guess);
    u[P_SY] = functor.bounds[P_SY].to_internal(options_.stddev_guess);
    u[P_BG] = functor.bounds[P_BG].to_internal(background);

    using namespace Eigen::LevenbergMarquardtSpace;
    Eigen::LevenbergMarquardt<GaussianResidual> lm(functor);
    lm.parameters.maxfev = options_.max_iterations;

    const bool use_deadline = options_.timeout_s > 0.0;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              std::chrono::duration<double>(options_.timeout_s));

    Status status = lm.minimizeInit(u);
    bool timed_out = false;
    if (status != ImproperInputParameters && status != UserAsked) {
        do {
            status = lm.minimizeOneStep(u);
            if (status == Running && use_deadline &&
                std::chrono::steady_clock::now() > deadline) {
                timed_out = true;
                break;
            }
        } while (status == Running);
    }

    evaluations_ = static_cast<int>(lm.nfev);
    converged_ = !timed_out && (status == RelativeReductionTooSmall ||
                                status == RelativeErrorTooSmall ||
                                status == RelativeErrorAndReductionTooSmall ||
                                status == CosinusTooSmall);
    status_ = timed_out ? "timeout" : lm_status_to_string(status);

    if (status != ImproperInputParameters) {
        params_ = functor.params_from(u);
    }
}

Point2D PointSourceFit::center() const {
    return Point2D{cutout_.origin_x + win_x0_ + params_.x0,
                   cutout_.origin_y + win_y0_ + params_.y0};
}

double PointSourceFit::fwhm_pix() const {
    return kFwhmPerSigma * std::min(params_.stddev_x, params_.stddev_y);
}

double PointSourceFit::fwhm_arcsec() const {
    return fwhm_pix() * options_.pixel_scale_arcsec;
}

double PointSourceFit::total_flux_rate() const {
    if (!(exptime_ > 0.0)) return kNaN;
    return 2.0 * M_PI * params_.stddev_x * params_.stddev_y * params_.amplitude / exptime_;
}

bool PointSourceFit::has_failed() const {
    const Point2D c = center();
    return !c.is_finite() || fwhm_pix() > options_.fwhm_fail_px;
}

Matrix2Df PointSourceFit::model_image() const {
    Matrix2Df model(cutout_.height(), cutout_.width());
    for (int y = 0; y < cutout_.height(); ++y) {
        for (int x = 0; x < cutout_.width(); ++x) {
            model(y, x) = static_cast<float>(params_.evaluate(x - win_x0_, y - win_y0_));
        }
    }
    return model;
}

Matrix2Df PointSourceFit::residuals() const {
    Matrix2Df res = model_image();
    for (Eigen::Index i = 0; i < res.size(); ++i) {
        const float v = cutout_.data.data()[i];
        res.data()[i] = std::isfinite(v) ? v - res.data()[i] : std::numeric_limits<float>::quiet_NaN();
    }
    return res;
}

} // namespace vw_guider::fitting
