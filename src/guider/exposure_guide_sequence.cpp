#include "vw_guider/guider/exposure_guide_sequence.hpp"
#include "vw_guider/config/configuration.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/io/frame_index.hpp"
#include "vw_guider/stacking/frame_stacker.hpp"

#include <iostream>

namespace vw_guider::guider {

namespace {

const Exposure& require_guidable(const Exposure& exposure) {
    if (!exposure.time_window()) {
        throw ValidationError(exposure.long_name() + ": no valid time window (exposure time " +
                              std::to_string(exposure.exptime) + ")");
    }
    if (!exposure.has_fiducial()) {
        throw ValidationError(exposure.long_name() + ": no fiducial coordinates");
    }
    return exposure;
}

} // namespace

ExposureGuideSequence::ExposureGuideSequence(Exposure exposure, const io::FrameIndex& index,
                                             const config::Config& cfg, GuessMode mode)
    : ExposureGuideSequence(
          exposure, require_guidable(exposure).time_window()->select_frames(index), cfg, mode) {}

ExposureGuideSequence::ExposureGuideSequence(Exposure exposure, std::vector<FrameSource> frames,
                                             const config::Config& cfg, GuessMode mode)
    : exposure_(std::move(exposure)),
      mode_(mode),
      fit_options_(fitting::PointSourceFitOptions::from_config(cfg)),
      search_size_(cfg.fitting.search_size),
      pixel_origin_(cfg.instrument.pixel_origin),
      refine_at_guess_(cfg.fitting.refine_at_guess),
      release_frames_(cfg.fitting.release_frames),
      max_clip_iterations_(cfg.statistics.max_clip_iterations) {
    require_guidable(exposure_);
    fit_all(std::move(frames));
}

void ExposureGuideSequence::fit_all(std::vector<FrameSource> frames) {
    Point2D guess = exposure_.fiducial;

    for (auto& frame : frames) {
        try {
            Cutout cut = frame.cutout(guess.x, guess.y, search_size_, pixel_origin_);
            std::optional<Point2D> window_guess;
            if (refine_at_guess_) {
                window_guess = guess;
            }
            fitting::PointSourceFit fit(std::move(cut), frame.exptime(), window_guess, fit_options_);

            if (mode_ == GuessMode::CHAINED && !fit.has_failed()) {
                guess = fit.center();
            }
            fits_.push_back(std::move(fit));
        } catch (const VwGuiderError& e) {
            std::cerr << "[GUIDE] " << exposure_.id << ": dropping frame " << frame.name()
                      << ": " << e.what() << std::endl;
            ++skipped_frames_;
            frame.release();
            continue;
        }

        if (release_frames_) {
            frame.release();
        }
        frames_.push_back(std::move(frame));
    }
}

int ExposureGuideSequence::failed_fits() const {
    int n = 0;
    for (const auto& f : fits_) {
        if (f.has_failed()) ++n;
    }
    return n;
}

std::vector<TimePoint> ExposureGuideSequence::frame_times() const {
    std::vector<TimePoint> times;
    times.reserve(frames_.size());
    for (const auto& f : frames_) {
        times.push_back(f.timestamp());
    }
    return times;
}

std::vector<Point2D> ExposureGuideSequence::centroids(std::optional<double> sigma) const {
    std::vector<Point2D> all;
    all.reserve(fits_.size());
    for (const auto& f : fits_) {
        all.push_back(f.center());
    }
    if (!sigma) {
        return all;
    }
    return stats::apply_mask(all, stats::clip_by_distance(all, sigma, max_clip_iterations_));
}

std::optional<CentroidStats> ExposureGuideSequence::centroid_stats(std::optional<double> sigma) const {
    const auto pts = centroids(sigma);
    return stats::masked_centroid_stats(pts, std::vector<bool>(pts.size(), true));
}

std::vector<double> ExposureGuideSequence::fwhms_arcsec(std::optional<double> sigma) const {
    std::vector<double> all;
    all.reserve(fits_.size());
    for (const auto& f : fits_) {
        all.push_back(f.fwhm_arcsec());
    }
    if (!sigma) {
        return all;
    }
    return stats::apply_mask(all, stats::clip_by_value(all, sigma, max_clip_iterations_));
}

std::optional<MeanStd> ExposureGuideSequence::fwhm_stats(std::optional<double> sigma) const {
    const auto v = fwhms_arcsec(sigma);
    return stats::masked_mean_std(v, std::vector<bool>(v.size(), true));
}

std::vector<double> ExposureGuideSequence::flux_rates(std::optional<double> sigma) const {
    std::vector<double> all;
    all.reserve(fits_.size());
    for (const auto& f : fits_) {
        all.push_back(f.total_flux_rate());
    }
    if (!sigma) {
        return all;
    }
    return stats::apply_mask(all, stats::clip_by_value(all, sigma, max_clip_iterations_));
}

std::optional<MeanStd> ExposureGuideSequence::flux_rate_stats(std::optional<double> sigma) const {
    const auto v = flux_rates(sigma);
    return stats::masked_mean_std(v, std::vector<bool>(v.size(), true));
}

Matrix2Df ExposureGuideSequence::stacked_frame(std::optional<double> sigma) {
    return stacking::stack_frames(frames_, centroids(std::nullopt), sigma, max_clip_iterations_,
                                  release_frames_).image;
}

io::ExposureRecord ExposureGuideSequence::to_record(std::optional<double> sigma,
                                                    std::optional<double> flux_rate_sigma) const {
    io::ExposureRecord r;
    r.id = exposure_.id;
    r.target = exposure_.target;
    r.dither = exposure_.dither;
    r.start = exposure_.start;
    r.exptime = exposure_.exptime;
    r.airmass = exposure_.airmass;
    r.n_frames = static_cast<int>(size());
    r.n_failed_fits = failed_fits();
    r.centroid = centroid_stats(sigma);
    r.fwhm_arcsec = fwhm_stats(sigma);
    r.flux_rate = flux_rate_stats(flux_rate_sigma);
    return r;
}

} // namespace vw_guider::guider
