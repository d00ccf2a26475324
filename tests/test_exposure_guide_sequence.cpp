#include "vw_guider/config/configuration.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/core/utils.hpp"
#include "vw_guider/guider/exposure_guide_sequence.hpp"
#include "vw_guider/io/frame_index.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace vw_guider;

namespace {

const TimePoint kStart = core::parse_iso_timestamp("2024-03-01T03:00:00");

Exposure science_exposure(double exptime = 60.0) {
    Exposure e;
    e.id = "vw240301_0012";
    e.target = "M52";
    e.start = kStart;
    e.exptime = exptime;
    e.airmass = 1.2;
    e.fiducial = Point2D{50.0, 60.0};
    return e;
}

// Star position in FITS (1-based) coordinates
guider::FrameSource star_frame(double fx, double fy, int second, double exptime = 2.0) {
    guider::FrameMetadata meta;
    meta.timestamp = kStart + std::chrono::seconds(second);
    meta.exptime = exptime;
    meta.airmass = 1.2;
    return guider::FrameSource(
        test::gaussian_image(100, 100, 200.0, fx - 1.0, fy - 1.0, 2.0, 2.0, 10.0), meta);
}

} // namespace

TEST_CASE("guide_sequence_fits_every_frame") {
    config::Config cfg;
    std::vector<guider::FrameSource> frames;
    frames.push_back(star_frame(50.0, 60.0, 1));
    frames.push_back(star_frame(50.3, 59.8, 3));
    frames.push_back(star_frame(49.8, 60.1, 5));

    guider::ExposureGuideSequence seq(science_exposure(), std::move(frames), cfg);
    REQUIRE(seq.size() == 3);
    REQUIRE(seq.fits().size() == 3);
    REQUIRE(seq.failed_fits() == 0);
    REQUIRE(seq.skipped_frames() == 0);

    const auto pts = seq.centroids(std::nullopt);
    REQUIRE(pts.size() == 3);
    REQUIRE(pts[0].x == Catch::Approx(50.0).margin(0.02));
    REQUIRE(pts[0].y == Catch::Approx(60.0).margin(0.02));
    REQUIRE(pts[1].x == Catch::Approx(50.3).margin(0.02));
    REQUIRE(pts[2].y == Catch::Approx(60.1).margin(0.02));

    const auto times = seq.frame_times();
    REQUIRE(times.size() == 3);
    REQUIRE(times[0] < times[1]);

    const auto fwhm = seq.fwhm_stats(std::nullopt);
    REQUIRE(fwhm);
    REQUIRE(fwhm->mean == Catch::Approx(2.355 * 2.0 * 0.533).epsilon(0.01));

    // 2 pi * 2 * 2 * 200 / 2
    const auto flux = seq.flux_rate_stats();
    REQUIRE(flux);
    REQUIRE(flux->mean == Catch::Approx(2513.27).epsilon(0.01));
}

TEST_CASE("guide_sequence_clipping_drops_outlier_frame") {
    config::Config cfg;
    std::vector<guider::FrameSource> frames;
    const double xs[] = {50.0, 50.2, 50.4, 50.2, 50.0, 65.0};
    for (int i = 0; i < 6; ++i) {
        frames.push_back(star_frame(xs[i], 60.0, i));
    }

    guider::ExposureGuideSequence seq(science_exposure(), std::move(frames), cfg);
    REQUIRE(seq.size() == 6);

    const auto all = seq.centroids(std::nullopt);
    const auto clipped = seq.centroids(2.5);
    REQUIRE(all.size() == 6);
    REQUIRE(clipped.size() == 5);
    REQUIRE(all.size() >= clipped.size());

    const auto stats = seq.centroid_stats();
    REQUIRE(stats);
    REQUIRE(stats->mean.x == Catch::Approx(50.16).margin(0.02));
    REQUIRE(stats->mean.y == Catch::Approx(60.0).margin(0.02));

    const auto unclipped = seq.centroid_stats(std::nullopt);
    REQUIRE(unclipped);
    REQUIRE(unclipped->std.x > stats->std.x);
}

TEST_CASE("guide_sequence_chained_mode_follows_drift") {
    config::Config cfg;
    cfg.fitting.search_size = 20;
    cfg.fitting.window = 10;

    auto drifting = []() {
        std::vector<guider::FrameSource> frames;
        for (int k = 0; k < 6; ++k) {
            frames.push_back(star_frame(50.0 + 4.0 * k, 60.0, k));
        }
        return frames;
    };

    guider::ExposureGuideSequence chained(science_exposure(), drifting(), cfg, GuessMode::CHAINED);
    REQUIRE(chained.guess_mode() == GuessMode::CHAINED);
    const auto pts = chained.centroids(std::nullopt);
    REQUIRE(pts.size() == 6);
    for (int k = 0; k < 6; ++k) {
        REQUIRE(pts[k].x == Catch::Approx(50.0 + 4.0 * k).margin(0.05));
    }

    guider::ExposureGuideSequence fixed(science_exposure(), drifting(), cfg, GuessMode::FIXED);
    const auto last = fixed.centroids(std::nullopt).back();
    REQUIRE_FALSE(std::fabs(last.x - 70.0) < 1.0);
}

TEST_CASE("guide_sequence_empty_index_has_no_statistics") {
    config::Config cfg;
    io::FrameIndex index;
    guider::ExposureGuideSequence seq(science_exposure(), index, cfg);

    REQUIRE(seq.empty());
    REQUIRE(seq.size() == 0);
    REQUIRE(seq.failed_fits() == 0);
    REQUIRE(seq.centroids().empty());
    REQUIRE_FALSE(seq.centroid_stats());
    REQUIRE_FALSE(seq.centroid_stats(std::nullopt));
    REQUIRE_FALSE(seq.fwhm_stats());
    REQUIRE_FALSE(seq.flux_rate_stats());
    REQUIRE_THROWS_AS(seq.stacked_frame(), ValidationError);

    const auto rec = seq.to_record(2.5, std::nullopt);
    REQUIRE(rec.n_frames == 0);
    REQUIRE_FALSE(rec.centroid);
    REQUIRE_FALSE(rec.fwhm_arcsec);
}

TEST_CASE("guide_sequence_rejects_unguidable_exposure") {
    config::Config cfg;
    io::FrameIndex index;

    Exposure no_fiducial = science_exposure();
    no_fiducial.fiducial = Point2D{};
    REQUIRE_THROWS_AS(guider::ExposureGuideSequence(no_fiducial, index, cfg), ValidationError);

    REQUIRE_THROWS_AS(guider::ExposureGuideSequence(science_exposure(kNaN), index, cfg),
                      ValidationError);
    REQUIRE_THROWS_AS(guider::ExposureGuideSequence(science_exposure(0.0), index, cfg),
                      ValidationError);
}

TEST_CASE("guide_sequence_drops_unreadable_frames") {
    config::Config cfg;
    std::vector<guider::FrameSource> frames;
    frames.push_back(star_frame(50.0, 60.0, 1));

    guider::FrameMetadata missing;
    missing.path = "/nonexistent/guider_frame.fits";
    missing.timestamp = kStart + std::chrono::seconds(2);
    missing.exptime = 2.0;
    frames.emplace_back(missing);

    guider::ExposureGuideSequence seq(science_exposure(), std::move(frames), cfg);
    REQUIRE(seq.size() == 1);
    REQUIRE(seq.skipped_frames() == 1);
}

TEST_CASE("guide_sequence_reads_frames_from_index") {
    test::TempDir dir("vw_guider_seq");
    const Matrix2Df img = test::gaussian_image(100, 100, 200.0, 49.0, 59.0, 2.0, 2.0, 10.0);
    test::write_guide_frame(dir.path() / "g001.fits", img, "2024-03-01", "03:00:02", 2.0, 1.2);
    test::write_guide_frame(dir.path() / "g002.fits", img, "2024-03-01", "03:00:05", 2.0, 1.2);
    test::write_guide_frame(dir.path() / "g003.fits", img, "2024-03-01", "03:00:08", 2.0, 1.2);
    // Outside the exposure
    test::write_guide_frame(dir.path() / "g004.fits", img, "2024-03-01", "03:00:30", 2.0, 1.2);

    const auto index = io::FrameIndex::build(dir.path());
    REQUIRE(index.size() == 4);

    config::Config cfg;
    guider::ExposureGuideSequence seq(science_exposure(10.0), index, cfg);
    REQUIRE(seq.size() == 3);
    for (const auto& f : seq.frames()) {
        REQUIRE(f.is_file_backed());
        REQUIRE_FALSE(f.is_loaded());
    }

    const auto stats = seq.centroid_stats();
    REQUIRE(stats);
    REQUIRE(stats->mean.x == Catch::Approx(50.0).margin(0.02));
    REQUIRE(stats->mean.y == Catch::Approx(60.0).margin(0.02));

    const auto rec = seq.to_record(2.5, std::nullopt);
    REQUIRE(rec.id == "vw240301_0012");
    REQUIRE(rec.target == "M52");
    REQUIRE(rec.n_frames == 3);
    REQUIRE(rec.n_failed_fits == 0);
    REQUIRE(rec.centroid);
    REQUIRE(rec.flux_rate);

    const Matrix2Df stacked = seq.stacked_frame();
    REQUIRE(stacked.rows() == 100);
    REQUIRE(stacked.cols() == 100);
    REQUIRE(stacked(59, 49) == Catch::Approx(105.0).epsilon(1e-4));
}
