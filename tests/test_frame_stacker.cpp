#include "vw_guider/core/errors.hpp"
#include "vw_guider/stacking/frame_stacker.hpp"
#include "test_helpers.hpp"

#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace vw_guider;

namespace {

guider::FrameSource memory_frame(const Matrix2Df& data, double exptime) {
    guider::FrameMetadata meta;
    meta.exptime = exptime;
    return guider::FrameSource(data, meta);
}

} // namespace

TEST_CASE("stack_single_frame_is_count_rate") {
    const Matrix2Df img = test::gaussian_image(30, 20, 100.0, 12.0, 8.0, 2.0, 2.0, 8.0);
    std::vector<guider::FrameSource> frames{memory_frame(img, 4.0)};

    const auto result = stacking::stack_frames(frames, {Point2D{13.0, 9.0}}, 2.5);
    REQUIRE(result.n_frames == 1);
    REQUIRE(result.kept == std::vector<bool>{true});
    REQUIRE(result.image.rows() == 20);
    REQUIRE(result.image.cols() == 30);
    REQUIRE(result.image(8, 12) == Catch::Approx(27.0).epsilon(1e-5));
    REQUIRE(result.image(0, 0) == Catch::Approx(img(0, 0) / 4.0).epsilon(1e-5));
}

TEST_CASE("stack_offset_frames_average_overlap") {
    std::vector<guider::FrameSource> frames;
    frames.push_back(memory_frame(Matrix2Df::Constant(10, 10, 2.0f), 1.0));
    frames.push_back(memory_frame(Matrix2Df::Constant(10, 10, 8.0f), 2.0));

    const std::vector<Point2D> centroids{{10.0, 10.0}, {13.0, 12.0}};
    const auto result = stacking::stack_frames(frames, centroids, std::nullopt);

    REQUIRE(result.n_frames == 2);
    REQUIRE(result.image.cols() == 13);
    REQUIRE(result.image.rows() == 12);
    REQUIRE(result.image(0, 0) == Catch::Approx(2.0));      // first frame only
    REQUIRE(result.image(5, 5) == Catch::Approx(3.0));      // overlap
    REQUIRE(result.image(11, 12) == Catch::Approx(4.0));    // second frame only
    REQUIRE(result.image(11, 0) == Catch::Approx(0.0));     // no coverage
}

TEST_CASE("stack_fractional_offsets_are_rounded") {
    std::vector<guider::FrameSource> frames;
    frames.push_back(memory_frame(Matrix2Df::Constant(10, 10, 1.0f), 1.0));
    frames.push_back(memory_frame(Matrix2Df::Constant(10, 10, 1.0f), 1.0));

    const std::vector<Point2D> centroids{{5.0, 5.0}, {7.6, 5.4}};
    const auto result = stacking::stack_frames(frames, centroids, std::nullopt);
    REQUIRE(result.image.cols() == 13);
    REQUIRE(result.image.rows() == 11);
    REQUIRE(result.image(0, 12) == Catch::Approx(1.0));
    REQUIRE(result.image(10, 12) == Catch::Approx(0.0));
}

TEST_CASE("stack_skips_unusable_frames") {
    std::vector<guider::FrameSource> frames;
    frames.push_back(memory_frame(Matrix2Df::Constant(8, 8, 3.0f), 1.0));
    frames.push_back(memory_frame(Matrix2Df::Constant(8, 8, 50.0f), 1.0));
    frames.push_back(memory_frame(Matrix2Df::Constant(8, 8, 70.0f), 0.0));

    const std::vector<Point2D> centroids{{20.0, 20.0}, {kNaN, kNaN}, {20.0, 20.0}};
    const auto result = stacking::stack_frames(frames, centroids, std::nullopt);
    REQUIRE(result.n_frames == 1);
    REQUIRE(result.kept == std::vector<bool>{true, false, false});
    REQUIRE(result.image.rows() == 8);
    REQUIRE(result.image(4, 4) == Catch::Approx(3.0));
}

TEST_CASE("stack_clipping_rejects_far_centroid") {
    std::vector<guider::FrameSource> frames;
    std::vector<Point2D> centroids;
    const double xs[] = {30.0, 30.2, 30.4, 30.2, 30.0, 45.0};
    for (double x : xs) {
        frames.push_back(memory_frame(Matrix2Df::Constant(8, 8, 1.0f), 1.0));
        centroids.push_back({x, 40.0});
    }
    const auto result = stacking::stack_frames(frames, centroids, 2.5);
    REQUIRE(result.n_frames == 5);
    REQUIRE_FALSE(result.kept.back());
    REQUIRE(result.image.cols() == 9);
}

TEST_CASE("stack_rejects_bad_input") {
    std::vector<guider::FrameSource> frames{memory_frame(Matrix2Df::Constant(4, 4, 1.0f), 1.0)};
    REQUIRE_THROWS_AS(stacking::stack_frames(frames, {}, 2.5), ValidationError);
    REQUIRE_THROWS_AS(stacking::stack_frames(frames, {Point2D{}}, 2.5), ValidationError);

    std::vector<guider::FrameSource> none;
    REQUIRE_THROWS_AS(stacking::stack_frames(none, {}, std::nullopt), ValidationError);
}
