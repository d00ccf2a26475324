#include "vw_guider/core/utils.hpp"
#include "vw_guider/guider/frame_source.hpp"
#include "vw_guider/io/frame_index.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace vw_guider;

TEST_CASE("frame_index_build_reads_headers_and_sorts") {
    test::TempDir dir("vw_guider_index");
    const Matrix2Df img = Matrix2Df::Constant(4, 4, 1.0f);
    test::write_guide_frame(dir.path() / "g2.fits", img, "2024-10-03", "04:00:10.5", 2.0, 1.3);
    test::write_guide_frame(dir.path() / "g1.fits", img, "2024-10-03", "04:00:00", 2.0, 1.3);
    fs::create_directories(dir.path() / "night2");
    test::write_guide_frame(dir.path() / "night2" / "g3.fits", img, "2024-10-04", "01:00:00", 3.0, 1.1);

    auto index = io::FrameIndex::build(dir.path());
    REQUIRE(index.size() == 3);
    REQUIRE(index.entries()[0].path.filename() == "g1.fits");
    REQUIRE(index.entries()[1].timestamp == core::parse_iso_timestamp("2024-10-03T04:00:10.5"));
    REQUIRE(index.entries()[2].exptime == Catch::Approx(3.0));
    REQUIRE(index.entries()[2].airmass == Catch::Approx(1.1));
    REQUIRE(fs::exists(dir.path() / "guider_index.json"));
}

TEST_CASE("frame_index_cache_is_reused_and_updated") {
    test::TempDir dir("vw_guider_index_cache");
    const Matrix2Df img = Matrix2Df::Constant(4, 4, 1.0f);
    test::write_guide_frame(dir.path() / "g1.fits", img, "2024-10-03", "04:00:00", 2.0, 1.3);
    REQUIRE(io::FrameIndex::build(dir.path()).size() == 1);

    test::write_guide_frame(dir.path() / "g2.fits", img, "2024-10-03", "04:00:02", 2.0, 1.3);
    auto index = io::FrameIndex::build(dir.path());
    REQUIRE(index.size() == 2);

    fs::remove(dir.path() / "g1.fits");
    REQUIRE(io::FrameIndex::build(dir.path()).size() == 2);

    io::FrameIndexOptions prune;
    prune.prune_missing = true;
    auto pruned = io::FrameIndex::build(dir.path(), prune);
    REQUIRE(pruned.size() == 1);
    REQUIRE(pruned.entries()[0].path.filename() == "g2.fits");
}

TEST_CASE("frame_index_cache_roundtrip_keeps_missing_values_as_nan") {
    test::TempDir dir("vw_guider_index_json");
    io::FrameIndexEntry e;
    e.path = dir.path() / "x.fits";
    e.timestamp = core::parse_iso_timestamp("2024-10-03T04:00:00.125");
    e.exptime = 2.0;
    auto index = io::FrameIndex::from_entries({e});
    index.save_cache(dir.path() / "cache.json");

    auto back = io::FrameIndex::load_cache(dir.path() / "cache.json");
    REQUIRE(back.size() == 1);
    REQUIRE(back.entries()[0].timestamp == e.timestamp);
    REQUIRE(back.entries()[0].exptime == Catch::Approx(2.0));
    REQUIRE(std::isnan(back.entries()[0].airmass));
}

TEST_CASE("frame_index_missing_ut_falls_back_to_mtime") {
    test::TempDir dir("vw_guider_index_mtime");
    io::FitsHeader h;
    h.set("EXPTIME", 2.0);
    const auto path = dir.path() / "nodate.fits";
    io::write_fits_float(path, Matrix2Df::Constant(2, 2, 0.0f), h);

    const auto entry = io::FrameIndex::read_entry(path);
    REQUIRE(entry.timestamp == core::file_mtime_as_timepoint(path));
}

TEST_CASE("frame_index_empty_date_obs_falls_back_to_mtime") {
    test::TempDir dir("vw_guider_index_empty_date");
    io::FitsHeader h;
    h.set("DATE-OBS", std::string());
    h.set("UT", std::string("04:00:00"));
    h.set("EXPTIME", 2.0);
    const auto path = dir.path() / "blankdate.fits";
    io::write_fits_float(path, Matrix2Df::Constant(2, 2, 0.0f), h);

    const auto entry = io::FrameIndex::read_entry(path);
    REQUIRE(entry.timestamp == core::file_mtime_as_timepoint(path));
    REQUIRE(entry.exptime == Catch::Approx(2.0));
    REQUIRE(io::FrameIndex::build(dir.path()).size() == 1);
}

TEST_CASE("frame_source_loads_lazily_and_releases") {
    test::TempDir dir("vw_guider_frame_source");
    Matrix2Df img(3, 3);
    img << 1, 2, 3, 4, 5, 6, 7, 8, 9;
    test::write_guide_frame(dir.path() / "g.fits", img, "2024-10-03", "04:00:00", 2.0, 1.3);

    auto index = io::FrameIndex::build(dir.path());
    auto frame = guider::FrameSource::from_index_entry(index.entries().front());
    REQUIRE(frame.is_file_backed());
    REQUIRE_FALSE(frame.is_loaded());
    REQUIRE(frame.data()(1, 1) == Catch::Approx(5.0f));
    REQUIRE(frame.is_loaded());
    frame.release();
    REQUIRE_FALSE(frame.is_loaded());
    REQUIRE(frame.data()(2, 2) == Catch::Approx(9.0f));
}

TEST_CASE("frame_source_cutout_uses_pixel_origin_and_clamps") {
    Matrix2Df img(10, 10);
    for (int y = 0; y < 10; ++y)
        for (int x = 0; x < 10; ++x) img(y, x) = static_cast<float>(10 * y + x);

    guider::FrameSource frame(img, guider::FrameMetadata{});
    REQUIRE_FALSE(frame.is_file_backed());

    // FITS (5, 5) is array (4, 4); a 4 px cutout spans array 2..5
    auto c = frame.cutout(5.0, 5.0, 4, 1);
    REQUIRE(c.width() == 4);
    REQUIRE(c.height() == 4);
    REQUIRE(c.origin_x == 3);
    REQUIRE(c.origin_y == 3);
    REQUIRE(c.data(0, 0) == Catch::Approx(22.0f));

    REQUIRE(frame.cutout(1e12, 5.0, 4, 1).empty());
    REQUIRE(frame.cutout(5.0, -1e12, 4, 1).empty());
    REQUIRE(frame.cutout(-9.0, 5.0, 4, 1).empty());

    auto edge = frame.cutout(0.0, 0.0, 6, 0);
    REQUIRE(edge.width() == 3);
    REQUIRE(edge.origin_x == 0);
    REQUIRE(edge.data(0, 0) == Catch::Approx(0.0f));

    REQUIRE(frame.cutout(100.0, 100.0, 6, 0).empty());
    REQUIRE(frame.cutout(kNaN, 5.0, 6, 0).empty());

    frame.release();
    REQUIRE(frame.is_loaded());
}
