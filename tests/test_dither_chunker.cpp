#include "vw_guider/chunking/dither_chunker.hpp"
#include "vw_guider/config/configuration.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/core/utils.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace vw_guider;

namespace {

const TimePoint kNight = core::parse_iso_timestamp("2024-03-01T02:00:00");

Exposure make_exposure(const std::string& id, const std::string& target, int dither,
                       int minute, double airmass = 1.1) {
    Exposure e;
    e.id = id;
    e.path = "/data/vw/" + id + ".fits";
    e.target = target;
    e.dither = dither;
    e.start = kNight + std::chrono::minutes(minute);
    e.exptime = 600.0;
    e.airmass = airmass;
    e.fiducial = Point2D{100.0 + dither, 200.0 - dither};
    return e;
}

std::vector<Exposure> m52_night() {
    return {make_exposure("e01", "M52", 1, 0), make_exposure("e02", "M52", 2, 12),
            make_exposure("e03", "M52", 3, 24), make_exposure("e04", "M52", 1, 36),
            make_exposure("e05", "M52", 2, 48)};
}

} // namespace

TEST_CASE("chunk_exposures_splits_on_dither_restart") {
    const auto exposures = m52_night();
    const auto chunks = chunking::chunk_exposures("M52", exposures);

    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[0].size() == 3);
    REQUIRE(chunks[1].size() == 2);
    REQUIRE(chunks[0].chunk_index() == 0);
    REQUIRE(chunks[1].chunk_index() == 1);
    REQUIRE(chunks[0].is_single_run());
    REQUIRE(chunks[1].is_single_run());

    // Partition of the input, order preserved
    std::vector<std::string> ids;
    for (const auto& c : chunks) {
        for (const auto& e : c.exposures()) ids.push_back(e.id);
    }
    REQUIRE(ids == std::vector<std::string>{"e01", "e02", "e03", "e04", "e05"});
}

TEST_CASE("chunk_exposures_repeat_or_skip_starts_new_chunk") {
    const std::vector<Exposure> repeated = {
        make_exposure("a", "NGC7331", 1, 0), make_exposure("b", "NGC7331", 1, 10),
        make_exposure("c", "NGC7331", 2, 20)};
    auto chunks = chunking::chunk_exposures("NGC7331", repeated);
    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[0].size() == 1);
    REQUIRE(chunks[1].size() == 2);

    const std::vector<Exposure> skipped = {
        make_exposure("a", "NGC7331", 1, 0), make_exposure("b", "NGC7331", 3, 10),
        make_exposure("c", "NGC7331", 4, 20), make_exposure("d", "NGC7331", 2, 30)};
    chunks = chunking::chunk_exposures("NGC7331", skipped);
    REQUIRE(chunks.size() == 3);
    REQUIRE(chunks[1].size() == 2);
    REQUIRE(chunks[2].exposures().front().id == "d");
}

TEST_CASE("chunk_exposures_single_exposure") {
    const auto chunks = chunking::chunk_exposures("M52", {make_exposure("x", "M52", 4, 0)});
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].size() == 1);
    REQUIRE(chunks[0].is_single_run());
}

TEST_CASE("chunk_exposures_rejects_bad_input") {
    REQUIRE_THROWS_AS(chunking::chunk_exposures("M52", {}), ValidationError);

    const std::vector<Exposure> mixed = {make_exposure("a", "M52", 1, 0),
                                         make_exposure("b", "M31", 2, 10)};
    REQUIRE_THROWS_AS(chunking::chunk_exposures("M52", mixed), ValidationError);
    REQUIRE_THROWS_AS(chunking::DitherChunk("M52", 0, {}), ValidationError);
}

TEST_CASE("dither_chunk_summary") {
    auto exposures = m52_night();
    exposures[1].fiducial = Point2D{};
    const auto chunks = chunking::chunk_exposures("M52", exposures);
    const auto& first = chunks[0];

    const auto [lo, hi] = first.time_range();
    REQUIRE(lo == kNight);
    REQUIRE(hi == kNight + std::chrono::minutes(24));

    // e01 (101, 199) and e03 (103, 197); e02 has no fiducial
    const auto mean = first.mean_fiducial();
    REQUIRE(mean);
    REQUIRE(mean->x == Catch::Approx(102.0));
    REQUIRE(mean->y == Catch::Approx(198.0));

    REQUIRE(first.is_sky());
    REQUIRE(first.contains("e02"));
    REQUIRE_FALSE(first.contains("e04"));

    const auto rec = first.to_record();
    REQUIRE(rec.target == "M52");
    REQUIRE(rec.chunk_index == 0);
    REQUIRE(rec.n_exposures == 3);
    REQUIRE(rec.start_time == lo);
    REQUIRE(rec.end_time == hi);
    REQUIRE(rec.exposure_ids == std::vector<std::string>{"e01", "e02", "e03"});
    REQUIRE(rec.exposure_paths.front() == "/data/vw/e01.fits");
    REQUIRE(rec.is_sky);
}

TEST_CASE("dither_chunk_without_fiducials_or_sky") {
    std::vector<Exposure> exposures = {make_exposure("a", "domeflats", 1, 0, kNaN),
                                       make_exposure("b", "domeflats", 2, 5, kNaN)};
    for (auto& e : exposures) e.fiducial = Point2D{};
    const auto chunks = chunking::chunk_exposures("domeflats", exposures);
    REQUIRE(chunks.size() == 1);
    REQUIRE_FALSE(chunks[0].mean_fiducial());
    REQUIRE_FALSE(chunks[0].is_sky());
    REQUIRE_FALSE(chunks[0].to_record().mean_fiducial);
}

TEST_CASE("chunk_all_targets_groups_and_orders") {
    // Interleaved targets, deliberately out of time order
    std::vector<Exposure> exposures = {
        make_exposure("m2", "M52", 2, 20),  make_exposure("n1", "NGC7331", 1, 10),
        make_exposure("m1", "M52", 1, 0),   make_exposure("n2", "NGC7331", 2, 30),
        make_exposure("m3", "M52", 3, 40),  make_exposure("m4", "M52", 1, 50)};

    const auto chunks = chunking::chunk_all_targets(exposures);
    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks.at("M52").size() == 2);
    REQUIRE(chunks.at("M52")[0].size() == 3);
    REQUIRE(chunks.at("NGC7331").size() == 1);
    REQUIRE(chunks.at("NGC7331")[0].size() == 2);

    const auto records = chunking::chunk_records(chunks);
    REQUIRE(records.size() == 3);
}

TEST_CASE("chunk_target_and_find_chunk") {
    std::vector<Exposure> exposures = m52_night();
    exposures.push_back(make_exposure("x1", "M31", 1, 60));

    const auto m52 = chunking::chunk_target(exposures, "M52");
    REQUIRE(m52.size() == 2);

    const auto second = chunking::find_chunk(exposures, "M52", 1);
    REQUIRE(second.chunk_index() == 1);
    REQUIRE(second.contains("e05"));

    REQUIRE_THROWS_AS(chunking::find_chunk(exposures, "M52", 2), ValidationError);
    REQUIRE_THROWS_AS(chunking::chunk_target(exposures, "M33"), ValidationError);
}

TEST_CASE("chunk_index_of_exposure") {
    config::Config cfg;
    std::vector<Exposure> exposures = m52_night();
    exposures.push_back(make_exposure("f1", "skyflats", 1, 70));
    const auto chunks = chunking::chunk_all_targets(exposures);
    const auto& cal = cfg.instrument.calibration_targets;

    REQUIRE(chunking::chunk_index_of(chunks, exposures[0], cal) == 0);
    REQUIRE(chunking::chunk_index_of(chunks, exposures[4], cal) == 1);
    REQUIRE(chunking::chunk_index_of(chunks, exposures[5], cal) == -1);
    REQUIRE(chunking::chunk_index_of(chunks, make_exposure("zz", "M31", 1, 0), cal) == -1);
}
