#include "vw_guider/core/errors.hpp"
#include "vw_guider/core/utils.hpp"

#include <chrono>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace vw_guider;

TEST_CASE("parse_iso_timestamp_roundtrips_milliseconds") {
    const TimePoint tp = core::parse_iso_timestamp("2024-10-03T04:05:06.250");
    REQUIRE(core::format_iso_timestamp(tp) == "2024-10-03T04:05:06.250Z");
}

TEST_CASE("parse_iso_timestamp_accepts_space_separator") {
    const TimePoint a = core::parse_iso_timestamp("2024-10-03 04:05:06");
    const TimePoint b = core::parse_iso_timestamp("2024-10-03T04:05:06Z");
    REQUIRE(a == b);
}

TEST_CASE("parse_iso_timestamp_is_utc") {
    const TimePoint tp = core::parse_iso_timestamp("1970-01-02T00:00:00");
    REQUIRE(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count() == 86400);
}

TEST_CASE("parse_iso_timestamp_rejects_malformed_input") {
    REQUIRE_THROWS_AS(core::parse_iso_timestamp("yesterday"), ValidationError);
    REQUIRE_THROWS_AS(core::parse_iso_timestamp("2024-13-01T00:00:00"), ValidationError);
}

TEST_CASE("median_of_even_and_odd_samples") {
    REQUIRE(core::median_of({3.0, 1.0, 2.0}) == Catch::Approx(2.0));
    REQUIRE(core::median_of({4.0, 1.0, 3.0, 2.0}) == Catch::Approx(2.5));
    REQUIRE(std::isnan(core::median_of({})));
}

TEST_CASE("stddev_of_is_population_std") {
    REQUIRE(core::stddev_of({1.0, 3.0}) == Catch::Approx(1.0));
    REQUIRE(core::mean_of({1.0, 2.0, 6.0}) == Catch::Approx(3.0));
}

TEST_CASE("glob_match_is_case_insensitive") {
    REQUIRE(core::glob_match("*.fits", "frame_001.FITS"));
    REQUIRE_FALSE(core::glob_match("*.fits", "frame_001.fit"));
}

TEST_CASE("trim_strips_whitespace_and_quotes") {
    REQUIRE(core::trim("  'M52 '  ") == "M52");
}
