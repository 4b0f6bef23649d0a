/**
 * @file TimeFormatTests.cpp
 * @brief Unit tests for ISO-8601 date columns
 */

#include "TimeFormat.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace va;
using namespace std::chrono;

TEST_CASE("time format: epoch formats as UTC with milliseconds", "[time]") {
    CHECK(to_iso8601(TimePoint{}) == "1970-01-01T00:00:00.000Z");
    CHECK(to_iso8601(TimePoint{milliseconds(1234)}) == "1970-01-01T00:00:01.234Z");
}

TEST_CASE("time format: formatted dates parse back", "[time]") {
    const TimePoint tp{milliseconds(1740824430123)};
    const std::string text = to_iso8601(tp);
    CHECK(text == "2025-03-01T10:20:30.123Z");

    auto parsed = from_iso8601(text);
    REQUIRE(parsed.has_value());
    CHECK(*parsed == tp);
}

TEST_CASE("time format: offsets and missing suffix", "[time]") {
    auto utc = from_iso8601("2025-03-01T10:20:30Z");
    REQUIRE(utc.has_value());

    SECTION("no suffix is UTC") {
        auto bare = from_iso8601("2025-03-01T10:20:30");
        REQUIRE(bare.has_value());
        CHECK(*bare == *utc);
    }

    SECTION("positive offset") {
        auto shifted = from_iso8601("2025-03-01T12:20:30+02:00");
        REQUIRE(shifted.has_value());
        CHECK(*shifted == *utc);
    }

    SECTION("negative offset") {
        auto shifted = from_iso8601("2025-03-01T05:20:30-05:00");
        REQUIRE(shifted.has_value());
        CHECK(*shifted == *utc);
    }
}

TEST_CASE("time format: lexicographic order matches chronological order", "[time]") {
    const TimePoint earlier{milliseconds(999)};
    const TimePoint later{milliseconds(1000)};
    CHECK(to_iso8601(earlier) < to_iso8601(later));
}

TEST_CASE("time format: garbage is rejected", "[time]") {
    CHECK_FALSE(from_iso8601("").has_value());
    CHECK_FALSE(from_iso8601("yesterday").has_value());
    CHECK_FALSE(from_iso8601("2025-13-01T00:00:00Z").has_value());
    CHECK_FALSE(from_iso8601("2025-03-01T10:20:30.Z").has_value());
    CHECK_FALSE(from_iso8601("2025-03-01T10:20:30Zjunk").has_value());
}
