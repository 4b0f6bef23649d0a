/**
 * @file TypesTests.cpp
 * @brief Unit tests for enum conversions and record helpers
 */

#include "Types.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace va;

TEST_CASE("types: send status integers", "[types]") {
    CHECK(send_status_to_int(SendStatus::pending) == 0);
    CHECK(send_status_to_int(SendStatus::sent) == 1);
    CHECK(send_status_to_int(SendStatus::error) == 2);

    CHECK(send_status_from_int(0) == SendStatus::pending);
    CHECK(send_status_from_int(1) == SendStatus::sent);
    CHECK(send_status_from_int(2) == SendStatus::error);
}

TEST_CASE("types: unknown send status reads as error", "[types]") {
    CHECK(send_status_from_int(7) == SendStatus::error);
    CHECK(send_status_from_int(-1) == SendStatus::error);
}

TEST_CASE("types: channel names are case-insensitive", "[types]") {
    CHECK(channel_from_string("age") == Channel::age);
    CHECK(channel_from_string("Gender") == Channel::gender);
    CHECK(channel_from_string("NATIONALITY") == Channel::nationality);
    CHECK(channel_from_string("emotion") == Channel::emotion);
    CHECK_FALSE(channel_from_string("accent").has_value());
}

TEST_CASE("types: record channel accessors", "[types]") {
    AnalysisRecord record;
    CHECK_FALSE(record.has_predictions());

    record.channel(Channel::emotion).prediction = ProbabilityMap{{"calm", 1.0}};
    CHECK(record.has_predictions());
    CHECK(record.channels[3].prediction.has_value());
    CHECK_FALSE(record.channel(Channel::age).prediction.has_value());
}

TEST_CASE("types: tags compare by name", "[types]") {
    CHECK(Tag{1, "work"} == Tag{2, "work"});
    CHECK(Tag{1, "work"} != Tag{1, "home"});
}
