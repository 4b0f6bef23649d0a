/**
 * @file ProbabilityMapCodecTests.cpp
 * @brief Unit tests for the "[label:value,...]" column encoding
 */

#include "ProbabilityMapCodec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using namespace va;

// ============================================================================
// encode
// ============================================================================

TEST_CASE("codec: null map encodes as null", "[codec]") {
    CHECK_FALSE(ProbabilityMapCodec::encode(std::optional<ProbabilityMap>{}).has_value());
}

TEST_CASE("codec: empty map encodes as brackets", "[codec]") {
    CHECK(ProbabilityMapCodec::encode(ProbabilityMap{}) == "[]");
}

TEST_CASE("codec: labels are written in sorted order", "[codec]") {
    ProbabilityMap map{{"male", 0.25}, {"female", 0.75}};
    CHECK(ProbabilityMapCodec::encode(map) == "[female:0.75,male:0.25]");
}

TEST_CASE("codec: values survive encode and decode exactly", "[codec]") {
    ProbabilityMap map{{"20-29", 0.1}, {"30-39", 1.0 / 3.0}, {"40-49", 5e-324}};

    auto decoded = ProbabilityMapCodec::decode(ProbabilityMapCodec::encode(map));
    REQUIRE(decoded.has_value());
    CHECK(*decoded == map);
}

// ============================================================================
// decode
// ============================================================================

TEST_CASE("codec: decode of null or malformed text", "[codec]") {
    CHECK_FALSE(ProbabilityMapCodec::decode(std::nullopt).has_value());
    CHECK_FALSE(ProbabilityMapCodec::decode(std::string("abc")).has_value());
    CHECK_FALSE(ProbabilityMapCodec::decode(std::string("[")).has_value());
    CHECK_FALSE(ProbabilityMapCodec::decode(std::string("")).has_value());
    CHECK_FALSE(ProbabilityMapCodec::decode(std::string("a:1")).has_value());
}

TEST_CASE("codec: empty brackets decode to an empty map", "[codec]") {
    auto decoded = ProbabilityMapCodec::decode(std::string("[]"));
    REQUIRE(decoded.has_value());
    CHECK(decoded->empty());
}

TEST_CASE("codec: whitespace around keys and values is ignored", "[codec]") {
    auto decoded = ProbabilityMapCodec::decode(std::string(" [ US : 0.5 , GB:0.5 ] "));
    REQUIRE(decoded.has_value());
    CHECK(decoded->size() == 2);
    CHECK(decoded->at("US") == 0.5);
    CHECK(decoded->at("GB") == 0.5);
}

TEST_CASE("codec: malformed pairs are dropped", "[codec]") {
    SECTION("missing colon") {
        auto r = ProbabilityMapCodec::decode_detailed("[happy:0.9,sad]");
        CHECK(r.status == ProbabilityMapCodec::DecodeStatus::partial);
        CHECK(r.dropped == 1);
        REQUIRE(r.map.has_value());
        CHECK(r.map->size() == 1);
        CHECK(r.map->at("happy") == 0.9);
    }

    SECTION("non-numeric value") {
        auto r = ProbabilityMapCodec::decode_detailed("[happy:high,sad:0.1]");
        CHECK(r.status == ProbabilityMapCodec::DecodeStatus::partial);
        CHECK(r.dropped == 1);
        REQUIRE(r.map.has_value());
        CHECK(r.map->count("happy") == 0);
        CHECK(r.map->at("sad") == 0.1);
    }

    SECTION("extra colon") {
        auto r = ProbabilityMapCodec::decode_detailed("[a:b:0.5]");
        CHECK(r.dropped == 1);
        REQUIRE(r.map.has_value());
        CHECK(r.map->empty());
    }

    SECTION("well-formed text reports full") {
        auto r = ProbabilityMapCodec::decode_detailed("[a:0.5]");
        CHECK(r.status == ProbabilityMapCodec::DecodeStatus::full);
        CHECK(r.dropped == 0);
    }

    SECTION("unbracketed text reports unparseable") {
        auto r = ProbabilityMapCodec::decode_detailed("a:0.5");
        CHECK(r.status == ProbabilityMapCodec::DecodeStatus::unparseable);
        CHECK_FALSE(r.map.has_value());
    }
}

TEST_CASE("codec: non-finite values are dropped on decode", "[codec]") {
    auto r = ProbabilityMapCodec::decode_detailed("[a:nan,b:inf,c:0.2]");
    REQUIRE(r.map.has_value());
    CHECK(r.dropped == 2);
    CHECK(r.map->size() == 1);
}

// ============================================================================
// is_encodable
// ============================================================================

TEST_CASE("codec: is_encodable rejects reserved characters and non-finite values",
          "[codec]") {
    CHECK(ProbabilityMapCodec::is_encodable({{"en", 0.9}, {"de", 0.1}}));
    CHECK(ProbabilityMapCodec::is_encodable({}));

    CHECK_FALSE(ProbabilityMapCodec::is_encodable({{"a:b", 0.1}}));
    CHECK_FALSE(ProbabilityMapCodec::is_encodable({{"a,b", 0.1}}));
    CHECK_FALSE(ProbabilityMapCodec::is_encodable({{"[x]", 0.1}}));
    CHECK_FALSE(ProbabilityMapCodec::is_encodable({{" padded", 0.1}}));
    CHECK_FALSE(ProbabilityMapCodec::is_encodable(
        {{"a", std::numeric_limits<double>::quiet_NaN()}}));
    CHECK_FALSE(ProbabilityMapCodec::is_encodable(
        {{"a", std::numeric_limits<double>::infinity()}}));
}
