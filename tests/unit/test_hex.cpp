#include <catch2/catch_test_macros.hpp>
#include "core/hex.hpp"

#include <array>

using namespace quid;

TEST_CASE("hex::encode emits lowercase pairs", "[hex]") {
    const std::array<uint8_t, 4> bytes{0x00, 0x9f, 0xAB, 0xff};
    REQUIRE(hex::encode(bytes) == "009fabff");
    REQUIRE(hex::encode(std::span<const uint8_t>{}).empty());
}

TEST_CASE("hex::decode_into accepts both cases", "[hex]") {
    std::array<uint8_t, 2> lower{};
    std::array<uint8_t, 2> upper{};

    REQUIRE(hex::decode_into("e89b", lower).is_ok());
    REQUIRE(hex::decode_into("E89B", upper).is_ok());
    REQUIRE(lower == std::array<uint8_t, 2>{0xe8, 0x9b});
    REQUIRE(upper == lower);
}

TEST_CASE("hex::decode_into rejects malformed groups", "[hex]") {
    std::array<uint8_t, 2> out{0x11, 0x22};

    SECTION("non-hex character") {
        auto result = hex::decode_into("e8g9", out);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::InvalidHex);
    }

    SECTION("odd length") {
        auto result = hex::decode_into("e89", out);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::InvalidHex);
    }

    SECTION("too many digits for the output") {
        auto result = hex::decode_into("e89b00", out);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::InvalidHex);
    }

    SECTION("whitespace is not skipped") {
        auto result = hex::decode_into("e8 b", out);
        REQUIRE(result.is_err());
    }

    // Output untouched on failure.
    REQUIRE(out == std::array<uint8_t, 2>{0x11, 0x22});
}
