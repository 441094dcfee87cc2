#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace quid;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries message and code", "[result]") {
    auto result = Result<int>::err(Error{"bad length", ErrorCode::InvalidLength});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "bad length");
    REQUIRE(result.unwrap_err().code == ErrorCode::InvalidLength);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::unwrap_err throws on success", "[result]") {
    auto result = Result<int>::ok(1);

    REQUIRE_THROWS_AS(result.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns fallback on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success and propagates error", "[result]") {
    auto doubled = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(doubled.unwrap() == 42);

    auto failed = Result<int>::err(Error{"error", ErrorCode::InvalidHex}).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().code == ErrorCode::InvalidHex);
}

TEST_CASE("Result::and_then chains and short-circuits", "[result]") {
    auto halve = [](int x) -> Result<int> {
        if (x % 2 != 0) return Result<int>::err(Error{"odd"});
        return Result<int>::ok(x / 2);
    };

    REQUIRE(Result<int>::ok(8).and_then(halve).unwrap() == 4);
    REQUIRE(Result<int>::ok(3).and_then(halve).unwrap_err().message == "odd");
    REQUIRE(Result<int>::err(Error{"initial"}).and_then(halve).unwrap_err().message == "initial");
}

TEST_CASE("Result::map_err rewrites the error", "[result]") {
    auto mapped = Result<int>::err(Error{"error", ErrorCode::InvalidSeparator})
        .map_err([](const Error& e) { return Error{e.message + " (context)", e.code}; });

    REQUIRE(mapped.unwrap_err().message == "error (context)");
    REQUIRE(mapped.unwrap_err().code == ErrorCode::InvalidSeparator);
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error", ErrorCode::EntropySource});

    REQUIRE(ok_result.is_ok());
    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE(err_result.is_err());
    REQUIRE_THROWS_AS(err_result.unwrap(), std::runtime_error);
    REQUIRE(err_result.unwrap_err().code == ErrorCode::EntropySource);
}

TEST_CASE("Error::is_format_error covers the decoder codes", "[result]") {
    REQUIRE(Error{"", ErrorCode::InvalidLength}.is_format_error());
    REQUIRE(Error{"", ErrorCode::InvalidSeparator}.is_format_error());
    REQUIRE(Error{"", ErrorCode::InvalidHex}.is_format_error());
    REQUIRE_FALSE(Error{"", ErrorCode::EntropySource}.is_format_error());
    REQUIRE_FALSE(Error{"", ErrorCode::None}.is_format_error());
}
