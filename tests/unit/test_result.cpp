#include <catch2/catch_test_macros.hpp>
#include "umbra/core/result.hpp"
#include "umbra/core/failures.hpp"
#include <memory>
#include <string>

using namespace umbra::protocol;

namespace {
    Result<int, ProtocolFailure> ParseBand(const std::string& text) {
        if (text.empty()) {
            return Result<int, ProtocolFailure>::Err(ProtocolFailure::Decode("empty"));
        }
        return Result<int, ProtocolFailure>::Ok(std::stoi(text));
    }
}

TEST_CASE("Result - Ok and Err", "[result][core]") {
    auto ok = ParseBand("7");
    REQUIRE(ok.IsOk());
    REQUIRE_FALSE(ok.IsErr());
    REQUIRE(ok.Unwrap() == 7);

    auto err = ParseBand("");
    REQUIRE(err.IsErr());
    REQUIRE(err.UnwrapErr().type == ProtocolFailureType::Decode);

    SECTION("Unwrapping the wrong side throws") {
        REQUIRE_THROWS_AS(err.Unwrap(), std::logic_error);
        REQUIRE_THROWS_AS(ok.UnwrapErr(), std::logic_error);
    }

    SECTION("Unit results") {
        auto done = Result<Unit, ProtocolFailure>::Ok(unit);
        REQUIRE(done.IsOk());
    }
}

TEST_CASE("Result - Move-only payloads", "[result][core]") {
    auto result = Result<std::unique_ptr<int>, ProtocolFailure>::Ok(std::make_unique<int>(42));
    std::unique_ptr<int> owned = std::move(result).Unwrap();
    REQUIRE(*owned == 42);
}

TEST_CASE("Result - Chaining", "[result][core]") {
    SECTION("Map over Ok") {
        auto doubled = ParseBand("21").Map([](const int v) { return v * 2; });
        REQUIRE(doubled.Unwrap() == 42);
    }

    SECTION("Map keeps Err") {
        auto doubled = ParseBand("").Map([](const int v) { return v * 2; });
        REQUIRE(doubled.IsErr());
        REQUIRE(doubled.UnwrapErr().type == ProtocolFailureType::Decode);
    }

    SECTION("MapErr rewrites the failure") {
        auto rewritten = ParseBand("").MapErr([](const ProtocolFailure& f) {
            return ProtocolFailure::ProtocolViolation("band: " + f.message);
        });
        REQUIRE(rewritten.UnwrapErr().type == ProtocolFailureType::ProtocolViolation);
        REQUIRE(rewritten.UnwrapErr().message == "band: empty");
    }

    SECTION("Bind stops at the first Err") {
        int calls = 0;
        auto next = [&calls](const int v) {
            ++calls;
            if (v < 0) {
                return Result<int, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("negative"));
            }
            return Result<int, ProtocolFailure>::Ok(v + 1);
        };
        REQUIRE(ParseBand("1").Bind(next).Unwrap() == 2);
        REQUIRE(ParseBand("-1").Bind(next).UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(ParseBand("").Bind(next).IsErr());
        REQUIRE(calls == 2);
    }
}
