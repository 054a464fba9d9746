#include <catch2/catch_test_macros.hpp>
#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"
#include <stdexcept>
#include <string>
using namespace hookseal::protocol;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::runtime_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::runtime_error);
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr transforms Err value") {
        auto result = Result<int, SodiumFailure>::Err(SodiumFailure::AllocationFailed("oom"));
        auto mapped = std::move(result).MapErr([](const SodiumFailure& failure) {
            return CallbackFailure::FromSodiumFailure(failure);
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().type == CallbackFailureType::CryptoBackend);
        REQUIRE(mapped.UnwrapErr().message == "oom");
    }
    SECTION("Bind chains operations") {
        auto result = Result<int, std::string>::Ok(10);
        auto bound = std::move(result).Bind([](int x) {
            if (x > 5) {
                return Result<int, std::string>::Ok(x * 2);
            }
            return Result<int, std::string>::Err("too small");
        });
        REQUIRE(bound.IsOk());
        REQUIRE(bound.Unwrap() == 20);
    }
    SECTION("Bind short-circuits on Err") {
        bool called = false;
        auto bound = Result<int, std::string>::Err("first").Bind([&called](int x) {
            called = true;
            return Result<int, std::string>::Ok(x);
        });
        REQUIRE_FALSE(called);
        REQUIRE(bound.UnwrapErr() == "first");
    }
    SECTION("InspectErr sees the error without consuming it") {
        auto result = Result<int, std::string>::Err("error");
        std::string seen;
        result.InspectErr([&seen](const std::string& e) { seen = e; });
        REQUIRE(seen == "error");
        REQUIRE(result.UnwrapErr() == "error");
    }
}
TEST_CASE("Result<T, E> - UnwrapOr and FromOptional", "[result][core]") {
    SECTION("UnwrapOr returns value on Ok") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(std::move(result).UnwrapOr(0) == 42);
    }
    SECTION("UnwrapOr returns default on Err") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(std::move(result).UnwrapOr(0) == 0);
    }
    SECTION("FromOptional") {
        auto some = Result<int, std::string>::FromOptional(7, "none");
        auto none = Result<int, std::string>::FromOptional(std::nullopt, "none");
        REQUIRE(some.Unwrap() == 7);
        REQUIRE(none.UnwrapErr() == "none");
        REQUIRE(none.IsErrAnd([](const std::string& e) { return e == "none"; }));
    }
}
TEST_CASE("CallbackFailure - Classification", "[result][core][failures]") {
    SECTION("Request rejections map to 400") {
        for (const auto failure : {
                 CallbackFailure::SignatureMismatch("x"),
                 CallbackFailure::PaddingError("x"),
                 CallbackFailure::FrameError("x"),
                 CallbackFailure::ReceiverMismatch("x"),
                 CallbackFailure::InvalidRequest("x")}) {
            REQUIRE(failure.IsRequestRejection());
            REQUIRE(failure.HttpStatus() == 400);
        }
    }
    SECTION("Configuration and backend failures map to 500") {
        REQUIRE(CallbackFailure::ConfigError("x").HttpStatus() == 500);
        REQUIRE(CallbackFailure::CryptoBackend("x").HttpStatus() == 500);
    }
    SECTION("Public message never echoes the diagnostic") {
        const auto failure = CallbackFailure::PaddingError("pad byte 0x42 at offset 31");
        REQUIRE(failure.PublicMessage() == "malformed message");
        REQUIRE(failure.PublicMessage().find("0x42") == std::string_view::npos);
    }
    SECTION("Type names") {
        REQUIRE(CallbackFailure::TypeName(CallbackFailureType::ReceiverMismatch) == "ReceiverMismatch");
    }
}
