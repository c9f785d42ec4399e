#include <catch2/catch_test_macros.hpp>
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include <optional>
#include <stdexcept>
#include <string>
using namespace lucid;
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
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).MapErr([](std::string s) {
            return s + "!";
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error!");
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
}
TEST_CASE("Result<T, E> - UnwrapOr and UnwrapOrElse", "[result][core]") {
    SECTION("UnwrapOr returns value on Ok") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(std::move(result).UnwrapOr(0) == 42);
    }
    SECTION("UnwrapOr returns default on Err") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(std::move(result).UnwrapOr(0) == 0);
    }
    SECTION("UnwrapOrElse computes default on Err") {
        auto result = Result<int, std::string>::Err("error");
        auto value = std::move(result).UnwrapOrElse([](const std::string& err) {
            return static_cast<int>(err.length());
        });
        REQUIRE(value == 5);  
    }
}
TEST_CASE("Result<T, E> - Optional and inspection helpers", "[result][core]") {
    SECTION("FromOptional keeps a present value") {
        auto result = Result<int, std::string>::FromOptional(std::optional<int>(7), "missing");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 7);
    }
    SECTION("FromOptional reports the supplied error when empty") {
        auto result = Result<int, std::string>::FromOptional(std::nullopt, "missing");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "missing");
    }
    SECTION("Inspect sees Ok values only") {
        int seen = 0;
        auto ok = Result<int, std::string>::Ok(3);
        ok.Inspect([&seen](int v) { seen += v; });
        auto err = Result<int, std::string>::Err("e");
        err.Inspect([&seen](int v) { seen += v; });
        REQUIRE(seen == 3);
    }
    SECTION("IsOkAnd and IsErrAnd test the payload") {
        auto ok = Result<int, PipelineFailure>::Ok(4);
        REQUIRE(ok.IsOkAnd([](int v) { return v % 2 == 0; }));
        auto err = Result<int, PipelineFailure>::Err(PipelineFailure::InputError("bad"));
        REQUIRE(err.IsErrAnd([](const PipelineFailure& f) { return f.type == PipelineFailureType::InputError; }));
    }
}
TEST_CASE("Result<T, E> - Misuse", "[result][core]") {
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::logic_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::logic_error);
    }
}
TEST_CASE("Failures - Conversions and classification", "[result][failures]") {
    SECTION("Anchor failures keep their category in the pipeline message") {
        const auto failure = PipelineFailure::FromAnchorFailure(AnchorFailure::RetriesExhausted("no luck"));
        REQUIRE(failure.type == PipelineFailureType::AnchorError);
        REQUIRE(failure.message == "RetriesExhausted: no luck");
    }
    SECTION("Sodium failures become encryption errors") {
        const auto failure = PipelineFailure::FromSodiumFailure(SodiumFailure::AllocationFailed("oom"));
        REQUIRE(failure.type == PipelineFailureType::EncryptionError);
    }
    SECTION("Only Unavailable and IoError are retryable store failures") {
        REQUIRE(StoreFailure::Unavailable("x").IsRetryable());
        REQUIRE(StoreFailure::IoError("x").IsRetryable());
        REQUIRE_FALSE(StoreFailure::Conflict("x").IsRetryable());
        REQUIRE_FALSE(StoreFailure::Corrupt("x").IsRetryable());
        REQUIRE_FALSE(StoreFailure::NotFound("x").IsRetryable());
    }
}
