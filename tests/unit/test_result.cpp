#include <catch2/catch_test_macros.hpp>
#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"
#include <memory>
#include <string>
using namespace nostrkeys;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, KeyFailure>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, KeyFailure>::Err(KeyFailure::InvalidChecksum("bad checksum"));
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr().type == KeyFailureType::InvalidChecksum);
        REQUIRE(result.UnwrapErr().message == "bad checksum");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, KeyFailure>::Ok(unit);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == unit);
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, KeyFailure>::Err(KeyFailure::InvalidFormat("x"));
        REQUIRE_THROWS_AS(result.Unwrap(), std::runtime_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, KeyFailure>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::runtime_error);
    }
    SECTION("Move-only values") {
        auto result = Result<std::unique_ptr<int>, KeyFailure>::Ok(std::make_unique<int>(7));
        REQUIRE(result.IsOk());
        auto owned = std::move(result).Unwrap();
        REQUIRE(*owned == 7);
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
    SECTION("MapErr converts failure type") {
        auto result = Result<int, SodiumFailure>::Err(SodiumFailure::AllocationFailed("oom"));
        auto mapped = std::move(result).MapErr([](SodiumFailure failure) {
            return KeyFailure::FromSodiumFailure(failure);
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().type == KeyFailureType::SecureMemory);
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
        auto result = Result<int, std::string>::Err("first");
        auto bound = std::move(result).Bind([&called](int x) {
            called = true;
            return Result<int, std::string>::Ok(x);
        });
        REQUIRE_FALSE(called);
        REQUIRE(bound.UnwrapErr() == "first");
    }
}
TEST_CASE("Result<T, E> - Accessors", "[result][core]") {
    SECTION("UnwrapOr returns value on Ok") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(std::move(result).UnwrapOr(0) == 42);
    }
    SECTION("UnwrapOr returns default on Err") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(std::move(result).UnwrapOr(0) == 0);
    }
    SECTION("IsErrAnd checks the failure") {
        auto result = Result<int, KeyFailure>::Err(KeyFailure::PublicKeyOnly("npub"));
        REQUIRE(result.IsErrAnd([](const KeyFailure& f) {
            return f.type == KeyFailureType::PublicKeyOnly;
        }));
        REQUIRE_FALSE(result.IsErrAnd([](const KeyFailure& f) {
            return f.type == KeyFailureType::InvalidFormat;
        }));
    }
    SECTION("Ok converts to optional") {
        auto ok = Result<int, std::string>::Ok(5);
        auto err = Result<int, std::string>::Err("no");
        REQUIRE(std::move(ok).Ok() == 5);
        REQUIRE_FALSE(std::move(err).Ok().has_value());
    }
}
TEST_CASE("KeyFailure - Classification", "[result][core]") {
    SECTION("Sodium initialization maps to Backend") {
        auto failure = KeyFailure::FromSodiumFailure(SodiumFailure::InitializationFailed("init"));
        REQUIRE(failure.type == KeyFailureType::Backend);
    }
    SECTION("Other sodium failures map to SecureMemory") {
        auto failure = KeyFailure::FromSodiumFailure(SodiumFailure::InvalidOperation("disposed"));
        REQUIRE(failure.type == KeyFailureType::SecureMemory);
    }
    SECTION("Every kind has a name") {
        REQUIRE(KeyFailureTypeName(KeyFailureType::InvalidFormat) == "InvalidFormat");
        REQUIRE(KeyFailureTypeName(KeyFailureType::InvalidChecksum) == "InvalidChecksum");
        REQUIRE(KeyFailureTypeName(KeyFailureType::InvalidScalar) == "InvalidScalar");
        REQUIRE(KeyFailureTypeName(KeyFailureType::InvalidPublicKey) == "InvalidPublicKey");
        REQUIRE(KeyFailureTypeName(KeyFailureType::PublicKeyOnly) == "PublicKeyOnly");
        REQUIRE(KeyFailureTypeName(KeyFailureType::EntropyUnavailable) == "EntropyUnavailable");
        REQUIRE(KeyFailureTypeName(KeyFailureType::SecureMemory) == "SecureMemory");
        REQUIRE(KeyFailureTypeName(KeyFailureType::Backend) == "Backend");
    }
}
