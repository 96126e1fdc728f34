#include <catch2/catch_test_macros.hpp>
#include "nostrkeys/crypto/sodium_interop.hpp"
#include "nostrkeys/crypto/sodium_entropy_source.hpp"
#include "nostrkeys/core/constants.hpp"
#include <algorithm>
#include <vector>
using namespace nostrkeys;
using namespace nostrkeys::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        auto result1 = SodiumInterop::Initialize();
        auto result2 = SodiumInterop::Initialize();
        REQUIRE(result1.IsOk());
        REQUIRE(result2.IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        auto result = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        REQUIRE(result.IsOk());
    }
    SECTION("Wipe small buffer zeroes it") {
        std::vector<uint8_t> buffer(32, 0xFF);
        auto result = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        REQUIRE(result.IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Wipe secp256k1 keypair struct size") {
        std::vector<uint8_t> buffer(96, 0xA5);
        auto result = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        REQUIRE(result.IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Wipe only touches the given range") {
        std::vector<uint8_t> buffer(64, 0xFF);
        auto result = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer).first(32));
        REQUIRE(result.IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.begin() + 32, [](uint8_t b) { return b == 0; }));
        REQUIRE(std::all_of(buffer.begin() + 32, buffer.end(), [](uint8_t b) { return b == 0xFF; }));
    }
    SECTION("Wipe large buffer zeroes it") {
        std::vector<uint8_t> buffer(Constants::SMALL_BUFFER_THRESHOLD * 4, 0xFF);
        auto result = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        REQUIRE(result.IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Empty buffers are equal") {
        std::vector<uint8_t> a;
        std::vector<uint8_t> b;
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
    }
}

TEST_CASE("SodiumInterop - Random Number Generation", "[sodium][crypto][random]") {
    SECTION("FillRandom produces different values") {
        std::vector<uint8_t> bytes1(32, 0);
        std::vector<uint8_t> bytes2(32, 0);
        REQUIRE(SodiumInterop::FillRandom(bytes1).IsOk());
        REQUIRE(SodiumInterop::FillRandom(bytes2).IsOk());
        REQUIRE(bytes1 != bytes2);
    }
    SECTION("FillRandom accepts an empty buffer") {
        std::vector<uint8_t> empty;
        REQUIRE(SodiumInterop::FillRandom(empty).IsOk());
    }
    SECTION("SodiumEntropySource fills the whole buffer") {
        std::vector<uint8_t> bytes(64, 0);
        auto result = SodiumEntropySource::Instance().Fill(bytes);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; }));
    }
}
