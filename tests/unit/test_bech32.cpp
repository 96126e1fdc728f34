#include <catch2/catch_test_macros.hpp>
#include "nostrkeys/encoding/bech32.hpp"
#include "nostrkeys/encoding/hex.hpp"
#include <string>
#include <vector>
using namespace nostrkeys;
using namespace nostrkeys::encoding;
namespace {
KeyFailureType DecodeFailure(std::string_view text) {
    auto result = Bech32::Decode(text);
    REQUIRE(result.IsErr());
    return result.UnwrapErr().type;
}
}
TEST_CASE("Bech32 - Reference Strings", "[encoding][bech32]") {
    SECTION("Empty payload") {
        auto result = Bech32::Decode("a12uel5l");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().hrp == "a");
        REQUIRE(result.Unwrap().payload.empty());
    }
    SECTION("Uppercase string decodes to lowercase prefix") {
        auto result = Bech32::Decode("A12UEL5L");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().hrp == "a");
    }
    SECTION("Every charset symbol") {
        auto result = Bech32::Decode("abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().hrp == "abcdef");
        REQUIRE(ToHex(result.Unwrap().payload) == "00443214c74254b635cf84653a56d7c675be77df");
    }
    SECTION("Printable non-alphanumeric prefix") {
        auto result = Bech32::Decode("?1ezyfcl");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().hrp == "?");
    }
}
TEST_CASE("Bech32 - Structural Failures", "[encoding][bech32]") {
    SECTION("No separator") {
        REQUIRE(DecodeFailure("pzry9x0s0muk") == KeyFailureType::InvalidFormat);
    }
    SECTION("Empty prefix") {
        REQUIRE(DecodeFailure("1pzry9x0s0muk") == KeyFailureType::InvalidFormat);
    }
    SECTION("Character outside the charset") {
        REQUIRE(DecodeFailure("x1b4n0q5v") == KeyFailureType::InvalidFormat);
    }
    SECTION("Data part shorter than checksum") {
        REQUIRE(DecodeFailure("li1dgmt3") == KeyFailureType::InvalidFormat);
    }
    SECTION("Mixed case") {
        REQUIRE(DecodeFailure("A12uEL5L") == KeyFailureType::InvalidFormat);
        REQUIRE(DecodeFailure("nsec1j4c6269y9w0q2er2xjw8sv2ehyrtfxq3jwgdlxj6qfn8z4gjsq5qfvfK99") ==
                KeyFailureType::InvalidFormat);
    }
    SECTION("Non-printable character") {
        REQUIRE(DecodeFailure(std::string("a1\x7f") + "2uel5l") == KeyFailureType::InvalidFormat);
        REQUIRE(DecodeFailure("a1 2uel5l") == KeyFailureType::InvalidFormat);
    }
    SECTION("Too long") {
        std::string text = "a1" + std::string(89, 'q');
        REQUIRE(DecodeFailure(text) == KeyFailureType::InvalidFormat);
    }
    SECTION("Too short") {
        REQUIRE(DecodeFailure("a1qqqq") == KeyFailureType::InvalidFormat);
        REQUIRE(DecodeFailure("") == KeyFailureType::InvalidFormat);
    }
}
TEST_CASE("Bech32 - Checksum Failures", "[encoding][bech32]") {
    SECTION("Last character changed") {
        REQUIRE(DecodeFailure("nsec1j4c6269y9w0q2er2xjw8sv2ehyrtfxq3jwgdlxj6qfn8z4gjsq5qfvfk98") ==
                KeyFailureType::InvalidChecksum);
    }
    SECTION("Prefix changed") {
        REQUIRE(DecodeFailure("npub1j4c6269y9w0q2er2xjw8sv2ehyrtfxq3jwgdlxj6qfn8z4gjsq5qfvfk99") ==
                KeyFailureType::InvalidChecksum);
    }
    SECTION("Checksum computed over an uppercase prefix") {
        REQUIRE(DecodeFailure("A1G7SGD8") == KeyFailureType::InvalidChecksum);
    }
}
TEST_CASE("Bech32 - Encoding", "[encoding][bech32]") {
    auto payload = FromHex("9571a568a42b9e05646a349c783159b906b498119390df9a5a02667155128028", 32).Unwrap();
    SECTION("Secret key payload") {
        auto result = Bech32::Encode("nsec", payload);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == "nsec1j4c6269y9w0q2er2xjw8sv2ehyrtfxq3jwgdlxj6qfn8z4gjsq5qfvfk99");
    }
    SECTION("Same payload under another prefix") {
        auto result = Bech32::Encode("note", payload);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == "note1j4c6269y9w0q2er2xjw8sv2ehyrtfxq3jwgdlxj6qfn8z4gjsq5q5sp26c");
    }
    SECTION("Empty payload") {
        REQUIRE(Bech32::Encode("a", std::span<const uint8_t>()).Unwrap() == "a12uel5l");
    }
    SECTION("Result longer than 90 characters is rejected") {
        std::vector<uint8_t> at_limit(49, 0);
        std::vector<uint8_t> over_limit(50, 0);
        auto ok = Bech32::Encode("nsec", at_limit);
        REQUIRE(ok.IsOk());
        REQUIRE(ok.Unwrap().size() == 90);
        REQUIRE(Bech32::Encode("nsec", over_limit).UnwrapErr().type == KeyFailureType::InvalidFormat);
    }
    SECTION("Invalid prefixes are rejected") {
        REQUIRE(Bech32::Encode("", payload).IsErr());
        REQUIRE(Bech32::Encode("NSEC", payload).IsErr());
        REQUIRE(Bech32::Encode("ns c", payload).IsErr());
        REQUIRE(Bech32::Encode(std::string(84, 'a'), payload).IsErr());
    }
}
TEST_CASE("Bech32 - Decoding", "[encoding][bech32]") {
    SECTION("Secret key payload") {
        auto result = Bech32::Decode("nsec1j4c6269y9w0q2er2xjw8sv2ehyrtfxq3jwgdlxj6qfn8z4gjsq5qfvfk99");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().hrp == "nsec");
        REQUIRE(ToHex(result.Unwrap().payload) ==
                "9571a568a42b9e05646a349c783159b906b498119390df9a5a02667155128028");
    }
    SECTION("Encode then decode keeps every byte") {
        std::vector<uint8_t> payload(32);
        for (size_t i = 0; i < payload.size(); ++i) {
            payload[i] = static_cast<uint8_t>(0xFF - i);
        }
        auto encoded = Bech32::Encode("npub", payload);
        REQUIRE(encoded.IsOk());
        auto decoded = Bech32::Decode(encoded.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().payload == payload);
    }
}
TEST_CASE("Bech32 - Prefix Detection", "[encoding][bech32]") {
    REQUIRE(Bech32::HasPrefix("nsec1abc", "nsec"));
    REQUIRE(Bech32::HasPrefix("NSEC1ABC", "nsec"));
    REQUIRE_FALSE(Bech32::HasPrefix("nsecabc", "nsec"));
    REQUIRE_FALSE(Bech32::HasPrefix("npub1abc", "nsec"));
    REQUIRE_FALSE(Bech32::HasPrefix("nsec", "nsec"));
    REQUIRE_FALSE(Bech32::HasPrefix("", "nsec"));
}
