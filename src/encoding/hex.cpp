#include "nostrkeys/encoding/hex.hpp"
#include <format>

namespace nostrkeys::encoding {

namespace {

constexpr char HEX_CHARS[] = "0123456789abcdef";

int HexValue(const char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}

std::string ToHex(std::span<const uint8_t> data) {
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(HEX_CHARS[(byte >> 4) & 0x0F]);
        result.push_back(HEX_CHARS[byte & 0x0F]);
    }
    return result;
}

bool IsHexDigits(std::string_view text) noexcept {
    for (const char c : text) {
        if (HexValue(c) < 0) {
            return false;
        }
    }
    return true;
}

Result<Unit, KeyFailure> DecodeHexInto(std::string_view hex, std::span<uint8_t> output) {
    if (hex.size() != output.size() * 2) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::InvalidFormat(
                std::format("Invalid hex length: expected {} characters, got {}",
                            output.size() * 2, hex.size())));
    }

    for (size_t i = 0; i < hex.size(); ++i) {
        if (HexValue(hex[i]) < 0) {
            return Result<Unit, KeyFailure>::Err(
                KeyFailure::InvalidFormat(
                    std::format("Invalid hex character at position {}", i)));
        }
    }

    for (size_t i = 0; i < output.size(); ++i) {
        output[i] = static_cast<uint8_t>(
            (HexValue(hex[2 * i]) << 4) | HexValue(hex[2 * i + 1]));
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, KeyFailure> FromHex(std::string_view hex, const size_t expected_bytes) {
    std::vector<uint8_t> bytes(expected_bytes);
    auto decoded = DecodeHexInto(hex, bytes);
    if (decoded.IsErr()) {
        return Result<std::vector<uint8_t>, KeyFailure>::Err(std::move(decoded).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, KeyFailure>::Ok(std::move(bytes));
}

}
