#pragma once
#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace nostrkeys::encoding {
/// Lowercase, two digits per byte, no prefix.
[[nodiscard]] std::string ToHex(std::span<const uint8_t> data);
[[nodiscard]] bool IsHexDigits(std::string_view text) noexcept;
/// Decodes exactly output.size() bytes; either case is accepted. Nothing is
/// written to output unless the whole input is valid.
[[nodiscard]] Result<Unit, KeyFailure> DecodeHexInto(
    std::string_view hex,
    std::span<uint8_t> output);
[[nodiscard]] Result<std::vector<uint8_t>, KeyFailure> FromHex(
    std::string_view hex,
    size_t expected_bytes);
}
