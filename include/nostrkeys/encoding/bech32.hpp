#pragma once
#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace nostrkeys::encoding {
struct Bech32Data {
    std::string hrp;
    std::vector<uint8_t> payload;
};
/**
 * @brief BIP-173 bech32 codec over whole bytes
 *
 * Payload bytes are regrouped into 5-bit characters on encode and back into
 * bytes on decode, the way NIP-19 uses it. Only the original bech32 checksum
 * constant is accepted (not bech32m).
 */
class Bech32 {
public:
    /**
     * @brief Encode payload under hrp
     *
     * @return Err(InvalidFormat) if hrp is not lowercase printable ASCII of
     *         1..83 characters or the result would exceed 90 characters
     */
    [[nodiscard]] static Result<std::string, KeyFailure> Encode(
        std::string_view hrp,
        std::span<const uint8_t> payload);

    /**
     * @brief Decode a bech32 string
     *
     * Structural problems (length, characters, mixed case, separator,
     * padding) are InvalidFormat; a polymod mismatch is InvalidChecksum.
     * The returned hrp is lowercase.
     */
    [[nodiscard]] static Result<Bech32Data, KeyFailure> Decode(std::string_view text);

    [[nodiscard]] static Result<Unit, KeyFailure> ValidateHrp(std::string_view hrp);

    /// True if text starts with hrp followed by the separator, ignoring case.
    [[nodiscard]] static bool HasPrefix(std::string_view text, std::string_view hrp) noexcept;

private:
    Bech32() = delete;
};
}
