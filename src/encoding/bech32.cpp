#include "nostrkeys/encoding/bech32.hpp"
#include "nostrkeys/core/constants.hpp"
#include "nostrkeys/crypto/sodium_interop.hpp"

#include <array>
#include <format>

namespace nostrkeys::encoding {

namespace {

using Bech32Values = std::vector<uint8_t>;

constexpr std::array<int8_t, 128> BuildReverseCharset() {
    std::array<int8_t, 128> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (size_t i = 0; i < Bech32Constants::CHARSET.size(); ++i) {
        table[static_cast<size_t>(Bech32Constants::CHARSET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr std::array<int8_t, 128> REVERSE_CHARSET = BuildReverseCharset();

char ToLowerAscii(const char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

uint32_t Polymod(const Bech32Values& values) noexcept {
    uint32_t chk = 1;
    for (const uint8_t value : values) {
        const uint32_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ value;
        for (size_t i = 0; i < Bech32Constants::GENERATOR.size(); ++i) {
            if ((top >> i) & 1) {
                chk ^= Bech32Constants::GENERATOR[i];
            }
        }
    }
    return chk;
}

Bech32Values ExpandHrp(std::string_view hrp) {
    Bech32Values expanded;
    expanded.reserve(hrp.size() * 2 + 1);
    for (const char c : hrp) {
        expanded.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) >> 5));
    }
    expanded.push_back(0);
    for (const char c : hrp) {
        expanded.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) & 0x1f));
    }
    return expanded;
}

/// Regroups from_bits-wide values into to_bits-wide values. Without padding,
/// leftover bits must be fewer than from_bits and all zero.
bool ConvertBits(
    std::span<const uint8_t> input,
    const unsigned from_bits,
    const unsigned to_bits,
    const bool pad,
    std::vector<uint8_t>& output) {

    uint32_t accumulator = 0;
    unsigned bits = 0;
    const uint32_t max_value = (1u << to_bits) - 1;
    for (const uint8_t value : input) {
        if ((value >> from_bits) != 0) {
            return false;
        }
        accumulator = ((accumulator << from_bits) | value) & 0xffff;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            output.push_back(static_cast<uint8_t>((accumulator >> bits) & max_value));
        }
    }
    if (pad) {
        if (bits > 0) {
            output.push_back(static_cast<uint8_t>((accumulator << (to_bits - bits)) & max_value));
        }
    } else if (bits >= from_bits || ((accumulator << (to_bits - bits)) & max_value) != 0) {
        return false;
    }
    return true;
}

Result<Unit, KeyFailure> Wipe(std::vector<uint8_t>& values) {
    auto wiped = crypto::SodiumInterop::SecureWipe(values);
    if (wiped.IsErr()) {
        return Result<Unit, KeyFailure>::Err(KeyFailure::FromSodiumFailure(wiped.UnwrapErr()));
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

/// Wipes values, then yields result unless the wipe itself failed.
template<typename T>
Result<T, KeyFailure> WipeThen(std::vector<uint8_t>& values, Result<T, KeyFailure> result) {
    auto wiped = Wipe(values);
    if (wiped.IsErr()) {
        return Result<T, KeyFailure>::Err(std::move(wiped).UnwrapErr());
    }
    return result;
}

}

Result<Unit, KeyFailure> Bech32::ValidateHrp(std::string_view hrp) {
    if (hrp.size() < Bech32Constants::MIN_HRP_LENGTH || hrp.size() > Bech32Constants::MAX_HRP_LENGTH) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::InvalidFormat(
                std::format("Bech32 prefix length {} outside [{}, {}]",
                            hrp.size(), Bech32Constants::MIN_HRP_LENGTH,
                            Bech32Constants::MAX_HRP_LENGTH)));
    }
    for (const char c : hrp) {
        if (c < Bech32Constants::MIN_HRP_CHAR || c > Bech32Constants::MAX_HRP_CHAR ||
            (c >= 'A' && c <= 'Z')) {
            return Result<Unit, KeyFailure>::Err(
                KeyFailure::InvalidFormat(
                    std::format("Bech32 prefix '{}' must be lowercase printable ASCII", hrp)));
        }
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

bool Bech32::HasPrefix(std::string_view text, std::string_view hrp) noexcept {
    if (text.size() <= hrp.size() || text[hrp.size()] != Bech32Constants::SEPARATOR) {
        return false;
    }
    for (size_t i = 0; i < hrp.size(); ++i) {
        if (ToLowerAscii(text[i]) != ToLowerAscii(hrp[i])) {
            return false;
        }
    }
    return true;
}

Result<std::string, KeyFailure> Bech32::Encode(std::string_view hrp, std::span<const uint8_t> payload) {
    auto hrp_result = ValidateHrp(hrp);
    if (hrp_result.IsErr()) {
        return Result<std::string, KeyFailure>::Err(std::move(hrp_result).UnwrapErr());
    }

    Bech32Values values;
    values.reserve((payload.size() * Bech32Constants::BITS_PER_BYTE + 4) / Bech32Constants::BITS_PER_CHAR);
    if (!ConvertBits(payload, Bech32Constants::BITS_PER_BYTE, Bech32Constants::BITS_PER_CHAR, true, values)) {
        return WipeThen(values, Result<std::string, KeyFailure>::Err(
            KeyFailure::InvalidFormat("Bech32 payload could not be regrouped")));
    }

    const size_t total_length = hrp.size() + 1 + values.size() + Bech32Constants::CHECKSUM_LENGTH;
    if (total_length > Bech32Constants::MAX_LENGTH) {
        return WipeThen(values, Result<std::string, KeyFailure>::Err(
            KeyFailure::InvalidFormat(
                std::format("Bech32 string would be {} characters, limit is {}",
                            total_length, Bech32Constants::MAX_LENGTH))));
    }

    Bech32Values checksum_input = ExpandHrp(hrp);
    checksum_input.insert(checksum_input.end(), values.begin(), values.end());
    checksum_input.insert(checksum_input.end(), Bech32Constants::CHECKSUM_LENGTH, 0);
    const uint32_t mod = Polymod(checksum_input) ^ Bech32Constants::CHECKSUM_CONSTANT;
    auto checksum_wiped = Wipe(checksum_input);
    if (checksum_wiped.IsErr()) {
        return WipeThen(values, Result<std::string, KeyFailure>::Err(
            std::move(checksum_wiped).UnwrapErr()));
    }

    std::string encoded;
    encoded.reserve(total_length);
    encoded.append(hrp);
    encoded.push_back(Bech32Constants::SEPARATOR);
    for (const uint8_t value : values) {
        encoded.push_back(Bech32Constants::CHARSET[value]);
    }
    for (size_t i = 0; i < Bech32Constants::CHECKSUM_LENGTH; ++i) {
        encoded.push_back(Bech32Constants::CHARSET[(mod >> (5 * (5 - i))) & 31]);
    }
    return WipeThen(values, Result<std::string, KeyFailure>::Ok(std::move(encoded)));
}

Result<Bech32Data, KeyFailure> Bech32::Decode(std::string_view text) {
    if (text.size() < Bech32Constants::CHECKSUM_LENGTH + 2 || text.size() > Bech32Constants::MAX_LENGTH) {
        return Result<Bech32Data, KeyFailure>::Err(
            KeyFailure::InvalidFormat(
                std::format("Invalid bech32 length {}", text.size())));
    }

    bool has_lower = false;
    bool has_upper = false;
    for (const char c : text) {
        if (c < Bech32Constants::MIN_HRP_CHAR || c > Bech32Constants::MAX_HRP_CHAR) {
            return Result<Bech32Data, KeyFailure>::Err(
                KeyFailure::InvalidFormat("Bech32 string contains a non-printable character"));
        }
        has_lower = has_lower || (c >= 'a' && c <= 'z');
        has_upper = has_upper || (c >= 'A' && c <= 'Z');
    }
    if (has_lower && has_upper) {
        return Result<Bech32Data, KeyFailure>::Err(
            KeyFailure::InvalidFormat(std::string(ErrorMessages::BECH32_MIXED_CASE)));
    }

    const size_t separator = text.rfind(Bech32Constants::SEPARATOR);
    if (separator == std::string_view::npos || separator == 0) {
        return Result<Bech32Data, KeyFailure>::Err(
            KeyFailure::InvalidFormat(std::string(ErrorMessages::BECH32_NO_SEPARATOR)));
    }
    if (separator + 1 + Bech32Constants::CHECKSUM_LENGTH > text.size()) {
        return Result<Bech32Data, KeyFailure>::Err(
            KeyFailure::InvalidFormat("Bech32 data part is shorter than the checksum"));
    }

    std::string hrp;
    hrp.reserve(separator);
    for (size_t i = 0; i < separator; ++i) {
        hrp.push_back(ToLowerAscii(text[i]));
    }

    Bech32Values values;
    values.reserve(text.size() - separator - 1);
    for (size_t i = separator + 1; i < text.size(); ++i) {
        const int8_t value = REVERSE_CHARSET[static_cast<size_t>(ToLowerAscii(text[i]))];
        if (value < 0) {
            return WipeThen(values, Result<Bech32Data, KeyFailure>::Err(
                KeyFailure::InvalidFormat(
                    std::format("Invalid bech32 character at position {}", i))));
        }
        values.push_back(static_cast<uint8_t>(value));
    }

    Bech32Values checksum_input = ExpandHrp(hrp);
    checksum_input.insert(checksum_input.end(), values.begin(), values.end());
    const bool checksum_ok = Polymod(checksum_input) == Bech32Constants::CHECKSUM_CONSTANT;
    auto checksum_wiped = Wipe(checksum_input);
    if (checksum_wiped.IsErr()) {
        return WipeThen(values, Result<Bech32Data, KeyFailure>::Err(
            std::move(checksum_wiped).UnwrapErr()));
    }
    if (!checksum_ok) {
        return WipeThen(values, Result<Bech32Data, KeyFailure>::Err(
            KeyFailure::InvalidChecksum(std::string(ErrorMessages::BECH32_CHECKSUM_MISMATCH))));
    }

    Bech32Data decoded;
    decoded.hrp = std::move(hrp);
    const std::span<const uint8_t> data_part(values.data(), values.size() - Bech32Constants::CHECKSUM_LENGTH);
    const bool regrouped = ConvertBits(
        data_part, Bech32Constants::BITS_PER_CHAR, Bech32Constants::BITS_PER_BYTE, false, decoded.payload);
    auto values_wiped = Wipe(values);
    if (values_wiped.IsErr()) {
        return WipeThen(decoded.payload, Result<Bech32Data, KeyFailure>::Err(
            std::move(values_wiped).UnwrapErr()));
    }
    if (!regrouped) {
        return WipeThen(decoded.payload, Result<Bech32Data, KeyFailure>::Err(
            KeyFailure::InvalidFormat(std::string(ErrorMessages::BECH32_BAD_PADDING))));
    }
    return Result<Bech32Data, KeyFailure>::Ok(std::move(decoded));
}

}
