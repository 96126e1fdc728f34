#include "nostrkeys/keys/keys.hpp"
#include "nostrkeys/core/constants.hpp"
#include "nostrkeys/crypto/secp256k1_interop.hpp"
#include "nostrkeys/crypto/sodium_entropy_source.hpp"
#include "nostrkeys/crypto/sodium_interop.hpp"
#include "nostrkeys/crypto/sodium_secure_memory_handle.hpp"
#include "nostrkeys/debug/key_logger.hpp"
#include "nostrkeys/encoding/bech32.hpp"
#include "nostrkeys/encoding/hex.hpp"

#include <string>
#include <vector>

namespace nostrkeys::keys {

using crypto::Secp256k1Interop;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
using encoding::Bech32;

namespace {

constexpr std::string_view FORMAT_BECH32 = "bech32";
constexpr std::string_view FORMAT_HEX = "hex";
constexpr std::string_view FORMAT_COMPRESSED_HEX = "compressed hex";

template<typename T>
Result<T, KeyFailure> Logged(Result<T, KeyFailure> result, std::string_view what, std::string_view format) {
    if (result.IsErr()) {
        const auto& failure = result.UnwrapErr();
        debug::LogParseFailed(what, KeyFailureTypeName(failure.type), failure.message);
    } else {
        debug::LogParseSucceeded(what, format);
    }
    return result;
}

Result<SecureMemoryHandle, KeyFailure> AllocateSecretHandle() {
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<SecureMemoryHandle, KeyFailure>::Err(
            KeyFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    auto handle_result = SecureMemoryHandle::Allocate(Constants::SECRET_KEY_SIZE);
    if (handle_result.IsErr()) {
        return Result<SecureMemoryHandle, KeyFailure>::Err(
            KeyFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, KeyFailure>::Ok(std::move(handle_result).Unwrap());
}

/// Decode text as bech32 and require the given prefix and a 32-byte payload.
/// The decoded payload is moved into the caller's vector.
Result<Unit, KeyFailure> DecodeKeyPayload(
    std::string_view text,
    std::string_view expected_hrp,
    std::vector<uint8_t>& payload) {

    auto decode_result = Bech32::Decode(text);
    if (decode_result.IsErr()) {
        return Result<Unit, KeyFailure>::Err(std::move(decode_result).UnwrapErr());
    }
    auto decoded = std::move(decode_result).Unwrap();
    payload = std::move(decoded.payload);

    if (decoded.hrp != expected_hrp) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::InvalidFormat("Unexpected bech32 prefix '" + decoded.hrp +
                                      "', expected '" + std::string(expected_hrp) + "'"));
    }
    if (payload.size() != Constants::SECRET_KEY_SIZE) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::InvalidFormat("Bech32 payload is " + std::to_string(payload.size()) +
                                      " bytes, expected " +
                                      std::to_string(Constants::SECRET_KEY_SIZE)));
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

/// Wipes the decoded secret payload; a failed wipe replaces result.
Result<SecretKey, KeyFailure> WipePayloadThen(
    std::vector<uint8_t>& payload,
    Result<SecretKey, KeyFailure> result) {

    auto wiped = SodiumInterop::SecureWipe(payload);
    if (wiped.IsErr()) {
        return Result<SecretKey, KeyFailure>::Err(KeyFailure::FromSodiumFailure(wiped.UnwrapErr()));
    }
    return result;
}

Result<SecretKey, KeyFailure> ParseBech32SecretKey(std::string_view input, const KeysConfig& config) {
    std::vector<uint8_t> payload;
    auto decode_result = DecodeKeyPayload(input, config.SecretKeyPrefix(), payload);
    if (decode_result.IsErr()) {
        return WipePayloadThen(payload,
            Result<SecretKey, KeyFailure>::Err(std::move(decode_result).UnwrapErr()));
    }
    return WipePayloadThen(payload, SecretKey::FromBytes(payload));
}

Result<SecretKey, KeyFailure> ParseHexSecretKey(std::string_view input) {
    if (input.size() != Constants::SECRET_KEY_HEX_LENGTH) {
        return Result<SecretKey, KeyFailure>::Err(
            KeyFailure::InvalidFormat("Secret key hex must be " +
                                      std::to_string(Constants::SECRET_KEY_HEX_LENGTH) +
                                      " characters, got " + std::to_string(input.size())));
    }
    auto handle_result = AllocateSecretHandle();
    if (handle_result.IsErr()) {
        return Result<SecretKey, KeyFailure>::Err(std::move(handle_result).UnwrapErr());
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();

    auto write_result = handle.WithWriteAccess([input](std::span<uint8_t> bytes) {
        return encoding::DecodeHexInto(input, bytes);
    });
    if (write_result.IsErr()) {
        return Result<SecretKey, KeyFailure>::Err(
            KeyFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    auto decode_result = std::move(write_result).Unwrap();
    if (decode_result.IsErr()) {
        return Result<SecretKey, KeyFailure>::Err(std::move(decode_result).UnwrapErr());
    }
    return SecretKey::FromHandle(std::move(handle));
}

bool IsCompressedPublicKeyHex(std::string_view input) noexcept {
    return input.size() == Constants::COMPRESSED_PUBLIC_KEY_HEX_LENGTH &&
           input[0] == '0' && (input[1] == '2' || input[1] == '3') &&
           encoding::IsHexDigits(input);
}

Result<std::string, KeyFailure> EncodeBech32(const SecretKey& key, std::string_view prefix) {
    auto encode_result = key.WithBytes([prefix](std::span<const uint8_t> bytes) {
        return Bech32::Encode(prefix, bytes);
    });
    if (encode_result.IsErr()) {
        return Result<std::string, KeyFailure>::Err(std::move(encode_result).UnwrapErr());
    }
    return std::move(encode_result).Unwrap();
}

Result<std::string, KeyFailure> EncodeBech32(const PublicKey& key, std::string_view prefix) {
    return Bech32::Encode(prefix, key.GetBytes());
}

} // namespace

// ============================================================================
// Generation
// ============================================================================

Result<Keypair, KeyFailure> Generate(IEntropySource& entropy, const KeysConfig& config) {
    auto handle_result = AllocateSecretHandle();
    if (handle_result.IsErr()) {
        return Result<Keypair, KeyFailure>::Err(std::move(handle_result).UnwrapErr());
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();

    const uint32_t max_attempts = config.MaxGenerationAttempts();
    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        auto fill_access = handle.WithWriteAccess([&entropy](std::span<uint8_t> bytes) {
            return entropy.Fill(bytes);
        });
        if (fill_access.IsErr()) {
            return Result<Keypair, KeyFailure>::Err(
                KeyFailure::FromSodiumFailure(fill_access.UnwrapErr()));
        }
        auto fill_result = std::move(fill_access).Unwrap();
        if (fill_result.IsErr()) {
            return Result<Keypair, KeyFailure>::Err(
                KeyFailure::EntropyUnavailable(fill_result.UnwrapErr().message));
        }

        auto check_access = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            return Secp256k1Interop::ValidateSecretScalar(bytes);
        });
        if (check_access.IsErr()) {
            return Result<Keypair, KeyFailure>::Err(
                KeyFailure::FromSodiumFailure(check_access.UnwrapErr()));
        }
        auto check_result = std::move(check_access).Unwrap();
        if (check_result.IsErr()) {
            if (check_result.UnwrapErr().type == KeyFailureType::InvalidScalar) {
                debug::LogEntropyRejected(attempt);
                continue;
            }
            return Result<Keypair, KeyFailure>::Err(std::move(check_result).UnwrapErr());
        }

        auto secret_result = SecretKey::FromHandle(std::move(handle));
        if (secret_result.IsErr()) {
            return Result<Keypair, KeyFailure>::Err(std::move(secret_result).UnwrapErr());
        }
        auto keypair_result = Keypair::FromSecretKey(std::move(secret_result).Unwrap());
        if (keypair_result.IsOk()) {
            const auto& keypair = keypair_result.Unwrap();
            auto log_access = keypair.GetSecretKey().WithBytes([&keypair, attempt](std::span<const uint8_t> bytes) {
                debug::LogKeypairGenerated(bytes, keypair.GetPublicKey().GetBytes(), attempt);
                return unit;
            });
            if (log_access.IsErr()) {
                return Result<Keypair, KeyFailure>::Err(std::move(log_access).UnwrapErr());
            }
        }
        return keypair_result;
    }

    return Result<Keypair, KeyFailure>::Err(
        KeyFailure::EntropyUnavailable(std::string(ErrorMessages::ENTROPY_EXHAUSTED) +
                                       " after " + std::to_string(max_attempts) + " attempts"));
}

Result<Keypair, KeyFailure> Generate() {
    return Generate(crypto::SodiumEntropySource::Instance(), KeysConfig::Default());
}

// ============================================================================
// Parsing
// ============================================================================

Result<SecretKey, KeyFailure> ParseSecretKey(std::string_view input, const KeysConfig& config) {
    if (Bech32::HasPrefix(input, config.SecretKeyPrefix())) {
        return Logged(ParseBech32SecretKey(input, config), "secret key", FORMAT_BECH32);
    }
    if (Bech32::HasPrefix(input, config.PublicKeyPrefix())) {
        return Logged(
            Result<SecretKey, KeyFailure>::Err(
                KeyFailure::InvalidFormat(std::string(ErrorMessages::PUBLIC_KEY_WHERE_SECRET_EXPECTED))),
            "secret key", FORMAT_BECH32);
    }
    return Logged(ParseHexSecretKey(input), "secret key", FORMAT_HEX);
}

Result<PublicKey, KeyFailure> ParsePublicKey(std::string_view input, const KeysConfig& config) {
    if (Bech32::HasPrefix(input, config.PublicKeyPrefix())) {
        std::vector<uint8_t> payload;
        auto decode_result = DecodeKeyPayload(input, config.PublicKeyPrefix(), payload);
        if (decode_result.IsErr()) {
            return Logged(
                Result<PublicKey, KeyFailure>::Err(std::move(decode_result).UnwrapErr()),
                "public key", FORMAT_BECH32);
        }
        return Logged(PublicKey::FromBytes(payload), "public key", FORMAT_BECH32);
    }
    if (Bech32::HasPrefix(input, config.SecretKeyPrefix())) {
        return Logged(
            Result<PublicKey, KeyFailure>::Err(
                KeyFailure::InvalidFormat(std::string(ErrorMessages::SECRET_KEY_WHERE_PUBLIC_EXPECTED))),
            "public key", FORMAT_BECH32);
    }

    if (input.size() == Constants::XONLY_PUBLIC_KEY_HEX_LENGTH) {
        auto bytes_result = encoding::FromHex(input, Constants::XONLY_PUBLIC_KEY_SIZE);
        if (bytes_result.IsErr()) {
            return Logged(
                Result<PublicKey, KeyFailure>::Err(std::move(bytes_result).UnwrapErr()),
                "public key", FORMAT_HEX);
        }
        return Logged(PublicKey::FromBytes(bytes_result.Unwrap()), "public key", FORMAT_HEX);
    }
    if (input.size() == Constants::COMPRESSED_PUBLIC_KEY_HEX_LENGTH) {
        auto bytes_result = encoding::FromHex(input, Constants::COMPRESSED_PUBLIC_KEY_SIZE);
        if (bytes_result.IsErr()) {
            return Logged(
                Result<PublicKey, KeyFailure>::Err(std::move(bytes_result).UnwrapErr()),
                "public key", FORMAT_COMPRESSED_HEX);
        }
        return Logged(PublicKey::FromCompressed(bytes_result.Unwrap()), "public key",
                      FORMAT_COMPRESSED_HEX);
    }

    return Logged(
        Result<PublicKey, KeyFailure>::Err(
            KeyFailure::InvalidFormat("Public key hex must be " +
                                      std::to_string(Constants::XONLY_PUBLIC_KEY_HEX_LENGTH) +
                                      " or " +
                                      std::to_string(Constants::COMPRESSED_PUBLIC_KEY_HEX_LENGTH) +
                                      " characters, got " + std::to_string(input.size()))),
        "public key", FORMAT_HEX);
}

Result<Keypair, KeyFailure> ParseKeypair(std::string_view input, const KeysConfig& config) {
    if (Bech32::HasPrefix(input, config.PublicKeyPrefix()) || IsCompressedPublicKeyHex(input)) {
        auto public_result = ParsePublicKey(input, config);
        if (public_result.IsErr()) {
            return Result<Keypair, KeyFailure>::Err(std::move(public_result).UnwrapErr());
        }
        return Result<Keypair, KeyFailure>::Err(
            KeyFailure::PublicKeyOnly(std::string(ErrorMessages::KEYPAIR_NEEDS_SECRET)));
    }

    auto secret_result = ParseSecretKey(input, config);
    if (secret_result.IsErr()) {
        return Result<Keypair, KeyFailure>::Err(std::move(secret_result).UnwrapErr());
    }
    return Keypair::FromSecretKey(std::move(secret_result).Unwrap());
}

// ============================================================================
// Encoding
// ============================================================================

std::string ToHex(const SecretKey& secret_key) {
    return secret_key.WithBytes([](std::span<const uint8_t> bytes) {
        return encoding::ToHex(bytes);
    }).Unwrap();
}

std::string ToHex(const PublicKey& public_key) {
    return encoding::ToHex(public_key.GetBytes());
}

std::string ToHumanReadable(const SecretKey& secret_key, const KeysConfig& config) {
    return EncodeBech32(secret_key, config.SecretKeyPrefix()).Unwrap();
}

std::string ToHumanReadable(const PublicKey& public_key, const KeysConfig& config) {
    return EncodeBech32(public_key, config.PublicKeyPrefix()).Unwrap();
}

Result<std::string, KeyFailure> ToHumanReadable(const SecretKey& secret_key, std::string_view prefix) {
    return EncodeBech32(secret_key, prefix);
}

Result<std::string, KeyFailure> ToHumanReadable(const PublicKey& public_key, std::string_view prefix) {
    return EncodeBech32(public_key, prefix);
}

} // namespace nostrkeys::keys
