#pragma once

#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"

#include <cstdint>
#include <string>

namespace nostrkeys::configuration {

/// Encoding and generation settings shared by the key functions
///
/// Two knobs matter:
/// - the bech32 prefixes that tell secret keys from public keys
///   (NIP-19 `nsec` / `npub` by default)
/// - how many entropy draws Generate() may reject before giving up
///
/// A KeysConfig can only be obtained from Default() or Create(), so every
/// instance holds prefixes the bech32 encoder accepts. Encoding with it
/// therefore cannot fail.
///
/// @example
/// ```cpp
/// auto config = KeysConfig::Create("tsec", "tpub", 16);
/// if (config.IsOk()) {
///     auto text = keys::ToHumanReadable(secret, config.Unwrap());
/// }
/// ```
class KeysConfig {
public:
    /// NIP-19 prefixes and 128 generation attempts
    [[nodiscard]] static KeysConfig Default();

    /// Validating factory
    ///
    /// Fails with InvalidFormat if a prefix is not a valid lowercase bech32
    /// prefix, contains '1', consists only of hex digits, or both prefixes
    /// are equal; and if max_generation_attempts is zero.
    [[nodiscard]] static Result<KeysConfig, KeyFailure> Create(
        std::string secret_key_prefix,
        std::string public_key_prefix,
        uint32_t max_generation_attempts);

    [[nodiscard]] const std::string& SecretKeyPrefix() const noexcept {
        return secret_key_prefix_;
    }

    [[nodiscard]] const std::string& PublicKeyPrefix() const noexcept {
        return public_key_prefix_;
    }

    [[nodiscard]] uint32_t MaxGenerationAttempts() const noexcept {
        return max_generation_attempts_;
    }

    [[nodiscard]] bool operator==(const KeysConfig& other) const noexcept {
        return secret_key_prefix_ == other.secret_key_prefix_ &&
               public_key_prefix_ == other.public_key_prefix_ &&
               max_generation_attempts_ == other.max_generation_attempts_;
    }

    [[nodiscard]] bool operator!=(const KeysConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    KeysConfig(
        std::string secret_key_prefix,
        std::string public_key_prefix,
        uint32_t max_generation_attempts) noexcept;

    std::string secret_key_prefix_;
    std::string public_key_prefix_;
    uint32_t max_generation_attempts_;
};

} // namespace nostrkeys::configuration
