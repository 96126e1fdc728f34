#pragma once
#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"
#include "nostrkeys/configuration/keys_config.hpp"
#include "nostrkeys/interfaces/i_entropy_source.hpp"
#include "nostrkeys/models/keypair.hpp"
#include "nostrkeys/models/public_key.hpp"
#include "nostrkeys/models/secret_key.hpp"
#include <string>
#include <string_view>
namespace nostrkeys::keys {
using configuration::KeysConfig;
using interfaces::IEntropySource;
using models::Keypair;
using models::PublicKey;
using models::SecretKey;

// ============================================================================
// Generation
// ============================================================================

/**
 * @brief Generate a keypair from entropy
 *
 * Draws 32 bytes at a time into guarded memory until they form a valid
 * scalar, at most config.MaxGenerationAttempts() times.
 *
 * @return Err(EntropyUnavailable) if the source fails or every draw is
 *         rejected
 */
[[nodiscard]] Result<Keypair, KeyFailure> Generate(
    IEntropySource& entropy,
    const KeysConfig& config = KeysConfig::Default());

/// Generate() with the libsodium entropy source and the default config.
[[nodiscard]] Result<Keypair, KeyFailure> Generate();

// ============================================================================
// Parsing
// ============================================================================

/**
 * @brief Parse a secret key from 64 hex digits or a secret-prefixed bech32
 *        string
 *
 * @return Err(InvalidFormat) for wrong length, characters, structure or
 *         prefix; Err(InvalidChecksum) for a bech32 checksum mismatch;
 *         Err(InvalidScalar) if the scalar is zero or not below the order
 */
[[nodiscard]] Result<SecretKey, KeyFailure> ParseSecretKey(
    std::string_view input,
    const KeysConfig& config = KeysConfig::Default());

/**
 * @brief Parse a public key from a public-prefixed bech32 string, 64 hex
 *        digits (x-only) or 66 hex digits (SEC1 compressed)
 */
[[nodiscard]] Result<PublicKey, KeyFailure> ParsePublicKey(
    std::string_view input,
    const KeysConfig& config = KeysConfig::Default());

/**
 * @brief Parse a keypair from any secret key encoding
 *
 * A public key encoding that parses is reported as PublicKeyOnly; one that
 * does not parse reports its own failure. 64 hex digits are always read as a
 * secret key.
 */
[[nodiscard]] Result<Keypair, KeyFailure> ParseKeypair(
    std::string_view input,
    const KeysConfig& config = KeysConfig::Default());

// ============================================================================
// Encoding
// ============================================================================

[[nodiscard]] std::string ToHex(const SecretKey& secret_key);
[[nodiscard]] std::string ToHex(const PublicKey& public_key);

[[nodiscard]] std::string ToHumanReadable(
    const SecretKey& secret_key,
    const KeysConfig& config = KeysConfig::Default());
[[nodiscard]] std::string ToHumanReadable(
    const PublicKey& public_key,
    const KeysConfig& config = KeysConfig::Default());

/// Bech32 under an arbitrary prefix; Err(InvalidFormat) if the prefix is not
/// a valid lowercase bech32 prefix.
[[nodiscard]] Result<std::string, KeyFailure> ToHumanReadable(
    const SecretKey& secret_key,
    std::string_view prefix);
[[nodiscard]] Result<std::string, KeyFailure> ToHumanReadable(
    const PublicKey& public_key,
    std::string_view prefix);
}
