#pragma once

#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"
#include "nostrkeys/core/constants.hpp"

#include <secp256k1.h>
#include <array>
#include <cstdint>
#include <mutex>
#include <span>

namespace nostrkeys::crypto {

using XOnlyPublicKeyBytes = std::array<uint8_t, Constants::XONLY_PUBLIC_KEY_SIZE>;

/**
 * @brief Interop layer for libsecp256k1
 *
 * Holds one process-wide context, created and blinded with libsodium
 * randomness on first use. After Initialize() the context is only passed as
 * const, so every member is safe to call concurrently.
 */
class Secp256k1Interop {
public:
    /**
     * @brief Create and randomize the shared context
     *
     * Thread-safe and idempotent. Called implicitly by the other members.
     */
    static Result<Unit, KeyFailure> Initialize();

    /**
     * @brief Check that secret is a 32-byte scalar with 0 < k < n
     */
    static Result<Unit, KeyFailure> ValidateSecretScalar(std::span<const uint8_t> secret);

    /**
     * @brief Derive the BIP-340 x-only public key of a valid secret scalar
     *
     * The intermediate secp256k1_keypair is wiped before returning.
     */
    static Result<XOnlyPublicKeyBytes, KeyFailure> DeriveXOnlyPublicKey(
        std::span<const uint8_t> secret);

    /**
     * @brief Check that bytes are the x coordinate of a curve point
     */
    static Result<Unit, KeyFailure> ValidateXOnlyPublicKey(std::span<const uint8_t> public_key);

    /**
     * @brief Reduce a 33-byte SEC1 compressed point to its x-only form
     */
    static Result<XOnlyPublicKeyBytes, KeyFailure> XOnlyFromCompressed(
        std::span<const uint8_t> compressed);

private:
    static const secp256k1_context* Context() noexcept;

    static inline secp256k1_context* context_ = nullptr;
    static inline std::once_flag init_flag_;

    Secp256k1Interop() = delete;
    ~Secp256k1Interop() = delete;
};

} // namespace nostrkeys::crypto
