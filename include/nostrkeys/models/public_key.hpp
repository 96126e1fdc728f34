#pragma once
#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"
#include "nostrkeys/crypto/secp256k1_interop.hpp"
#include "nostrkeys/models/secret_key.hpp"
#include <cstdint>
#include <span>
namespace nostrkeys::models {
/// BIP-340 x-only secp256k1 public key. Always a valid curve point.
class PublicKey {
public:
    [[nodiscard]] static Result<PublicKey, KeyFailure> FromBytes(std::span<const uint8_t> x_only);
    /// 33-byte SEC1 compressed point; the y parity is dropped.
    [[nodiscard]] static Result<PublicKey, KeyFailure> FromCompressed(std::span<const uint8_t> compressed);
    [[nodiscard]] static Result<PublicKey, KeyFailure> FromSecretKey(const SecretKey& secret_key);
    [[nodiscard]] const crypto::XOnlyPublicKeyBytes& GetBytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] bool operator==(const PublicKey& other) const noexcept {
        return bytes_ == other.bytes_;
    }
    [[nodiscard]] bool operator!=(const PublicKey& other) const noexcept {
        return bytes_ != other.bytes_;
    }
private:
    explicit PublicKey(const crypto::XOnlyPublicKeyBytes& bytes) noexcept
        : bytes_(bytes) {}
    crypto::XOnlyPublicKeyBytes bytes_;
};
}
