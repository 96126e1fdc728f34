#pragma once
#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"
#include "nostrkeys/models/secret_key.hpp"
#include "nostrkeys/models/public_key.hpp"
namespace nostrkeys::models {
/// A secret key and the public key derived from it.
///
/// The public half is never set independently: FromSecretKey() is the only
/// way to build a Keypair.
class Keypair {
public:
    [[nodiscard]] static Result<Keypair, KeyFailure> FromSecretKey(SecretKey secret_key);
    Keypair(Keypair&&) noexcept = default;
    Keypair& operator=(Keypair&&) noexcept = default;
    Keypair(const Keypair&) = delete;
    Keypair& operator=(const Keypair&) = delete;
    [[nodiscard]] const SecretKey& GetSecretKey() const noexcept {
        return secret_key_;
    }
    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] SecretKey TakeSecretKey() && {
        return std::move(secret_key_);
    }
    [[nodiscard]] Result<Keypair, KeyFailure> Clone() const;
private:
    Keypair(SecretKey secret_key, PublicKey public_key) noexcept;
    SecretKey secret_key_;
    PublicKey public_key_;
};
}
