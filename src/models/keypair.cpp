#include "nostrkeys/models/keypair.hpp"

namespace nostrkeys::models {

Keypair::Keypair(SecretKey secret_key, PublicKey public_key) noexcept
    : secret_key_(std::move(secret_key))
    , public_key_(public_key) {
}

Result<Keypair, KeyFailure> Keypair::FromSecretKey(SecretKey secret_key) {
    auto public_result = PublicKey::FromSecretKey(secret_key);
    if (public_result.IsErr()) {
        return Result<Keypair, KeyFailure>::Err(std::move(public_result).UnwrapErr());
    }
    return Result<Keypair, KeyFailure>::Ok(
        Keypair(std::move(secret_key), public_result.Unwrap()));
}

Result<Keypair, KeyFailure> Keypair::Clone() const {
    auto secret_result = secret_key_.Clone();
    if (secret_result.IsErr()) {
        return Result<Keypair, KeyFailure>::Err(std::move(secret_result).UnwrapErr());
    }
    return Result<Keypair, KeyFailure>::Ok(
        Keypair(std::move(secret_result).Unwrap(), public_key_));
}

}
