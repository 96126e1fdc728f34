#include "nostrkeys/models/public_key.hpp"
#include <algorithm>

namespace nostrkeys::models {

Result<PublicKey, KeyFailure> PublicKey::FromBytes(std::span<const uint8_t> x_only) {
    auto valid = crypto::Secp256k1Interop::ValidateXOnlyPublicKey(x_only);
    if (valid.IsErr()) {
        return Result<PublicKey, KeyFailure>::Err(std::move(valid).UnwrapErr());
    }
    crypto::XOnlyPublicKeyBytes bytes{};
    std::copy(x_only.begin(), x_only.end(), bytes.begin());
    return Result<PublicKey, KeyFailure>::Ok(PublicKey(bytes));
}

Result<PublicKey, KeyFailure> PublicKey::FromCompressed(std::span<const uint8_t> compressed) {
    return crypto::Secp256k1Interop::XOnlyFromCompressed(compressed)
        .Map([](const crypto::XOnlyPublicKeyBytes& bytes) { return PublicKey(bytes); });
}

Result<PublicKey, KeyFailure> PublicKey::FromSecretKey(const SecretKey& secret_key) {
    auto derived = secret_key.WithBytes([](std::span<const uint8_t> scalar) {
        return crypto::Secp256k1Interop::DeriveXOnlyPublicKey(scalar);
    });
    if (derived.IsErr()) {
        return Result<PublicKey, KeyFailure>::Err(std::move(derived).UnwrapErr());
    }
    if (derived.Unwrap().IsErr()) {
        return Result<PublicKey, KeyFailure>::Err(derived.Unwrap().UnwrapErr());
    }
    return Result<PublicKey, KeyFailure>::Ok(PublicKey(derived.Unwrap().Unwrap()));
}

}
