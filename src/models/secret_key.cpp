#include "nostrkeys/models/secret_key.hpp"
#include "nostrkeys/core/constants.hpp"
#include "nostrkeys/crypto/sodium_interop.hpp"
#include "nostrkeys/crypto/secp256k1_interop.hpp"
#include <format>

namespace nostrkeys::models {

SecretKey::SecretKey(crypto::SecureMemoryHandle handle) noexcept
    : handle_(std::move(handle)) {
}

Result<SecretKey, KeyFailure> SecretKey::FromHandle(crypto::SecureMemoryHandle handle) {
    if (handle.IsInvalid() || handle.Size() != Constants::SECRET_KEY_SIZE) {
        return Result<SecretKey, KeyFailure>::Err(
            KeyFailure::InvalidFormat(
                std::format("Invalid secret key size: expected {}, got {}",
                            Constants::SECRET_KEY_SIZE, handle.Size())));
    }

    auto check = handle.WithReadAccess([](std::span<const uint8_t> scalar) {
        return crypto::Secp256k1Interop::ValidateSecretScalar(scalar);
    });
    if (check.IsErr()) {
        return Result<SecretKey, KeyFailure>::Err(KeyFailure::FromSodiumFailure(check.UnwrapErr()));
    }
    if (check.Unwrap().IsErr()) {
        return Result<SecretKey, KeyFailure>::Err(check.Unwrap().UnwrapErr());
    }

    return Result<SecretKey, KeyFailure>::Ok(SecretKey(std::move(handle)));
}

Result<SecretKey, KeyFailure> SecretKey::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::SECRET_KEY_SIZE) {
        return Result<SecretKey, KeyFailure>::Err(
            KeyFailure::InvalidFormat(
                std::format("Invalid secret key size: expected {}, got {}",
                            Constants::SECRET_KEY_SIZE, bytes.size())));
    }

    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<SecretKey, KeyFailure>::Err(KeyFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    auto handle_result = crypto::SecureMemoryHandle::Allocate(Constants::SECRET_KEY_SIZE);
    if (handle_result.IsErr()) {
        return Result<SecretKey, KeyFailure>::Err(KeyFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    crypto::SecureMemoryHandle handle = std::move(handle_result).Unwrap();

    auto write_result = handle.Write(bytes);
    if (write_result.IsErr()) {
        return Result<SecretKey, KeyFailure>::Err(KeyFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return FromHandle(std::move(handle));
}

Result<SecretKey, KeyFailure> SecretKey::Clone() const {
    auto clone_result = handle_.Clone();
    if (clone_result.IsErr()) {
        return Result<SecretKey, KeyFailure>::Err(KeyFailure::FromSodiumFailure(clone_result.UnwrapErr()));
    }
    return Result<SecretKey, KeyFailure>::Ok(SecretKey(std::move(clone_result).Unwrap()));
}

bool SecretKey::operator==(const SecretKey& other) const {
    if (handle_.IsInvalid() || other.handle_.IsInvalid()) {
        return handle_.IsInvalid() && other.handle_.IsInvalid();
    }
    auto equal = handle_.WithReadAccess([&other](std::span<const uint8_t> mine) {
        return other.handle_.WithReadAccess([mine](std::span<const uint8_t> theirs) {
            return crypto::SodiumInterop::ConstantTimeEquals(mine, theirs);
        });
    });
    return equal.IsOk() && equal.Unwrap().IsOk() && equal.Unwrap().Unwrap();
}

}
