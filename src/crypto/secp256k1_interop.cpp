#include "nostrkeys/crypto/secp256k1_interop.hpp"
#include "nostrkeys/crypto/sodium_interop.hpp"

#include <secp256k1_extrakeys.h>
#include <format>
#include <string>

namespace nostrkeys::crypto {

namespace {

Result<Unit, KeyFailure> CheckSize(
    std::span<const uint8_t> bytes,
    const size_t expected,
    std::string_view what) {

    if (bytes.size() != expected) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::InvalidFormat(
                std::format("Invalid {} size: expected {}, got {}",
                            what, expected, bytes.size())));
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

Result<Unit, KeyFailure> WipeKeypair(std::span<uint8_t> keypair_bytes) {
    auto wiped = SodiumInterop::SecureWipe(keypair_bytes);
    if (wiped.IsErr()) {
        return Result<Unit, KeyFailure>::Err(KeyFailure::FromSodiumFailure(wiped.UnwrapErr()));
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

}

// ============================================================================
// Context
// ============================================================================

Result<Unit, KeyFailure> Secp256k1Interop::Initialize() {
    std::call_once(init_flag_, []() {
        secp256k1_context* ctx = secp256k1_context_create(
            SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
        if (ctx == nullptr) {
            return;
        }

        std::array<uint8_t, Constants::SECP256K1_CONTEXT_SEED_SIZE> seed{};
        const bool blinded = SodiumInterop::FillRandom(seed).IsOk() &&
            secp256k1_context_randomize(ctx, seed.data()) == 1;
        const bool wiped = SodiumInterop::SecureWipe(seed).IsOk();
        if (!blinded || !wiped) {
            secp256k1_context_destroy(ctx);
            return;
        }

        context_ = ctx;
    });

    if (context_ == nullptr) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::Backend(std::string(ErrorMessages::SECP256K1_CONTEXT_FAILED)));
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

const secp256k1_context* Secp256k1Interop::Context() noexcept {
    return context_;
}

// ============================================================================
// Secret Scalars
// ============================================================================

Result<Unit, KeyFailure> Secp256k1Interop::ValidateSecretScalar(std::span<const uint8_t> secret) {
    auto init_result = Initialize();
    if (init_result.IsErr()) {
        return init_result;
    }

    auto size_result = CheckSize(secret, Constants::SECRET_KEY_SIZE, "secret key");
    if (size_result.IsErr()) {
        return size_result;
    }

    if (secp256k1_ec_seckey_verify(Context(), secret.data()) != 1) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::InvalidScalar(std::string(ErrorMessages::SCALAR_OUT_OF_RANGE)));
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

Result<XOnlyPublicKeyBytes, KeyFailure> Secp256k1Interop::DeriveXOnlyPublicKey(
    std::span<const uint8_t> secret) {

    auto valid = ValidateSecretScalar(secret);
    if (valid.IsErr()) {
        return Result<XOnlyPublicKeyBytes, KeyFailure>::Err(std::move(valid).UnwrapErr());
    }

    secp256k1_keypair keypair;
    const std::span<uint8_t> keypair_bytes(keypair.data, sizeof(keypair.data));
    if (secp256k1_keypair_create(Context(), &keypair, secret.data()) != 1) {
        auto wiped = WipeKeypair(keypair_bytes);
        if (wiped.IsErr()) {
            return Result<XOnlyPublicKeyBytes, KeyFailure>::Err(std::move(wiped).UnwrapErr());
        }
        return Result<XOnlyPublicKeyBytes, KeyFailure>::Err(
            KeyFailure::InvalidScalar(std::string(ErrorMessages::SCALAR_OUT_OF_RANGE)));
    }

    secp256k1_xonly_pubkey xonly;
    int parity = 0;
    const int extracted = secp256k1_keypair_xonly_pub(Context(), &xonly, &parity, &keypair);
    auto wiped = WipeKeypair(keypair_bytes);
    if (wiped.IsErr()) {
        return Result<XOnlyPublicKeyBytes, KeyFailure>::Err(std::move(wiped).UnwrapErr());
    }
    if (extracted != 1) {
        return Result<XOnlyPublicKeyBytes, KeyFailure>::Err(
            KeyFailure::Backend("Failed to extract x-only public key"));
    }

    XOnlyPublicKeyBytes out{};
    secp256k1_xonly_pubkey_serialize(Context(), out.data(), &xonly);
    return Result<XOnlyPublicKeyBytes, KeyFailure>::Ok(out);
}

// ============================================================================
// Public Points
// ============================================================================

Result<Unit, KeyFailure> Secp256k1Interop::ValidateXOnlyPublicKey(std::span<const uint8_t> public_key) {
    auto init_result = Initialize();
    if (init_result.IsErr()) {
        return init_result;
    }

    auto size_result = CheckSize(public_key, Constants::XONLY_PUBLIC_KEY_SIZE, "x-only public key");
    if (size_result.IsErr()) {
        return size_result;
    }

    secp256k1_xonly_pubkey xonly;
    if (secp256k1_xonly_pubkey_parse(Context(), &xonly, public_key.data()) != 1) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::InvalidPublicKey(std::string(ErrorMessages::POINT_NOT_ON_CURVE)));
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

Result<XOnlyPublicKeyBytes, KeyFailure> Secp256k1Interop::XOnlyFromCompressed(
    std::span<const uint8_t> compressed) {

    auto init_result = Initialize();
    if (init_result.IsErr()) {
        return Result<XOnlyPublicKeyBytes, KeyFailure>::Err(std::move(init_result).UnwrapErr());
    }

    auto size_result = CheckSize(compressed, Constants::COMPRESSED_PUBLIC_KEY_SIZE, "compressed public key");
    if (size_result.IsErr()) {
        return Result<XOnlyPublicKeyBytes, KeyFailure>::Err(std::move(size_result).UnwrapErr());
    }

    // ec_pubkey_parse would also take 0x04/0x06/0x07 prefixes of other lengths
    if (compressed[0] != Constants::COMPRESSED_EVEN_PREFIX &&
        compressed[0] != Constants::COMPRESSED_ODD_PREFIX) {
        return Result<XOnlyPublicKeyBytes, KeyFailure>::Err(
            KeyFailure::InvalidPublicKey(
                std::format("Invalid compressed public key prefix 0x{:02x}", compressed[0])));
    }

    secp256k1_pubkey pubkey;
    if (secp256k1_ec_pubkey_parse(Context(), &pubkey, compressed.data(), compressed.size()) != 1) {
        return Result<XOnlyPublicKeyBytes, KeyFailure>::Err(
            KeyFailure::InvalidPublicKey(std::string(ErrorMessages::POINT_NOT_ON_CURVE)));
    }

    secp256k1_xonly_pubkey xonly;
    int parity = 0;
    if (secp256k1_xonly_pubkey_from_pubkey(Context(), &xonly, &parity, &pubkey) != 1) {
        return Result<XOnlyPublicKeyBytes, KeyFailure>::Err(
            KeyFailure::Backend("Failed to convert public key to x-only form"));
    }

    XOnlyPublicKeyBytes out{};
    secp256k1_xonly_pubkey_serialize(Context(), out.data(), &xonly);
    return Result<XOnlyPublicKeyBytes, KeyFailure>::Ok(out);
}

} // namespace nostrkeys::crypto
