#include "nostrkeys/configuration/keys_config.hpp"
#include "nostrkeys/core/constants.hpp"
#include "nostrkeys/encoding/bech32.hpp"
#include "nostrkeys/encoding/hex.hpp"

#include <format>

namespace nostrkeys::configuration {

namespace {

Result<Unit, KeyFailure> ValidatePrefix(const std::string& prefix) {
    auto hrp_result = encoding::Bech32::ValidateHrp(prefix);
    if (hrp_result.IsErr()) {
        return hrp_result;
    }
    if (prefix.find(Bech32Constants::SEPARATOR) != std::string::npos) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::InvalidFormat(
                std::format("Prefix '{}' contains the bech32 separator", prefix)));
    }
    if (encoding::IsHexDigits(prefix)) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::InvalidFormat(
                std::format("Prefix '{}' consists only of hex digits", prefix)));
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

}

KeysConfig::KeysConfig(
    std::string secret_key_prefix,
    std::string public_key_prefix,
    const uint32_t max_generation_attempts) noexcept
    : secret_key_prefix_(std::move(secret_key_prefix))
    , public_key_prefix_(std::move(public_key_prefix))
    , max_generation_attempts_(max_generation_attempts) {
}

KeysConfig KeysConfig::Default() {
    return KeysConfig(
        std::string(Constants::DEFAULT_SECRET_KEY_PREFIX),
        std::string(Constants::DEFAULT_PUBLIC_KEY_PREFIX),
        Constants::DEFAULT_MAX_GENERATION_ATTEMPTS);
}

Result<KeysConfig, KeyFailure> KeysConfig::Create(
    std::string secret_key_prefix,
    std::string public_key_prefix,
    const uint32_t max_generation_attempts) {

    auto secret_result = ValidatePrefix(secret_key_prefix);
    if (secret_result.IsErr()) {
        return Result<KeysConfig, KeyFailure>::Err(std::move(secret_result).UnwrapErr());
    }
    auto public_result = ValidatePrefix(public_key_prefix);
    if (public_result.IsErr()) {
        return Result<KeysConfig, KeyFailure>::Err(std::move(public_result).UnwrapErr());
    }
    if (secret_key_prefix == public_key_prefix) {
        return Result<KeysConfig, KeyFailure>::Err(
            KeyFailure::InvalidFormat("Secret and public key prefixes must differ"));
    }
    if (max_generation_attempts == 0) {
        return Result<KeysConfig, KeyFailure>::Err(
            KeyFailure::InvalidFormat("max_generation_attempts must be at least 1"));
    }

    return Result<KeysConfig, KeyFailure>::Ok(KeysConfig(
        std::move(secret_key_prefix),
        std::move(public_key_prefix),
        max_generation_attempts));
}

} // namespace nostrkeys::configuration
