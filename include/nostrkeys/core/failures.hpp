#pragma once
#include <string>
#include <string_view>
#include <utility>
namespace nostrkeys {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    InvalidOperation
};
enum class KeyFailureType {
    InvalidFormat,
    InvalidChecksum,
    InvalidScalar,
    InvalidPublicKey,
    PublicKeyOnly,
    EntropyUnavailable,
    SecureMemory,
    Backend
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
/// Failure reported by every key parsing, encoding and generation entry point.
///
/// The type is what callers branch on; the message is for diagnostics only.
class KeyFailure {
public:
    KeyFailureType type;
    std::string message;
    KeyFailure(const KeyFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static KeyFailure InvalidFormat(std::string msg) {
        return {KeyFailureType::InvalidFormat, std::move(msg)};
    }
    static KeyFailure InvalidChecksum(std::string msg) {
        return {KeyFailureType::InvalidChecksum, std::move(msg)};
    }
    static KeyFailure InvalidScalar(std::string msg) {
        return {KeyFailureType::InvalidScalar, std::move(msg)};
    }
    static KeyFailure InvalidPublicKey(std::string msg) {
        return {KeyFailureType::InvalidPublicKey, std::move(msg)};
    }
    static KeyFailure PublicKeyOnly(std::string msg) {
        return {KeyFailureType::PublicKeyOnly, std::move(msg)};
    }
    static KeyFailure EntropyUnavailable(std::string msg) {
        return {KeyFailureType::EntropyUnavailable, std::move(msg)};
    }
    static KeyFailure SecureMemory(std::string msg) {
        return {KeyFailureType::SecureMemory, std::move(msg)};
    }
    static KeyFailure Backend(std::string msg) {
        return {KeyFailureType::Backend, std::move(msg)};
    }
    static KeyFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return Backend(sf.message);
        }
        return SecureMemory(sf.message);
    }
};
[[nodiscard]] constexpr std::string_view KeyFailureTypeName(const KeyFailureType type) noexcept {
    switch (type) {
        case KeyFailureType::InvalidFormat: return "InvalidFormat";
        case KeyFailureType::InvalidChecksum: return "InvalidChecksum";
        case KeyFailureType::InvalidScalar: return "InvalidScalar";
        case KeyFailureType::InvalidPublicKey: return "InvalidPublicKey";
        case KeyFailureType::PublicKeyOnly: return "PublicKeyOnly";
        case KeyFailureType::EntropyUnavailable: return "EntropyUnavailable";
        case KeyFailureType::SecureMemory: return "SecureMemory";
        case KeyFailureType::Backend: return "Backend";
    }
    return "Unknown";
}
}
