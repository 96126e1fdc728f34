#pragma once
#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"
#include "nostrkeys/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <type_traits>
namespace nostrkeys::models {
/// secp256k1 secret scalar held in guarded memory.
///
/// Every instance holds a scalar in [1, n). Move-only: duplicating secret
/// material goes through Clone(). A moved-from SecretKey holds nothing and
/// every accessor on it fails.
class SecretKey {
public:
    [[nodiscard]] static Result<SecretKey, KeyFailure> FromBytes(std::span<const uint8_t> bytes);
    /// Takes ownership of a handle that already holds the scalar bytes.
    [[nodiscard]] static Result<SecretKey, KeyFailure> FromHandle(crypto::SecureMemoryHandle handle);
    SecretKey(SecretKey&&) noexcept = default;
    SecretKey& operator=(SecretKey&&) noexcept = default;
    SecretKey(const SecretKey&) = delete;
    SecretKey& operator=(const SecretKey&) = delete;
    [[nodiscard]] Result<SecretKey, KeyFailure> Clone() const;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetHandle() const noexcept {
        return handle_;
    }
    template<typename F>
    [[nodiscard]] auto WithBytes(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, KeyFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        auto access = handle_.WithReadAccess(std::forward<F>(func));
        if (access.IsErr()) {
            return Result<T, KeyFailure>::Err(KeyFailure::FromSodiumFailure(access.UnwrapErr()));
        }
        return Result<T, KeyFailure>::Ok(std::move(access).Unwrap());
    }
    /// Constant-time comparison of the scalars.
    [[nodiscard]] bool operator==(const SecretKey& other) const;
    [[nodiscard]] bool operator!=(const SecretKey& other) const {
        return !(*this == other);
    }
private:
    explicit SecretKey(crypto::SecureMemoryHandle handle) noexcept;
    crypto::SecureMemoryHandle handle_;
};
}
