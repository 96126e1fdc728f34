#pragma once

#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace nostrkeys::crypto {

/**
 * @brief RAII wrapper for libsodium guarded memory
 *
 * Memory comes from sodium_malloc: guard pages on both sides, locked in RAM,
 * zeroed on free. Move-only; Clone() is the only way to duplicate contents.
 *
 * @code
 * auto handle = SecureMemoryHandle::Allocate(32);
 * if (handle.IsOk()) {
 *     auto owned = std::move(handle).Unwrap();
 *     owned.Write(bytes);
 * }
 * @endcode
 */
class SecureMemoryHandle {
public:
    /**
     * @brief Allocate guarded memory
     *
     * @return Err if libsodium is not initialized, size is zero or the
     *         allocation fails
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Allocate a new handle of the same size holding the same bytes
     */
    Result<SecureMemoryHandle, SodiumFailure> Clone() const;

    /**
     * @brief Write data into the handle; unused trailing bytes are zeroed
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Run func over the guarded bytes without copying them out
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<uint8_t> secure_span(
            static_cast<uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace nostrkeys::crypto
