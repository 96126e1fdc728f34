#pragma once

#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"
#include "nostrkeys/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>

namespace nostrkeys::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Owns process-wide libsodium initialization and wraps the primitives the key
 * types need: guarded allocation, wiping, constant-time comparison and the
 * system CSPRNG.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. AllocateSecure requires a successful call
     * first; SecureWipe and FillRandom make it themselves.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Uses a volatile loop for small buffers and sodium_memzero otherwise.
     * Initializes libsodium on first use.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching contents.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Fill a buffer from the libsodium CSPRNG
     *
     * @return Err if libsodium could not be initialized
     */
    static Result<Unit, SodiumFailure> FillRandom(std::span<uint8_t> buffer);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guarded memory using sodium_malloc
     *
     * @return nullptr if libsodium is not initialized or allocation failed
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace nostrkeys::crypto
