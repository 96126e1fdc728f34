#pragma once

/**
 * @file key_logger.hpp
 * @brief Diagnostic logging for key generation and parsing.
 *
 * Compiled in only with NOSTRKEYS_DEBUG_KEYS (CMake: -DNOSTRKEYS_DEBUG_KEYS=ON).
 * Public keys are printed in full. Secret keys are never printed; only an
 * 8-byte BLAKE2b fingerprint of them is, so two log lines can be matched
 * to the same key.
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

#ifdef NOSTRKEYS_DEBUG_KEYS
#include "nostrkeys/encoding/hex.hpp"
#include <sodium.h>
#include <array>
#endif

namespace nostrkeys::debug {

#ifdef NOSTRKEYS_DEBUG_KEYS

inline std::string Fingerprint(std::span<const uint8_t> secret) {
    std::array<uint8_t, 8> digest{};
    crypto_generichash(digest.data(), digest.size(), secret.data(), secret.size(), nullptr, 0);
    return "fp:" + ::nostrkeys::encoding::ToHex(digest);
}

// ============================================================================
// Core logging macros
// ============================================================================

#define NOSTRKEYS_LOG_KEY(operation, key_name, data) \
    do { \
        fprintf(stdout, "[NOSTRKEYS-DEBUG] %s %s: %s\n", \
            operation, \
            key_name, \
            ::nostrkeys::encoding::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define NOSTRKEYS_LOG_SECRET(operation, key_name, data) \
    do { \
        fprintf(stdout, "[NOSTRKEYS-DEBUG] %s %s: %s\n", \
            operation, \
            key_name, \
            ::nostrkeys::debug::Fingerprint(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define NOSTRKEYS_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[NOSTRKEYS-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define NOSTRKEYS_LOG_MSG(operation, message) \
    do { \
        fprintf(stdout, "[NOSTRKEYS-DEBUG] %s %s\n", \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Generation
// ============================================================================

inline void LogEntropyRejected(uint32_t attempt) {
    NOSTRKEYS_LOG_VALUE("GENERATE", "rejected_scalar_attempt", attempt);
}

inline void LogKeypairGenerated(
    std::span<const uint8_t> secret_key,
    std::span<const uint8_t> public_key,
    uint32_t attempts) {

    NOSTRKEYS_LOG_SECRET("GENERATE", "secret_key", secret_key);
    NOSTRKEYS_LOG_KEY("GENERATE", "public_key", public_key);
    NOSTRKEYS_LOG_VALUE("GENERATE", "attempts", attempts);
}

// ============================================================================
// Parsing
// ============================================================================

inline void LogParseSucceeded(std::string_view what, std::string_view format) {
    NOSTRKEYS_LOG_MSG("PARSE", std::string(what) + " from " + std::string(format));
}

inline void LogParseFailed(
    std::string_view what,
    std::string_view failure_type,
    std::string_view message) {

    NOSTRKEYS_LOG_MSG("PARSE",
        std::string(what) + " rejected (" + std::string(failure_type) + "): " + std::string(message));
}

#else // !NOSTRKEYS_DEBUG_KEYS

#define NOSTRKEYS_LOG_KEY(operation, key_name, data) ((void)0)
#define NOSTRKEYS_LOG_SECRET(operation, key_name, data) ((void)0)
#define NOSTRKEYS_LOG_VALUE(operation, name, value) ((void)0)
#define NOSTRKEYS_LOG_MSG(operation, message) ((void)0)

inline void LogEntropyRejected(uint32_t) {}
inline void LogKeypairGenerated(std::span<const uint8_t>, std::span<const uint8_t>, uint32_t) {}
inline void LogParseSucceeded(std::string_view, std::string_view) {}
inline void LogParseFailed(std::string_view, std::string_view, std::string_view) {}

#endif // NOSTRKEYS_DEBUG_KEYS

} // namespace nostrkeys::debug
