#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace nostrkeys {
struct Constants {
    static constexpr size_t SECRET_KEY_SIZE = 32;
    static constexpr size_t XONLY_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t COMPRESSED_PUBLIC_KEY_SIZE = 33;
    static constexpr size_t SECRET_KEY_HEX_LENGTH = SECRET_KEY_SIZE * 2;
    static constexpr size_t XONLY_PUBLIC_KEY_HEX_LENGTH = XONLY_PUBLIC_KEY_SIZE * 2;
    static constexpr size_t COMPRESSED_PUBLIC_KEY_HEX_LENGTH = COMPRESSED_PUBLIC_KEY_SIZE * 2;
    static constexpr uint8_t COMPRESSED_EVEN_PREFIX = 0x02;
    static constexpr uint8_t COMPRESSED_ODD_PREFIX = 0x03;
    static constexpr std::string_view DEFAULT_SECRET_KEY_PREFIX = "nsec";
    static constexpr std::string_view DEFAULT_PUBLIC_KEY_PREFIX = "npub";
    static constexpr uint32_t DEFAULT_MAX_GENERATION_ATTEMPTS = 128;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t SECP256K1_CONTEXT_SEED_SIZE = 32;
};
struct Bech32Constants {
    static constexpr std::string_view CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
    static constexpr char SEPARATOR = '1';
    static constexpr size_t CHECKSUM_LENGTH = 6;
    static constexpr size_t MAX_LENGTH = 90;
    static constexpr size_t MIN_HRP_LENGTH = 1;
    static constexpr size_t MAX_HRP_LENGTH = 83;
    static constexpr char MIN_HRP_CHAR = 33;
    static constexpr char MAX_HRP_CHAR = 126;
    static constexpr uint32_t CHECKSUM_CONSTANT = 1;
    static constexpr std::array<uint32_t, 5> GENERATOR = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
    };
    static constexpr unsigned BITS_PER_BYTE = 8;
    static constexpr unsigned BITS_PER_CHAR = 5;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view SECP256K1_CONTEXT_FAILED = "Failed to create secp256k1 context";
    static constexpr std::string_view SCALAR_OUT_OF_RANGE = "Secret key scalar is zero or not below the curve order";
    static constexpr std::string_view POINT_NOT_ON_CURVE = "Public key is not a valid secp256k1 point";
    static constexpr std::string_view PUBLIC_KEY_WHERE_SECRET_EXPECTED = "Public key supplied where a secret key is expected";
    static constexpr std::string_view SECRET_KEY_WHERE_PUBLIC_EXPECTED = "Secret key supplied where a public key is expected";
    static constexpr std::string_view KEYPAIR_NEEDS_SECRET = "A keypair requires a secret key, but only a public key was supplied";
    static constexpr std::string_view BECH32_CHECKSUM_MISMATCH = "Bech32 checksum mismatch";
    static constexpr std::string_view BECH32_MIXED_CASE = "Bech32 string mixes upper and lower case";
    static constexpr std::string_view BECH32_NO_SEPARATOR = "Bech32 string has no separator or an empty prefix";
    static constexpr std::string_view BECH32_BAD_PADDING = "Bech32 payload has invalid padding";
    static constexpr std::string_view ENTROPY_EXHAUSTED = "Entropy source did not produce a valid scalar";
};
}
