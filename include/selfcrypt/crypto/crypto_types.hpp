#pragma once

#include <array>
#include <string>
#include <cstdint>
#include <cstring>
#include <utility>

namespace selfcrypt::crypto {

constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_NONCE_SIZE = 12;

constexpr size_t POLY1305_TAG_SIZE = 16;
constexpr size_t AEAD_TAG_SIZE = POLY1305_TAG_SIZE;

constexpr size_t BLAKE2B_HASH_SIZE = 32;
constexpr size_t BLAKE2B_KEY_SIZE = 32;

using ChaCha20Key = std::array<std::uint8_t, CHACHA20_KEY_SIZE>;
using ChaCha20Nonce = std::array<std::uint8_t, CHACHA20_NONCE_SIZE>;

using Blake2bHash = std::array<std::uint8_t, BLAKE2B_HASH_SIZE>;
using Blake2bKey = std::array<std::uint8_t, BLAKE2B_KEY_SIZE>;

// Lets hashes key unordered containers; the digest is already uniform.
struct Blake2bHashKey {
    size_t operator()(const Blake2bHash& hash) const noexcept {
        size_t value;
        std::memcpy(&value, hash.data(), sizeof(value));
        return value;
    }
};

// Error types for crypto operations
enum class CryptoError {
    SUCCESS = 0,
    INVALID_KEY,
    ENCRYPTION_FAILED,
    DECRYPTION_FAILED,
    BUFFER_TOO_SMALL,
    VERIFICATION_FAILED,
    RANDOM_GENERATION_FAILED,
    INVALID_STATE
};

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
