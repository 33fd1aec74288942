#pragma once

#include "selfcrypt/crypto/crypto_types.hpp"
#include <memory>
#include <span>
#include <vector>

namespace selfcrypt::crypto {

// ChaCha20-Poly1305 (IETF) AEAD. Sealed output is ciphertext || tag.
class EncryptionEngine {
public:
    EncryptionEngine();
    ~EncryptionEngine();
    
    EncryptionEngine(const EncryptionEngine&) = delete;
    EncryptionEngine& operator=(const EncryptionEngine&) = delete;
    
    CryptoResult encrypt(
        std::span<const std::uint8_t> plaintext,
        std::span<const std::uint8_t> additional_data,
        const ChaCha20Key& key,
        const ChaCha20Nonce& nonce,
        std::vector<std::uint8_t>& out_sealed
    ) const;
    
    CryptoResult decrypt(
        std::span<const std::uint8_t> sealed,
        std::span<const std::uint8_t> additional_data,
        const ChaCha20Key& key,
        const ChaCha20Nonce& nonce,
        std::vector<std::uint8_t>& out_plaintext
    ) const;
    
    static constexpr size_t sealed_size(size_t plaintext_size) {
        return plaintext_size + AEAD_TAG_SIZE;
    }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
