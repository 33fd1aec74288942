#include "selfcrypt/crypto/encryption.hpp"
#include <sodium.h>
#include <stdexcept>

namespace selfcrypt::crypto {

struct EncryptionEngine::Impl {
    bool initialized = false;
    
    Impl() {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium for encryption");
        }
        initialized = true;
    }
};

EncryptionEngine::EncryptionEngine() 
    : impl_(std::make_unique<Impl>()) {
}

EncryptionEngine::~EncryptionEngine() = default;

CryptoResult EncryptionEngine::encrypt(
    std::span<const std::uint8_t> plaintext,
    std::span<const std::uint8_t> additional_data,
    const ChaCha20Key& key,
    const ChaCha20Nonce& nonce,
    std::vector<std::uint8_t>& out_sealed) const {
    
    if (!impl_->initialized) {
        return CryptoResult(CryptoError::ENCRYPTION_FAILED, "Encryption engine not initialized");
    }
    
    if (plaintext.empty()) {
        return CryptoResult(CryptoError::ENCRYPTION_FAILED, "Plaintext cannot be empty");
    }
    
    out_sealed.resize(sealed_size(plaintext.size()));
    unsigned long long sealed_len = 0;
    
    int result = crypto_aead_chacha20poly1305_ietf_encrypt(
        out_sealed.data(),
        &sealed_len,
        plaintext.data(),
        plaintext.size(),
        additional_data.data(),
        additional_data.size(),
        nullptr,  // nsec (not used)
        nonce.data(),
        key.data()
    );
    
    if (result != 0) {
        out_sealed.clear();
        return CryptoResult(CryptoError::ENCRYPTION_FAILED, "ChaCha20-Poly1305 encryption failed");
    }
    
    out_sealed.resize(static_cast<size_t>(sealed_len));
    return CryptoResult();
}

CryptoResult EncryptionEngine::decrypt(
    std::span<const std::uint8_t> sealed,
    std::span<const std::uint8_t> additional_data,
    const ChaCha20Key& key,
    const ChaCha20Nonce& nonce,
    std::vector<std::uint8_t>& out_plaintext) const {
    
    if (!impl_->initialized) {
        return CryptoResult(CryptoError::DECRYPTION_FAILED, "Encryption engine not initialized");
    }
    
    if (sealed.size() <= AEAD_TAG_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Sealed buffer shorter than authentication tag");
    }
    
    out_plaintext.resize(sealed.size() - AEAD_TAG_SIZE);
    unsigned long long plaintext_len = 0;
    
    int result = crypto_aead_chacha20poly1305_ietf_decrypt(
        out_plaintext.data(),
        &plaintext_len,
        nullptr,  // nsec (not used)
        sealed.data(),
        sealed.size(),
        additional_data.data(),
        additional_data.size(),
        nonce.data(),
        key.data()
    );
    
    if (result != 0) {
        sodium_memzero(out_plaintext.data(), out_plaintext.size());
        out_plaintext.clear();
        return CryptoResult(CryptoError::DECRYPTION_FAILED, "ChaCha20-Poly1305 authentication failed");
    }
    
    out_plaintext.resize(static_cast<size_t>(plaintext_len));
    return CryptoResult();
}

}
