#include "selfcrypt/crypto/hash.hpp"
#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <cctype>
#include <stdexcept>

namespace selfcrypt::crypto {

struct Blake2bHasher::Impl {
    crypto_generichash_state state;
    bool has_key;
    Blake2bKey key;
};

Blake2bHasher::Blake2bHasher() 
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
    impl_->has_key = false;
}

Blake2bHasher::~Blake2bHasher() {
    sodium_memzero(impl_->key.data(), impl_->key.size());
}

CryptoResult Blake2bHasher::initialize(const Blake2bKey* key) {
    if (key) {
        impl_->key = *key;
        impl_->has_key = true;
        
        if (crypto_generichash_init(&impl_->state, impl_->key.data(), impl_->key.size(), BLAKE2B_HASH_SIZE) != 0) {
            return CryptoResult(CryptoError::INVALID_KEY, "Failed to initialize keyed BLAKE2b hasher");
        }
    } else {
        impl_->has_key = false;
        
        if (crypto_generichash_init(&impl_->state, nullptr, 0, BLAKE2B_HASH_SIZE) != 0) {
            return CryptoResult(CryptoError::INVALID_STATE, "Failed to initialize BLAKE2b hasher");
        }
    }
    
    initialized_ = true;
    return CryptoResult();
}

CryptoResult Blake2bHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Failed to update hash");
    }
    
    return CryptoResult();
}

CryptoResult Blake2bHasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (output.size() < BLAKE2B_HASH_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer too small");
    }
    
    if (crypto_generichash_final(&impl_->state, output.data(), BLAKE2B_HASH_SIZE) != 0) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

Blake2bHash Blake2bHasher::finalize() {
    Blake2bHash result;
    auto crypto_result = finalize(std::span(result));
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to finalize hash: " + crypto_result.message);
    }
    return result;
}

void Blake2bHasher::reset() {
    initialized_ = false;
    auto result = initialize(impl_->has_key ? &impl_->key : nullptr);
    if (!result.success()) {
        throw std::runtime_error("Failed to reset hasher: " + result.message);
    }
}

Blake2bHash Blake2bHasher::hash(std::span<const std::uint8_t> data) {
    Blake2bHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

Blake2bHash Blake2bHasher::hash_keyed(const Blake2bKey& key, std::span<const std::uint8_t> data) {
    Blake2bHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), key.data(), key.size());
    return result;
}

namespace hash_utils {

Blake2bHash hash_string(const std::string& str) {
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
    return Blake2bHasher::hash(data);
}

Blake2bHash hash_with_context(const Blake2bKey& key,
                              const std::string& context,
                              std::span<const std::uint8_t> data) {
    Blake2bHasher hasher;
    auto result = hasher.initialize(&key);
    if (!result.success()) {
        throw std::runtime_error("Failed to initialize context hasher: " + result.message);
    }
    
    std::span<const std::uint8_t> context_data(reinterpret_cast<const std::uint8_t*>(context.data()), context.size());
    hasher.update(context_data);
    hasher.update(data);
    
    return hasher.finalize();
}

bool verify_hash(std::span<const std::uint8_t> data, const Blake2bHash& expected_hash) {
    auto computed_hash = Blake2bHasher::hash(data);
    return sodium_memcmp(computed_hash.data(), expected_hash.data(), BLAKE2B_HASH_SIZE) == 0;
}

std::string hash_to_hex(const Blake2bHash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<Blake2bHash> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != BLAKE2B_HASH_SIZE * 2) {
        return std::nullopt;
    }
    
    Blake2bHash hash;
    for (size_t i = 0; i < BLAKE2B_HASH_SIZE; ++i) {
        std::string byte_str = hex_string.substr(i * 2, 2);
        if (!std::isxdigit(static_cast<unsigned char>(byte_str[0])) ||
            !std::isxdigit(static_cast<unsigned char>(byte_str[1]))) {
            return std::nullopt;
        }
        hash[i] = static_cast<std::uint8_t>(std::stoul(byte_str, nullptr, 16));
    }
    
    return hash;
}

}

}
