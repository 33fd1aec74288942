#include "selfcrypt/crypto/random.hpp"
#include "selfcrypt/core/logger.hpp"
#include <sodium.h>

namespace selfcrypt::crypto {

std::atomic<bool> SecureRandom::initialized_{false};

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }
    
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    initialized_ = true;
    LOG_DEBUG("Cryptographic random number generator initialized");
    return true;
}

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return CryptoResult(CryptoError::RANDOM_GENERATION_FAILED, "Random generator not initialized");
    }
    
    if (output.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer is empty");
    }
    
    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    if (upper_bound == 0) {
        return 0;
    }
    return randombytes_uniform(upper_bound);
}

}
