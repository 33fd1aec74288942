#pragma once

#include "selfcrypt/crypto/crypto_types.hpp"
#include <atomic>
#include <cstdint>
#include <span>

namespace selfcrypt::crypto {

class SecureRandom {
public:
    static bool initialize();
    
    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    
    // Uniform in [0, upper_bound)
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);

private:
    static std::atomic<bool> initialized_;
};

}
