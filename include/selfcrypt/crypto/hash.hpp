#pragma once

#include "selfcrypt/crypto/crypto_types.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace selfcrypt::crypto {

// Incremental BLAKE2b-256 (libsodium generichash)
class Blake2bHasher {
public:
    Blake2bHasher();
    ~Blake2bHasher();
    
    Blake2bHasher(const Blake2bHasher&) = delete;
    Blake2bHasher& operator=(const Blake2bHasher&) = delete;
    
    CryptoResult initialize(const Blake2bKey* key = nullptr);
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(std::span<std::uint8_t> output);
    
    // Throws std::runtime_error if the hasher was never initialized
    Blake2bHash finalize();
    
    void reset();
    
    static Blake2bHash hash(std::span<const std::uint8_t> data);
    static Blake2bHash hash_keyed(const Blake2bKey& key, std::span<const std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

Blake2bHash hash_string(const std::string& str);

// Keyed hash of context || data, used for domain-separated derivations
Blake2bHash hash_with_context(const Blake2bKey& key,
                              const std::string& context,
                              std::span<const std::uint8_t> data);

bool verify_hash(std::span<const std::uint8_t> data, const Blake2bHash& expected_hash);

std::string hash_to_hex(const Blake2bHash& hash);
std::optional<Blake2bHash> hash_from_hex(const std::string& hex_string);

}

}
