#pragma once

#include "selfcrypt/crypto/crypto_types.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace selfcrypt::storage {

// Content address: BLAKE2b-256 of a chunk's ciphertext
using Address = crypto::Blake2bHash;
using AddressKey = crypto::Blake2bHashKey;

struct Chunk {
    Address address{};
    std::vector<std::uint8_t> data;
    
    Chunk() = default;
    Chunk(const Address& addr, std::vector<std::uint8_t> bytes)
        : address(addr), data(std::move(bytes)) {}
    
    // Builds a chunk whose address is computed from its bytes
    static Chunk from_ciphertext(std::vector<std::uint8_t> bytes);
    
    bool verify() const;
    size_t size() const { return data.size(); }
};

std::string to_hex(const Address& address);

}
