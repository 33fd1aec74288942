#pragma once

#include "selfcrypt/core/result.hpp"
#include "selfcrypt/storage/chunk.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace selfcrypt::storage {

// Boundary to the content-addressed store. Implementations report
// NOT_FOUND, TIMEOUT, UNAVAILABLE, PERMISSION_DENIED, QUOTA_EXCEEDED or
// STORAGE_IO and must be safe to call from several threads at once.
// Puts are idempotent: storing an address twice is not an error.
class ChunkStore {
public:
    virtual ~ChunkStore() = default;
    
    virtual core::Result put(const Address& address, std::span<const std::uint8_t> data) = 0;
    virtual core::Result get(const Address& address, std::vector<std::uint8_t>& out_data) = 0;
    virtual core::Result contains(const Address& address, bool& out_exists) = 0;
};

}
