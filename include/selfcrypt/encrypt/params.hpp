#pragma once

#include "selfcrypt/storage/chunker.hpp"
#include <cstdint>

namespace selfcrypt::encrypt {

struct SelfEncryptionParams {
    static constexpr std::uint64_t DEFAULT_MAX_INLINE_MAP_BYTES = 32 * 1024;
    static constexpr std::uint32_t DEFAULT_MAX_MAP_DEPTH = 8;
    
    storage::ChunkingPolicy chunking;
    
    // Serialized maps above this size are themselves self-encrypted
    std::uint64_t max_inline_map_bytes = DEFAULT_MAX_INLINE_MAP_BYTES;
    std::uint32_t max_map_depth = DEFAULT_MAX_MAP_DEPTH;
    
    bool validate() const {
        return chunking.validate() && max_inline_map_bytes > 0 && max_map_depth > 0;
    }
};

}
