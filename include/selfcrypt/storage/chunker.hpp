#pragma once

#include "selfcrypt/core/result.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace selfcrypt::storage {

struct ChunkingPolicy {
    static constexpr std::uint32_t DEFAULT_MAX_CHUNK_SIZE = 1024 * 1024; // 1MB
    static constexpr std::uint32_t DEFAULT_MIN_CHUNK_SIZE = 1024;        // 1KB
    static constexpr std::uint32_t MIN_CHUNK_COUNT = 3;
    
    std::uint32_t max_chunk_size = DEFAULT_MAX_CHUNK_SIZE;
    std::uint32_t min_chunk_size = DEFAULT_MIN_CHUNK_SIZE;
    
    // Below this the data is kept inline in the data map
    std::uint64_t min_encryptable_bytes() const {
        return static_cast<std::uint64_t>(MIN_CHUNK_COUNT) * min_chunk_size;
    }
    
    // A three-chunk split hands the division remainder to the last chunk,
    // which can then exceed max_chunk_size by up to MIN_CHUNK_COUNT - 1 bytes
    std::uint64_t largest_chunk_size() const {
        return static_cast<std::uint64_t>(max_chunk_size) + (MIN_CHUNK_COUNT - 1);
    }
    
    bool validate() const;
};

struct ChunkSpan {
    std::uint32_t index;
    std::uint64_t offset;
    std::uint64_t size;
};

class Chunker {
public:
    explicit Chunker(ChunkingPolicy policy = {});
    
    bool is_inline_size(std::uint64_t total_size) const;
    
    std::uint32_t chunk_count(std::uint64_t total_size) const;
    std::uint64_t chunk_size(std::uint64_t total_size, std::uint32_t chunk_index) const;
    
    // Chunk boundaries; empty when the size takes the inline path
    std::vector<ChunkSpan> plan(std::uint64_t total_size) const;
    
    core::Result split(std::span<const std::uint8_t> data,
                       std::vector<std::vector<std::uint8_t>>& out_chunks) const;
    
    const ChunkingPolicy& policy() const { return policy_; }

private:
    ChunkingPolicy policy_;
};

}
