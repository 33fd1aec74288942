#pragma once

#include "selfcrypt/core/result.hpp"
#include "selfcrypt/storage/chunk.hpp"
#include "selfcrypt/storage/chunker.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace selfcrypt::storage {

struct ChunkDescriptor {
    std::uint32_t index = 0;
    Address address{};
    
    // Hash of this chunk's plaintext. Neighbouring chunks derive their keys
    // from it, and it verifies the plaintext after decryption.
    crypto::Blake2bHash source_hash{};
    
    std::uint64_t plaintext_size = 0;
    std::uint64_t ciphertext_size = 0;
    
    bool operator==(const ChunkDescriptor& other) const = default;
};

// Everything needed to rebuild a byte stream from its chunks.
//
// Three shapes:
//  - inline:   no chunks; `content` holds the bytes directly (small data, or
//              the empty stream)
//  - direct:   level 0; the chunks reassemble into the caller's data
//  - indirect: level > 0; the chunks reassemble into the serialized DataMap
//              of level - 1
struct DataMap {
    static constexpr std::uint32_t MAGIC = 0x5343444D; // "SCDM"
    static constexpr std::uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 4 + 1 + 4 + 8 + crypto::BLAKE2B_HASH_SIZE + 4 + 4;
    static constexpr size_t DESCRIPTOR_SIZE = 4 + 2 * crypto::BLAKE2B_HASH_SIZE + 8 + 8;
    
    std::uint32_t level = 0;
    std::uint64_t total_size = 0;
    crypto::Blake2bHash checksum{};
    std::vector<ChunkDescriptor> chunks;
    std::vector<std::uint8_t> content;
    
    static DataMap make_inline(std::span<const std::uint8_t> data);
    
    bool is_inline() const { return chunks.empty(); }
    bool is_indirect() const { return level > 0; }
    size_t chunk_count() const { return chunks.size(); }
    
    // Derivation material for chunk `index`: the source hashes of its
    // cyclic predecessor and successor
    const crypto::Blake2bHash& previous_source_hash(size_t index) const;
    const crypto::Blake2bHash& next_source_hash(size_t index) const;
    
    // Byte offset of chunk `index` within the stream this map describes
    std::uint64_t chunk_offset(size_t index) const;
    
    size_t serialized_size() const;
    std::vector<std::uint8_t> serialize() const;
    static core::Result deserialize(std::span<const std::uint8_t> data,
                                    DataMap& out_map,
                                    const ChunkingPolicy& policy = {});
    
    // Structural checks shared by deserialize() and the retrieval path.
    // Chunk sizes are bounded by the policy the map was written under.
    core::Result validate(const ChunkingPolicy& policy = {}) const;
    
    bool operator==(const DataMap& other) const = default;
};

}
