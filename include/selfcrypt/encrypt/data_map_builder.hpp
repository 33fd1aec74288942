#pragma once

#include "selfcrypt/core/result.hpp"
#include "selfcrypt/encrypt/params.hpp"
#include "selfcrypt/storage/chunker.hpp"
#include "selfcrypt/storage/data_map.hpp"
#include <functional>
#include <span>
#include <vector>

namespace selfcrypt::encrypt {

class DataMapBuilder {
public:
    // Chunks, self-encrypts and stores a buffer, producing its descriptors
    using StoreFunction = std::function<core::Result(std::span<const std::uint8_t> plaintext,
                                                     std::vector<storage::ChunkDescriptor>& out_descriptors)>;
    
    DataMapBuilder(SelfEncryptionParams params, StoreFunction store);
    
    // Assembles the level-0 map and shrinks it until it is small enough to
    // hand back to the caller
    core::Result build(std::vector<storage::ChunkDescriptor> descriptors,
                       std::uint64_t total_size,
                       const crypto::Blake2bHash& checksum,
                       storage::DataMap& out_map) const;
    
    // Replaces `map` by indirect maps while its serialized form is above
    // max_inline_map_bytes and another level still makes it smaller
    core::Result shrink(storage::DataMap& map) const;

private:
    SelfEncryptionParams params_;
    storage::Chunker chunker_;
    StoreFunction store_;
};

}
