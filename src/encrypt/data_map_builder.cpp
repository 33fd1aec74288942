#include "selfcrypt/encrypt/data_map_builder.hpp"
#include "selfcrypt/core/logger.hpp"
#include "selfcrypt/crypto/hash.hpp"
#include <string>

namespace selfcrypt::encrypt {

DataMapBuilder::DataMapBuilder(SelfEncryptionParams params, StoreFunction store)
    : params_(params)
    , chunker_(params.chunking)
    , store_(std::move(store)) {
}

core::Result DataMapBuilder::build(std::vector<storage::ChunkDescriptor> descriptors,
                                   std::uint64_t total_size,
                                   const crypto::Blake2bHash& checksum,
                                   storage::DataMap& out_map) const {
    storage::DataMap map;
    map.level = 0;
    map.total_size = total_size;
    map.checksum = checksum;
    map.chunks = std::move(descriptors);
    
    auto result = map.validate(params_.chunking);
    if (!result) {
        return result;
    }
    
    result = shrink(map);
    if (!result) {
        return result;
    }
    
    out_map = std::move(map);
    return core::Result();
}

core::Result DataMapBuilder::shrink(storage::DataMap& map) const {
    while (map.serialized_size() > params_.max_inline_map_bytes) {
        auto serialized = map.serialize();
        
        if (chunker_.is_inline_size(serialized.size())) {
            break;
        }
        
        auto next_size = storage::DataMap::HEADER_SIZE +
                         chunker_.chunk_count(serialized.size()) * storage::DataMap::DESCRIPTOR_SIZE;
        if (next_size >= serialized.size()) {
            break;
        }
        
        if (map.level + 1 > params_.max_map_depth) {
            return core::Result(core::ErrorCode::RECURSION_LIMIT,
                                "Data map still " + std::to_string(serialized.size()) +
                                " bytes at depth " + std::to_string(map.level));
        }
        
        std::vector<storage::ChunkDescriptor> descriptors;
        auto result = store_(serialized, descriptors);
        if (!result) {
            return result;
        }
        
        storage::DataMap parent;
        parent.level = map.level + 1;
        parent.total_size = serialized.size();
        parent.checksum = crypto::Blake2bHasher::hash(serialized);
        parent.chunks = std::move(descriptors);
        
        LOG_DEBUG("Data map level {} ({} bytes, {} chunks) stored as {} chunks",
                  map.level, serialized.size(), map.chunk_count(), parent.chunk_count());
        
        map = std::move(parent);
    }
    
    return core::Result();
}

}
