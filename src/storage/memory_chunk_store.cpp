#include "selfcrypt/storage/memory_chunk_store.hpp"

namespace selfcrypt::storage {

core::Result MemoryChunkStore::put(const Address& address, std::span<const std::uint8_t> data) {
    put_calls_++;
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = chunks_.try_emplace(address, data.begin(), data.end());
    if (inserted) {
        stored_bytes_ += it->second.size();
    }
    return core::Result();
}

core::Result MemoryChunkStore::get(const Address& address, std::vector<std::uint8_t>& out_data) {
    get_calls_++;
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(address);
    if (it == chunks_.end()) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Chunk " + to_hex(address) + " not stored");
    }
    out_data = it->second;
    return core::Result();
}

core::Result MemoryChunkStore::contains(const Address& address, bool& out_exists) {
    contains_calls_++;
    
    std::lock_guard<std::mutex> lock(mutex_);
    out_exists = chunks_.find(address) != chunks_.end();
    return core::Result();
}

size_t MemoryChunkStore::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

std::uint64_t MemoryChunkStore::stored_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_bytes_;
}

void MemoryChunkStore::reset_counters() {
    put_calls_ = 0;
    get_calls_ = 0;
    contains_calls_ = 0;
}

}
