#pragma once

#include "selfcrypt/storage/chunk_store.hpp"
#include <atomic>
#include <mutex>
#include <unordered_map>

namespace selfcrypt::storage {

class MemoryChunkStore : public ChunkStore {
public:
    MemoryChunkStore() = default;
    
    core::Result put(const Address& address, std::span<const std::uint8_t> data) override;
    core::Result get(const Address& address, std::vector<std::uint8_t>& out_data) override;
    core::Result contains(const Address& address, bool& out_exists) override;
    
    size_t chunk_count() const;
    std::uint64_t stored_bytes() const;
    
    std::uint64_t put_calls() const { return put_calls_.load(); }
    std::uint64_t get_calls() const { return get_calls_.load(); }
    std::uint64_t contains_calls() const { return contains_calls_.load(); }
    
    void reset_counters();

private:
    mutable std::mutex mutex_;
    std::unordered_map<Address, std::vector<std::uint8_t>, AddressKey> chunks_;
    std::uint64_t stored_bytes_ = 0;
    
    std::atomic<std::uint64_t> put_calls_{0};
    std::atomic<std::uint64_t> get_calls_{0};
    std::atomic<std::uint64_t> contains_calls_{0};
};

}
