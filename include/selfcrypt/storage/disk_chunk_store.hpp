#pragma once

#include "selfcrypt/storage/chunk_store.hpp"
#include "selfcrypt/storage/storage_config.hpp"
#include <atomic>
#include <filesystem>
#include <mutex>

namespace selfcrypt::storage {

// One file per chunk under <chunk_directory>/<hex[0:2]>/<hex>
class DiskChunkStore : public ChunkStore {
public:
    explicit DiskChunkStore(const StorageConfig& config);
    
    // Creates the directory tree and tallies what is already stored
    core::Result initialize();
    
    core::Result put(const Address& address, std::span<const std::uint8_t> data) override;
    core::Result get(const Address& address, std::vector<std::uint8_t>& out_data) override;
    core::Result contains(const Address& address, bool& out_exists) override;
    
    std::uint64_t used_bytes() const;
    
    std::filesystem::path get_chunk_path(const Address& address) const;

private:
    StorageConfig config_;
    mutable std::mutex usage_mutex_;
    std::uint64_t used_bytes_ = 0;
    std::atomic<std::uint64_t> temp_counter_{0};
};

}
