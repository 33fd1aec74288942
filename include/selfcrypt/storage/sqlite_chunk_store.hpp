#pragma once

#include "selfcrypt/storage/chunk_store.hpp"
#include <filesystem>
#include <mutex>

struct sqlite3;

namespace selfcrypt::storage {

// Keeps every chunk as a row in a single SQLite database file
class SqliteChunkStore : public ChunkStore {
public:
    explicit SqliteChunkStore(const std::filesystem::path& db_path);
    ~SqliteChunkStore() override;
    
    SqliteChunkStore(const SqliteChunkStore&) = delete;
    SqliteChunkStore& operator=(const SqliteChunkStore&) = delete;
    
    core::Result initialize();
    
    core::Result put(const Address& address, std::span<const std::uint8_t> data) override;
    core::Result get(const Address& address, std::vector<std::uint8_t>& out_data) override;
    core::Result contains(const Address& address, bool& out_exists) override;
    
    size_t get_chunk_count();
    std::uint64_t get_total_size();
    
    bool vacuum_database();

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex db_mutex_;
    
    bool create_tables();
    core::Result sqlite_failure(const std::string& what) const;
};

}
