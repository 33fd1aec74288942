#include "selfcrypt/storage/sqlite_chunk_store.hpp"
#include "selfcrypt/core/logger.hpp"
#include <sqlite3.h>
#include <chrono>

namespace selfcrypt::storage {

SqliteChunkStore::SqliteChunkStore(const std::filesystem::path& db_path) 
    : db_path_(db_path), db_(nullptr) {
}

SqliteChunkStore::~SqliteChunkStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

core::Result SqliteChunkStore::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    
    if (db_) {
        return core::Result();
    }
    
    int result = sqlite3_open_v2(db_path_.string().c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
    if (result != SQLITE_OK) {
        auto failure = sqlite_failure("open " + db_path_.string());
        sqlite3_close(db_);
        db_ = nullptr;
        return failure;
    }
    
    sqlite3_busy_timeout(db_, 5000);
    
    if (!create_tables()) {
        auto failure = sqlite_failure("create chunk table");
        sqlite3_close(db_);
        db_ = nullptr;
        return failure;
    }
    
    LOG_INFO("SQLite chunk store opened at {}", db_path_.string());
    return core::Result();
}

bool SqliteChunkStore::create_tables() {
    const char* create_chunks_table = R"(
        CREATE TABLE IF NOT EXISTS chunks (
            address BLOB PRIMARY KEY,
            data BLOB NOT NULL,
            size INTEGER NOT NULL,
            stored_at INTEGER NOT NULL
        );
    )";
    
    char* error_msg = nullptr;
    
    int result = sqlite3_exec(db_, create_chunks_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create chunks table: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }
    
    return true;
}

core::Result SqliteChunkStore::sqlite_failure(const std::string& what) const {
    int code = db_ ? sqlite3_errcode(db_) : SQLITE_CANTOPEN;
    std::string message = "SQLite " + what + " failed: " + (db_ ? sqlite3_errmsg(db_) : "no database");
    
    switch (code) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return core::Result(core::ErrorCode::UNAVAILABLE, message);
        case SQLITE_FULL:
            return core::Result(core::ErrorCode::QUOTA_EXCEEDED, message);
        case SQLITE_READONLY:
        case SQLITE_PERM:
        case SQLITE_AUTH:
            return core::Result(core::ErrorCode::PERMISSION_DENIED, message);
        default:
            return core::Result(core::ErrorCode::STORAGE_IO, message);
    }
}

core::Result SqliteChunkStore::put(const Address& address, std::span<const std::uint8_t> data) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return core::Result(core::ErrorCode::UNAVAILABLE, "SQLite chunk store not initialized");
    }
    
    const char* insert_chunk_sql = R"(
        INSERT OR IGNORE INTO chunks (address, data, size, stored_at)
        VALUES (?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, insert_chunk_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return sqlite_failure("prepare insert");
    }
    
    auto stored_at = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    
    sqlite3_bind_blob(stmt, 1, address.data(), static_cast<int>(address.size()), SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 2, data.data(), static_cast<int>(data.size()), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(data.size()));
    sqlite3_bind_int64(stmt, 4, stored_at);
    
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return sqlite_failure("insert chunk " + to_hex(address));
    }
    
    return core::Result();
}

core::Result SqliteChunkStore::get(const Address& address, std::vector<std::uint8_t>& out_data) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return core::Result(core::ErrorCode::UNAVAILABLE, "SQLite chunk store not initialized");
    }
    
    const char* select_chunk_sql = "SELECT data FROM chunks WHERE address = ?;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, select_chunk_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return sqlite_failure("prepare select");
    }
    
    sqlite3_bind_blob(stmt, 1, address.data(), static_cast<int>(address.size()), SQLITE_STATIC);
    
    result = sqlite3_step(stmt);
    if (result == SQLITE_ROW) {
        auto blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, 0));
        auto size = sqlite3_column_bytes(stmt, 0);
        out_data.assign(blob, blob + size);
        sqlite3_finalize(stmt);
        return core::Result();
    }
    
    sqlite3_finalize(stmt);
    
    if (result == SQLITE_DONE) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Chunk " + to_hex(address) + " not stored");
    }
    return sqlite_failure("select chunk " + to_hex(address));
}

core::Result SqliteChunkStore::contains(const Address& address, bool& out_exists) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return core::Result(core::ErrorCode::UNAVAILABLE, "SQLite chunk store not initialized");
    }
    
    const char* exists_sql = "SELECT 1 FROM chunks WHERE address = ? LIMIT 1;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, exists_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return sqlite_failure("prepare exists");
    }
    
    sqlite3_bind_blob(stmt, 1, address.data(), static_cast<int>(address.size()), SQLITE_STATIC);
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_ROW && result != SQLITE_DONE) {
        return sqlite_failure("exists check");
    }
    
    out_exists = result == SQLITE_ROW;
    return core::Result();
}

size_t SqliteChunkStore::get_chunk_count() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return 0;
    }
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM chunks;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    
    sqlite3_finalize(stmt);
    return count;
}

std::uint64_t SqliteChunkStore::get_total_size() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return 0;
    }
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COALESCE(SUM(size), 0) FROM chunks;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    
    std::uint64_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0));
    }
    
    sqlite3_finalize(stmt);
    return total;
}

bool SqliteChunkStore::vacuum_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return false;
    }
    
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, "VACUUM;", nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

}
