#include "selfcrypt/storage/storage_config.hpp"
#include "selfcrypt/core/config.hpp"

namespace selfcrypt::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

StorageConfig StorageConfig::from_config(const core::Config& config) {
    StorageConfig storage(config.get_string("storage.root", "selfcrypt-store"));
    storage.max_storage_size = config.get_uint64("storage.max_size", storage.max_storage_size);
    return storage;
}

bool StorageConfig::validate() const {
    if (chunk_directory.empty() || database_path.empty()) {
        return false;
    }
    
    if (max_storage_size == 0) {
        return false;
    }
    
    return true;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(chunk_directory);
        
        auto db_dir = database_path.parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }
        
        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

uint64_t StorageConfig::get_available_space() const {
    try {
        auto space_info = std::filesystem::space(chunk_directory);
        return space_info.available;
    } catch (const std::filesystem::filesystem_error&) {
        return 0;
    }
}

std::filesystem::path StorageConfig::get_chunk_path(const std::string& address_hex) const {
    // Shard on the first two hex characters to keep directories small
    std::string subdir = address_hex.substr(0, 2);
    return chunk_directory / subdir / address_hex;
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    chunk_directory = base_dir / "chunks";
    database_path = base_dir / "chunks.db";
}

} // namespace selfcrypt::storage
