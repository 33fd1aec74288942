#pragma once

#include <filesystem>
#include <string>
#include <cstdint>

namespace selfcrypt::core {
class Config;
}

namespace selfcrypt::storage {

// Locations and limits for the local chunk stores
struct StorageConfig {
    std::filesystem::path chunk_directory;
    std::filesystem::path database_path;
    
    uint64_t max_storage_size = 10ULL * 1024 * 1024 * 1024; // 10GB default
    
    StorageConfig() = default;
    
    explicit StorageConfig(const std::filesystem::path& base_dir);
    
    static StorageConfig from_config(const core::Config& config);
    
    bool validate() const;
    
    bool create_directories() const;
    
    uint64_t get_available_space() const;
    
    std::filesystem::path get_chunk_path(const std::string& address_hex) const;
    
    void set_base_directory(const std::filesystem::path& base_dir);
};

} // namespace selfcrypt::storage
