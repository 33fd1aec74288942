#include "selfcrypt/storage/disk_chunk_store.hpp"
#include "selfcrypt/core/logger.hpp"
#include <fstream>
#include <system_error>

namespace selfcrypt::storage {

DiskChunkStore::DiskChunkStore(const StorageConfig& config) 
    : config_(config) {
}

core::Result DiskChunkStore::initialize() {
    if (!config_.validate()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Invalid storage configuration");
    }
    
    if (!config_.create_directories()) {
        return core::Result(core::ErrorCode::STORAGE_IO,
                            "Cannot create chunk directory " + config_.chunk_directory.string());
    }
    
    std::uint64_t total = 0;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(config_.chunk_directory, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            total += it->file_size(ec);
        }
    }
    
    if (ec) {
        return core::Result(core::ErrorCode::STORAGE_IO, "Cannot scan chunk directory: " + ec.message());
    }
    
    std::lock_guard<std::mutex> lock(usage_mutex_);
    used_bytes_ = total;
    LOG_INFO("Disk chunk store at {} holds {} bytes", config_.chunk_directory.string(), total);
    return core::Result();
}

core::Result DiskChunkStore::put(const Address& address, std::span<const std::uint8_t> data) {
    auto chunk_path = get_chunk_path(address);
    
    std::error_code ec;
    if (std::filesystem::exists(chunk_path, ec)) {
        return core::Result();
    }
    
    {
        std::lock_guard<std::mutex> lock(usage_mutex_);
        if (used_bytes_ + data.size() > config_.max_storage_size) {
            return core::Result(core::ErrorCode::QUOTA_EXCEEDED,
                                "Storing " + std::to_string(data.size()) + " bytes would exceed the " +
                                std::to_string(config_.max_storage_size) + " byte limit");
        }
        used_bytes_ += data.size();
    }
    
    auto release_reservation = [&]() {
        std::lock_guard<std::mutex> lock(usage_mutex_);
        used_bytes_ -= data.size();
    };
    
    std::filesystem::create_directories(chunk_path.parent_path(), ec);
    if (ec) {
        release_reservation();
        return core::Result(core::ErrorCode::STORAGE_IO, "Cannot create " + chunk_path.parent_path().string());
    }
    
    // Write beside the target then rename so readers never see a partial chunk
    auto temp_path = chunk_path;
    temp_path += ".tmp." + std::to_string(temp_counter_++);
    
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            release_reservation();
            return core::Result(core::ErrorCode::STORAGE_IO, "Cannot open " + temp_path.string());
        }
        
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file.good()) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            release_reservation();
            return core::Result(core::ErrorCode::STORAGE_IO, "Short write to " + temp_path.string());
        }
    }
    
    std::lock_guard<std::mutex> lock(usage_mutex_);
    
    // A concurrent put of the same chunk got there first; its bytes are already counted
    if (std::filesystem::exists(chunk_path, ec)) {
        std::filesystem::remove(temp_path, ec);
        used_bytes_ -= data.size();
        return core::Result();
    }
    
    std::filesystem::rename(temp_path, chunk_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        used_bytes_ -= data.size();
        return core::Result(core::ErrorCode::STORAGE_IO, "Cannot move chunk into place: " + chunk_path.string());
    }
    
    return core::Result();
}

core::Result DiskChunkStore::get(const Address& address, std::vector<std::uint8_t>& out_data) {
    auto chunk_path = get_chunk_path(address);
    
    std::ifstream file(chunk_path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Chunk " + to_hex(address) + " not stored");
    }
    
    file.seekg(0, std::ios::end);
    auto size = file.tellg();
    file.seekg(0, std::ios::beg);
    
    if (size < 0) {
        return core::Result(core::ErrorCode::STORAGE_IO, "Cannot size " + chunk_path.string());
    }
    
    out_data.resize(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(out_data.data()), size);
    if (file.gcount() != size) {
        out_data.clear();
        return core::Result(core::ErrorCode::STORAGE_IO, "Short read from " + chunk_path.string());
    }
    
    return core::Result();
}

core::Result DiskChunkStore::contains(const Address& address, bool& out_exists) {
    std::error_code ec;
    out_exists = std::filesystem::is_regular_file(get_chunk_path(address), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return core::Result(core::ErrorCode::STORAGE_IO, "Cannot stat chunk: " + ec.message());
    }
    return core::Result();
}

std::uint64_t DiskChunkStore::used_bytes() const {
    std::lock_guard<std::mutex> lock(usage_mutex_);
    return used_bytes_;
}

std::filesystem::path DiskChunkStore::get_chunk_path(const Address& address) const {
    return config_.get_chunk_path(to_hex(address));
}

}
