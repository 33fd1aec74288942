#include "selfcrypt/transfer/client_config.hpp"
#include "selfcrypt/core/config.hpp"
#include <chrono>

namespace selfcrypt::transfer {

ClientConfig ClientConfig::from_config(const core::Config& config) {
    ClientConfig result;
    
    auto& chunking = result.encryption.chunking;
    chunking.max_chunk_size = static_cast<std::uint32_t>(
        config.get_uint64("selfcrypt.max_chunk_size", chunking.max_chunk_size));
    chunking.min_chunk_size = static_cast<std::uint32_t>(
        config.get_uint64("selfcrypt.min_chunk_size", chunking.min_chunk_size));
    result.encryption.max_inline_map_bytes =
        config.get_uint64("selfcrypt.max_inline_map_bytes", result.encryption.max_inline_map_bytes);
    result.encryption.max_map_depth = static_cast<std::uint32_t>(
        config.get_uint64("selfcrypt.max_map_depth", result.encryption.max_map_depth));
    
    auto& retry = result.network.retry;
    retry.max_attempts = static_cast<std::uint32_t>(
        config.get_uint64("network.max_attempts", retry.max_attempts));
    retry.initial_backoff = std::chrono::milliseconds(
        config.get_uint64("network.initial_backoff_ms", retry.initial_backoff.count()));
    retry.max_backoff = std::chrono::milliseconds(
        config.get_uint64("network.max_backoff_ms", retry.max_backoff.count()));
    result.network.max_concurrent_requests = static_cast<std::uint32_t>(
        config.get_uint64("network.max_concurrent_requests", result.network.max_concurrent_requests));
    result.network.skip_existing = config.get_bool("network.skip_existing", result.network.skip_existing);
    
    result.worker_threads = config.get_uint64("client.worker_threads", result.worker_threads);
    result.verify_checksum = config.get_bool("client.verify_checksum", result.verify_checksum);
    
    return result;
}

bool ClientConfig::validate() const {
    return encryption.validate() && network.validate();
}

}
