#pragma once

#include "selfcrypt/core/cancellation.hpp"
#include "selfcrypt/core/result.hpp"
#include "selfcrypt/core/worker_pool.hpp"
#include "selfcrypt/encrypt/self_encryptor.hpp"
#include "selfcrypt/network/network_client.hpp"
#include "selfcrypt/storage/chunk_store.hpp"
#include "selfcrypt/storage/chunker.hpp"
#include "selfcrypt/storage/data_map.hpp"
#include "selfcrypt/transfer/client_config.hpp"
#include "selfcrypt/transfer/retrieval_coordinator.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace selfcrypt::transfer {

// Entry point for storing byte streams as self-encrypted chunks and
// getting them back from a data map
class DataClient {
public:
    // Throws std::invalid_argument if the config does not validate
    explicit DataClient(storage::ChunkStore& store, ClientConfig config = {});
    
    DataClient(const DataClient&) = delete;
    DataClient& operator=(const DataClient&) = delete;
    
    core::Result upload(std::span<const std::uint8_t> data,
                        storage::DataMap& out_map,
                        const core::CancellationToken& token = core::CancellationToken::none());
    
    // Reads the file twice (hashing, then encrypting) so that at most a
    // batch of chunks is held in memory
    core::Result upload_file(const std::filesystem::path& path,
                             storage::DataMap& out_map,
                             const core::CancellationToken& token = core::CancellationToken::none());
    
    core::Result download(const storage::DataMap& map,
                          std::vector<std::uint8_t>& out_data,
                          const core::CancellationToken& token = core::CancellationToken::none());
    
    core::Result download_to(const storage::DataMap& map,
                             const ByteSink& sink,
                             const core::CancellationToken& token = core::CancellationToken::none());
    
    core::Result download_range(const storage::DataMap& map,
                                std::uint64_t offset,
                                std::uint64_t length,
                                std::vector<std::uint8_t>& out_data,
                                const core::CancellationToken& token = core::CancellationToken::none());
    
    // Writes next to `path` and renames into place once the checksum holds
    core::Result download_to_file(const storage::DataMap& map,
                                  const std::filesystem::path& path,
                                  const core::CancellationToken& token = core::CancellationToken::none());
    
    core::Result fetch_chunk(const storage::DataMap& map,
                             size_t index,
                             std::vector<std::uint8_t>& out_plaintext,
                             const core::CancellationToken& token = core::CancellationToken::none());
    
    network::NetworkStats network_stats() const { return network_.stats(); }
    const ClientConfig& config() const { return config_; }

private:
    // Chunks, encrypts and stores one buffer of at least min_encryptable_bytes
    core::Result store_buffer(std::span<const std::uint8_t> data,
                              std::vector<storage::ChunkDescriptor>& out_descriptors,
                              const core::CancellationToken& token);
    
    core::Result finish_map(std::vector<storage::ChunkDescriptor> descriptors,
                            std::uint64_t total_size,
                            const crypto::Blake2bHash& checksum,
                            storage::DataMap& out_map,
                            const core::CancellationToken& token);
    
    ClientConfig config_;
    storage::Chunker chunker_;
    encrypt::SelfEncryptor encryptor_;
    network::NetworkClient network_;
    core::WorkerPool pool_;
    RetrievalCoordinator retrieval_;
};

}
