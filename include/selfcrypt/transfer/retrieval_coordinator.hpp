#pragma once

#include "selfcrypt/core/cancellation.hpp"
#include "selfcrypt/core/result.hpp"
#include "selfcrypt/core/worker_pool.hpp"
#include "selfcrypt/encrypt/self_encryptor.hpp"
#include "selfcrypt/network/network_client.hpp"
#include "selfcrypt/storage/data_map.hpp"
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace selfcrypt::transfer {

// Receives reassembled plaintext in stream order. A failed result stops
// the download and is returned to the caller.
using ByteSink = std::function<core::Result(std::span<const std::uint8_t>)>;

struct RetrievalOptions {
    // Chunks fetched or buffered ahead of the next one to emit
    std::uint32_t window_size = 8;
    bool verify_checksum = true;
    std::uint32_t max_map_depth = 8;
    
    // Bounds the chunk sizes a map may claim
    storage::ChunkingPolicy chunking;
};

class RetrievalCoordinator {
public:
    RetrievalCoordinator(const encrypt::SelfEncryptor& encryptor,
                         network::NetworkClient& network,
                         core::WorkerPool& pool,
                         RetrievalOptions options = {});
    
    // Follows indirect maps down to the level-0 map
    core::Result resolve(const storage::DataMap& map,
                         storage::DataMap& out_map,
                         const core::CancellationToken& token = core::CancellationToken::none());
    
    core::Result retrieve(const storage::DataMap& map,
                          std::vector<std::uint8_t>& out_data,
                          const core::CancellationToken& token = core::CancellationToken::none());
    
    // Bytes already handed to the sink are untrusted if this returns
    // ASSEMBLY_INTEGRITY
    core::Result retrieve_to(const storage::DataMap& map,
                             const ByteSink& sink,
                             const core::CancellationToken& token = core::CancellationToken::none());
    
    // Fetches only the chunks overlapping [offset, offset + length).
    // Each chunk is verified, the whole-stream checksum is not.
    core::Result retrieve_range(const storage::DataMap& map,
                                std::uint64_t offset,
                                std::uint64_t length,
                                std::vector<std::uint8_t>& out_data,
                                const core::CancellationToken& token = core::CancellationToken::none());
    
    // Plaintext of chunk `index` of the resolved level-0 map
    core::Result fetch_chunk(const storage::DataMap& map,
                             size_t index,
                             std::vector<std::uint8_t>& out_plaintext,
                             const core::CancellationToken& token = core::CancellationToken::none());
    
    const RetrievalOptions& options() const { return options_; }

private:
    core::Result fetch_and_decrypt(const storage::DataMap& map,
                                   size_t index,
                                   std::vector<std::uint8_t>& out_plaintext,
                                   const core::CancellationToken& token);
    
    // Emits chunks [first, last) of a chunked map to the sink in order
    core::Result stream_chunks(const storage::DataMap& map,
                               size_t first,
                               size_t last,
                               const ByteSink& sink,
                               const core::CancellationToken& token);
    
    core::Result assemble(const storage::DataMap& map,
                          const ByteSink& sink,
                          bool verify_checksum,
                          const core::CancellationToken& token);
    
    const encrypt::SelfEncryptor& encryptor_;
    network::NetworkClient& network_;
    core::WorkerPool& pool_;
    RetrievalOptions options_;
};

}
