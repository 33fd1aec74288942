#pragma once

#include "selfcrypt/core/cancellation.hpp"
#include "selfcrypt/core/result.hpp"
#include "selfcrypt/network/retry_policy.hpp"
#include "selfcrypt/storage/chunk.hpp"
#include "selfcrypt/storage/chunk_store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace selfcrypt::network {

struct NetworkConfig {
    RetryPolicy retry;
    std::uint32_t max_concurrent_requests = 8;
    
    // Ask the store before uploading and skip chunks it already holds
    bool skip_existing = true;
    
    bool validate() const { return retry.validate() && max_concurrent_requests > 0; }
};

struct NetworkStats {
    std::uint64_t puts_issued = 0;
    std::uint64_t puts_skipped = 0;
    std::uint64_t gets_issued = 0;
    std::uint64_t requests_coalesced = 0;
    std::uint64_t retries = 0;
    std::uint64_t corrupt_chunks = 0;
};

// Reliable access to a ChunkStore: bounded retries for transient failures,
// content verification on every get, deduplication of puts, and at most
// one outstanding store request per address.
class NetworkClient {
public:
    explicit NetworkClient(storage::ChunkStore& store, NetworkConfig config = {});
    
    NetworkClient(const NetworkClient&) = delete;
    NetworkClient& operator=(const NetworkClient&) = delete;
    
    core::Result put(const storage::Chunk& chunk,
                     const core::CancellationToken& token = core::CancellationToken::none());
    
    core::Result get(const storage::Address& address,
                     storage::Chunk& out_chunk,
                     const core::CancellationToken& token = core::CancellationToken::none());
    
    core::Result contains(const storage::Address& address,
                          bool& out_exists,
                          const core::CancellationToken& token = core::CancellationToken::none());
    
    NetworkStats stats() const;
    std::uint32_t active_requests() const;
    
    const NetworkConfig& config() const { return config_; }

private:
    struct Outcome {
        core::Result result;
        std::shared_ptr<const std::vector<std::uint8_t>> data;
    };
    
    using InFlightTable = std::unordered_map<storage::Address, std::shared_future<Outcome>, storage::AddressKey>;
    
    // Runs `operation` unless a request for the same address is already in
    // flight, in which case its outcome is shared. A shared outcome that was
    // cancelled by another caller is retried under the caller's own token.
    Outcome coalesce(InFlightTable& table,
                     const storage::Address& address,
                     const core::CancellationToken& token,
                     const std::function<Outcome()>& operation);
    
    core::Result with_retry(const char* operation,
                            const storage::Address& address,
                            const std::function<core::Result()>& attempt,
                            const core::CancellationToken& token);
    
    bool acquire_slot(const core::CancellationToken& token);
    void release_slot();
    bool wait_backoff(std::chrono::milliseconds delay, const core::CancellationToken& token);
    
    Outcome execute_put(const storage::Chunk& chunk, const core::CancellationToken& token);
    Outcome execute_get(const storage::Address& address, const core::CancellationToken& token);
    
    storage::ChunkStore& store_;
    NetworkConfig config_;
    
    std::mutex in_flight_mutex_;
    InFlightTable puts_in_flight_;
    InFlightTable gets_in_flight_;
    
    mutable std::mutex slots_mutex_;
    std::condition_variable slots_cv_;
    std::uint32_t active_requests_ = 0;
    
    std::atomic<std::uint64_t> puts_issued_{0};
    std::atomic<std::uint64_t> puts_skipped_{0};
    std::atomic<std::uint64_t> gets_issued_{0};
    std::atomic<std::uint64_t> requests_coalesced_{0};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> corrupt_chunks_{0};
};

}
