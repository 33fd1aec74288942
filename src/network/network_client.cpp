#include "selfcrypt/network/network_client.hpp"
#include "selfcrypt/core/logger.hpp"
#include "selfcrypt/crypto/hash.hpp"
#include <algorithm>
#include <exception>
#include <string>
#include <thread>

namespace selfcrypt::network {

namespace {

constexpr auto CANCELLATION_POLL_INTERVAL = std::chrono::milliseconds(10);

core::Result cancelled_result(const char* operation, const storage::Address& address) {
    return core::Result(core::ErrorCode::CANCELLED,
                        std::string(operation) + " " + storage::to_hex(address) + " cancelled");
}

}

NetworkClient::NetworkClient(storage::ChunkStore& store, NetworkConfig config)
    : store_(store)
    , config_(std::move(config)) {
    if (config_.max_concurrent_requests == 0) {
        config_.max_concurrent_requests = 1;
    }
    if (config_.retry.max_attempts == 0) {
        config_.retry.max_attempts = 1;
    }
}

core::Result NetworkClient::put(const storage::Chunk& chunk, const core::CancellationToken& token) {
    if (chunk.data.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Cannot store an empty chunk");
    }
    
    if (!chunk.verify()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                            "Chunk bytes do not match address " + storage::to_hex(chunk.address));
    }
    
    return coalesce(puts_in_flight_, chunk.address, token, [&]() {
        return execute_put(chunk, token);
    }).result;
}

core::Result NetworkClient::get(const storage::Address& address,
                                storage::Chunk& out_chunk,
                                const core::CancellationToken& token) {
    auto outcome = coalesce(gets_in_flight_, address, token, [&]() {
        return execute_get(address, token);
    });
    
    if (!outcome.result) {
        return outcome.result;
    }
    
    out_chunk.address = address;
    out_chunk.data = *outcome.data;
    return core::Result();
}

core::Result NetworkClient::contains(const storage::Address& address,
                                     bool& out_exists,
                                     const core::CancellationToken& token) {
    bool exists = false;
    auto result = with_retry("contains", address, [&]() {
        auto lookup = store_.contains(address, exists);
        
        // A missing chunk is an answer here, not a failure
        if (lookup.error == core::ErrorCode::NOT_FOUND) {
            exists = false;
            return core::Result();
        }
        return lookup;
    }, token);
    
    if (result) {
        out_exists = exists;
    }
    return result;
}

NetworkStats NetworkClient::stats() const {
    NetworkStats stats;
    stats.puts_issued = puts_issued_.load();
    stats.puts_skipped = puts_skipped_.load();
    stats.gets_issued = gets_issued_.load();
    stats.requests_coalesced = requests_coalesced_.load();
    stats.retries = retries_.load();
    stats.corrupt_chunks = corrupt_chunks_.load();
    return stats;
}

std::uint32_t NetworkClient::active_requests() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return active_requests_;
}

NetworkClient::Outcome NetworkClient::coalesce(InFlightTable& table,
                                               const storage::Address& address,
                                               const core::CancellationToken& token,
                                               const std::function<Outcome()>& operation) {
    while (true) {
        std::promise<Outcome> promise;
        std::shared_future<Outcome> pending;
        
        {
            std::lock_guard<std::mutex> lock(in_flight_mutex_);
            auto it = table.find(address);
            if (it != table.end()) {
                pending = it->second;
            } else {
                table.emplace(address, promise.get_future().share());
            }
        }
        
        if (pending.valid()) {
            requests_coalesced_++;
            LOG_TRACE("Joining in-flight request for {}", storage::to_hex(address));
            auto outcome = pending.get();
            
            // The request we joined was cancelled by its own caller, not by us
            if (outcome.result.error == core::ErrorCode::CANCELLED && !token.is_cancelled()) {
                LOG_DEBUG("Joined request for {} was cancelled; issuing our own", storage::to_hex(address));
                continue;
            }
            return outcome;
        }
        
        Outcome outcome;
        try {
            outcome = operation();
        } catch (const std::exception& e) {
            LOG_ERROR("Store request for {} threw: {}", storage::to_hex(address), e.what());
            outcome = Outcome{core::Result(core::ErrorCode::STORAGE_IO,
                                           "Store request for " + storage::to_hex(address) +
                                           " threw: " + e.what()),
                              nullptr};
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(in_flight_mutex_);
                table.erase(address);
            }
            promise.set_exception(std::current_exception());
            throw;
        }
        
        {
            std::lock_guard<std::mutex> lock(in_flight_mutex_);
            table.erase(address);
        }
        promise.set_value(outcome);
        
        return outcome;
    }
}

core::Result NetworkClient::with_retry(const char* operation,
                                       const storage::Address& address,
                                       const std::function<core::Result()>& attempt,
                                       const core::CancellationToken& token) {
    core::Result last;
    
    for (std::uint32_t attempt_number = 1; attempt_number <= config_.retry.max_attempts; ++attempt_number) {
        if (token.is_cancelled() || !acquire_slot(token)) {
            return cancelled_result(operation, address);
        }
        
        try {
            last = attempt();
        } catch (...) {
            release_slot();
            throw;
        }
        release_slot();
        
        if (last || !config_.retry.is_retryable(last)) {
            return last;
        }
        
        if (attempt_number == config_.retry.max_attempts) {
            break;
        }
        
        auto delay = config_.retry.delay_for_attempt(attempt_number);
        retries_++;
        LOG_WARN("{} {} failed (attempt {}/{}): {}; retrying in {}ms",
                 operation, storage::to_hex(address), attempt_number,
                 config_.retry.max_attempts, last.describe(), delay.count());
        
        if (!wait_backoff(delay, token)) {
            return cancelled_result(operation, address);
        }
    }
    
    if (last.error == core::ErrorCode::NOT_FOUND) {
        LOG_ERROR("{} {}: not found after {} attempts", operation, storage::to_hex(address),
                  config_.retry.max_attempts);
        return last;
    }
    
    LOG_ERROR("{} {} gave up after {} attempts: {}", operation, storage::to_hex(address),
              config_.retry.max_attempts, last.describe());
    return core::Result(core::ErrorCode::RETRIES_EXHAUSTED,
                        std::string(operation) + " " + storage::to_hex(address) + ": " + last.describe());
}

bool NetworkClient::acquire_slot(const core::CancellationToken& token) {
    std::unique_lock<std::mutex> lock(slots_mutex_);
    while (active_requests_ >= config_.max_concurrent_requests) {
        if (token.is_cancelled()) {
            return false;
        }
        slots_cv_.wait_for(lock, CANCELLATION_POLL_INTERVAL);
    }
    active_requests_++;
    return true;
}

void NetworkClient::release_slot() {
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        active_requests_--;
    }
    slots_cv_.notify_one();
}

bool NetworkClient::wait_backoff(std::chrono::milliseconds delay, const core::CancellationToken& token) {
    auto deadline = std::chrono::steady_clock::now() + delay;
    
    while (!token.is_cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1),
                                             CANCELLATION_POLL_INTERVAL));
    }
    
    return false;
}

NetworkClient::Outcome NetworkClient::execute_put(const storage::Chunk& chunk,
                                                  const core::CancellationToken& token) {
    bool skipped = false;
    
    auto result = with_retry("put", chunk.address, [&]() -> core::Result {
        if (config_.skip_existing) {
            bool exists = false;
            auto contains_result = store_.contains(chunk.address, exists);
            if (!contains_result && contains_result.error != core::ErrorCode::NOT_FOUND) {
                return contains_result;
            }
            if (contains_result && exists) {
                skipped = true;
                return core::Result();
            }
        }
        
        puts_issued_++;
        return store_.put(chunk.address, chunk.data);
    }, token);
    
    if (result && skipped) {
        puts_skipped_++;
        LOG_TRACE("Chunk {} already stored", storage::to_hex(chunk.address));
    }
    
    return Outcome{std::move(result), nullptr};
}

NetworkClient::Outcome NetworkClient::execute_get(const storage::Address& address,
                                                  const core::CancellationToken& token) {
    auto data = std::make_shared<std::vector<std::uint8_t>>();
    
    auto result = with_retry("get", address, [&]() {
        gets_issued_++;
        data->clear();
        return store_.get(address, *data);
    }, token);
    
    if (!result) {
        return Outcome{std::move(result), nullptr};
    }
    
    auto actual = crypto::Blake2bHasher::hash(*data);
    if (actual != address) {
        corrupt_chunks_++;
        LOG_ERROR("Chunk {} failed verification: content hashes to {}",
                  storage::to_hex(address), storage::to_hex(actual));
        return Outcome{core::Result(core::ErrorCode::CORRUPT_CHUNK,
                                    "Content of chunk " + storage::to_hex(address) + " does not match its address"),
                       nullptr};
    }
    
    return Outcome{core::Result(), std::move(data)};
}

}
