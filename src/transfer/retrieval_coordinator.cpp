#include "selfcrypt/transfer/retrieval_coordinator.hpp"
#include "selfcrypt/core/logger.hpp"
#include "selfcrypt/crypto/hash.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace selfcrypt::transfer {

namespace {

constexpr auto CANCELLATION_POLL_INTERVAL = std::chrono::milliseconds(10);

core::Result cancelled() {
    return core::Result(core::ErrorCode::CANCELLED, "Retrieval cancelled");
}

// Completed chunks waiting for their turn to be emitted
struct ReorderBuffer {
    std::mutex mutex;
    std::condition_variable changed;
    std::map<size_t, std::vector<std::uint8_t>> ready;
    size_t in_flight = 0;
    size_t failed_index = SIZE_MAX;
    core::Result failure;
    
    bool failed() const { return failed_index != SIZE_MAX; }
};

}

RetrievalCoordinator::RetrievalCoordinator(const encrypt::SelfEncryptor& encryptor,
                                           network::NetworkClient& network,
                                           core::WorkerPool& pool,
                                           RetrievalOptions options)
    : encryptor_(encryptor)
    , network_(network)
    , pool_(pool)
    , options_(options) {
    if (options_.window_size == 0) {
        options_.window_size = 1;
    }
}

core::Result RetrievalCoordinator::resolve(const storage::DataMap& map,
                                           storage::DataMap& out_map,
                                           const core::CancellationToken& token) {
    auto result = map.validate(options_.chunking);
    if (!result) {
        return result;
    }
    
    if (map.level > options_.max_map_depth) {
        return core::Result(core::ErrorCode::RECURSION_LIMIT,
                            "Data map level " + std::to_string(map.level) + " exceeds depth limit " +
                            std::to_string(options_.max_map_depth));
    }
    
    storage::DataMap current = map;
    while (current.is_indirect()) {
        std::vector<std::uint8_t> serialized;
        
        // Intermediate maps are always checked: a bad one would misdirect
        // every fetch below it
        result = assemble(current, [&serialized](std::span<const std::uint8_t> bytes) {
            serialized.insert(serialized.end(), bytes.begin(), bytes.end());
            return core::Result();
        }, true, token);
        if (!result) {
            return result;
        }
        
        storage::DataMap child;
        result = storage::DataMap::deserialize(serialized, child, options_.chunking);
        if (!result) {
            return result;
        }
        
        if (child.level + 1 != current.level) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP,
                                "Level " + std::to_string(current.level) + " map resolved to level " +
                                std::to_string(child.level));
        }
        
        LOG_DEBUG("Resolved level {} data map into {} chunks", current.level, child.chunk_count());
        current = std::move(child);
    }
    
    out_map = std::move(current);
    return core::Result();
}

core::Result RetrievalCoordinator::retrieve(const storage::DataMap& map,
                                            std::vector<std::uint8_t>& out_data,
                                            const core::CancellationToken& token) {
    std::vector<std::uint8_t> data;
    
    auto result = retrieve_to(map, [&data](std::span<const std::uint8_t> bytes) {
        data.insert(data.end(), bytes.begin(), bytes.end());
        return core::Result();
    }, token);
    
    if (!result) {
        return result;
    }
    
    out_data = std::move(data);
    return core::Result();
}

core::Result RetrievalCoordinator::retrieve_to(const storage::DataMap& map,
                                               const ByteSink& sink,
                                               const core::CancellationToken& token) {
    storage::DataMap resolved;
    auto result = resolve(map, resolved, token);
    if (!result) {
        return result;
    }
    
    return assemble(resolved, sink, options_.verify_checksum, token);
}

core::Result RetrievalCoordinator::retrieve_range(const storage::DataMap& map,
                                                  std::uint64_t offset,
                                                  std::uint64_t length,
                                                  std::vector<std::uint8_t>& out_data,
                                                  const core::CancellationToken& token) {
    storage::DataMap resolved;
    auto result = resolve(map, resolved, token);
    if (!result) {
        return result;
    }
    
    if (offset > resolved.total_size || length > resolved.total_size - offset) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                            "Range " + std::to_string(offset) + "+" + std::to_string(length) +
                            " outside " + std::to_string(resolved.total_size) + " bytes");
    }
    
    out_data.clear();
    if (length == 0) {
        return core::Result();
    }
    
    if (resolved.is_inline()) {
        auto begin = resolved.content.begin() + static_cast<std::ptrdiff_t>(offset);
        out_data.assign(begin, begin + static_cast<std::ptrdiff_t>(length));
        return core::Result();
    }
    
    // Locate the chunks covering the range
    size_t first = 0;
    std::uint64_t first_offset = 0;
    while (first_offset + resolved.chunks[first].plaintext_size <= offset) {
        first_offset += resolved.chunks[first].plaintext_size;
        ++first;
    }
    
    size_t last = first;
    std::uint64_t end_offset = first_offset;
    while (end_offset < offset + length) {
        end_offset += resolved.chunks[last].plaintext_size;
        ++last;
    }
    
    std::vector<std::uint8_t> data;
    std::uint64_t position = first_offset;
    
    result = stream_chunks(resolved, first, last, [&](std::span<const std::uint8_t> bytes) {
        auto chunk_begin = position;
        auto chunk_end = position + bytes.size();
        position = chunk_end;
        
        auto from = std::max(chunk_begin, offset);
        auto to = std::min(chunk_end, offset + length);
        if (from < to) {
            auto slice = bytes.subspan(from - chunk_begin, to - from);
            data.insert(data.end(), slice.begin(), slice.end());
        }
        return core::Result();
    }, token);
    
    if (!result) {
        return result;
    }
    
    out_data = std::move(data);
    return core::Result();
}

core::Result RetrievalCoordinator::fetch_chunk(const storage::DataMap& map,
                                               size_t index,
                                               std::vector<std::uint8_t>& out_plaintext,
                                               const core::CancellationToken& token) {
    storage::DataMap resolved;
    auto result = resolve(map, resolved, token);
    if (!result) {
        return result;
    }
    
    if (index >= resolved.chunk_count()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                            "Chunk index " + std::to_string(index) + " outside data map of " +
                            std::to_string(resolved.chunk_count()) + " chunks");
    }
    
    return fetch_and_decrypt(resolved, index, out_plaintext, token);
}

core::Result RetrievalCoordinator::fetch_and_decrypt(const storage::DataMap& map,
                                                     size_t index,
                                                     std::vector<std::uint8_t>& out_plaintext,
                                                     const core::CancellationToken& token) {
    const auto& descriptor = map.chunks[index];
    
    storage::Chunk chunk;
    auto result = network_.get(descriptor.address, chunk, token);
    if (!result) {
        return core::Result(result.error, "Chunk " + std::to_string(index) + ": " + result.message);
    }
    
    return encryptor_.decrypt_chunk(map, index, chunk.data, out_plaintext);
}

core::Result RetrievalCoordinator::stream_chunks(const storage::DataMap& map,
                                                 size_t first,
                                                 size_t last,
                                                 const ByteSink& sink,
                                                 const core::CancellationToken& token) {
    auto buffer = std::make_shared<ReorderBuffer>();
    size_t next_launch = first;
    size_t next_emit = first;
    core::Result outcome;
    
    while (next_emit < last) {
        std::vector<std::uint8_t> plaintext;
        
        {
            std::unique_lock<std::mutex> lock(buffer->mutex);
            
            while (next_launch < last &&
                   next_launch - next_emit < options_.window_size &&
                   !buffer->failed() && !token.is_cancelled()) {
                buffer->in_flight++;
                size_t index = next_launch++;
                pool_.post([this, buffer, &map, &token, index]() {
                    std::vector<std::uint8_t> data;
                    auto result = token.is_cancelled() ? cancelled()
                                                       : fetch_and_decrypt(map, index, data, token);
                    
                    std::lock_guard<std::mutex> guard(buffer->mutex);
                    if (!result) {
                        if (index < buffer->failed_index) {
                            buffer->failed_index = index;
                            buffer->failure = std::move(result);
                        }
                    } else {
                        buffer->ready.emplace(index, std::move(data));
                    }
                    buffer->in_flight--;
                    buffer->changed.notify_all();
                });
            }
            
            while (!buffer->ready.count(next_emit) && !buffer->failed() && !token.is_cancelled()) {
                buffer->changed.wait_for(lock, CANCELLATION_POLL_INTERVAL);
            }
            
            if (token.is_cancelled()) {
                outcome = cancelled();
                break;
            }
            if (buffer->failed()) {
                outcome = buffer->failure;
                break;
            }
            
            auto it = buffer->ready.find(next_emit);
            plaintext = std::move(it->second);
            buffer->ready.erase(it);
        }
        
        auto result = sink(plaintext);
        if (!result) {
            outcome = std::move(result);
            break;
        }
        ++next_emit;
    }
    
    // Drain in-flight fetches before the map and token go out of scope
    std::unique_lock<std::mutex> lock(buffer->mutex);
    buffer->changed.wait(lock, [&buffer]() { return buffer->in_flight == 0; });
    buffer->ready.clear();
    
    if (!outcome) {
        LOG_DEBUG("Retrieval stopped at chunk {}: {}", next_emit, outcome.describe());
    }
    return outcome;
}

core::Result RetrievalCoordinator::assemble(const storage::DataMap& map,
                                            const ByteSink& sink,
                                            bool verify_checksum,
                                            const core::CancellationToken& token) {
    if (token.is_cancelled()) {
        return cancelled();
    }
    
    crypto::Blake2bHasher hasher;
    auto init = hasher.initialize();
    if (!init) {
        return core::Result(core::ErrorCode::ASSEMBLY_INTEGRITY, "Checksum setup failed: " + init.message);
    }
    
    auto hashing_sink = [&](std::span<const std::uint8_t> bytes) {
        if (verify_checksum) {
            auto hashed = hasher.update(bytes);
            if (!hashed) {
                return core::Result(core::ErrorCode::ASSEMBLY_INTEGRITY, "Checksum update failed: " + hashed.message);
            }
        }
        return sink(bytes);
    };
    
    core::Result result;
    if (map.is_inline()) {
        result = map.content.empty() ? core::Result() : hashing_sink(map.content);
    } else {
        result = stream_chunks(map, 0, map.chunk_count(), hashing_sink, token);
    }
    
    if (!result) {
        return result;
    }
    
    if (verify_checksum && hasher.finalize() != map.checksum) {
        LOG_ERROR("Reassembled level {} stream of {} bytes does not match its checksum",
                  map.level, map.total_size);
        return core::Result(core::ErrorCode::ASSEMBLY_INTEGRITY,
                            "Checksum mismatch for " + std::to_string(map.total_size) + " byte stream");
    }
    
    return core::Result();
}

}
