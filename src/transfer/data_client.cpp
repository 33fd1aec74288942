#include "selfcrypt/transfer/data_client.hpp"
#include "selfcrypt/core/logger.hpp"
#include "selfcrypt/crypto/hash.hpp"
#include "selfcrypt/encrypt/data_map_builder.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace selfcrypt::transfer {

namespace {

ClientConfig validated(ClientConfig config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid client configuration");
    }
    return config;
}

RetrievalOptions retrieval_options(const ClientConfig& config) {
    RetrievalOptions options;
    options.window_size = config.network.max_concurrent_requests;
    options.verify_checksum = config.verify_checksum;
    options.max_map_depth = config.encryption.max_map_depth;
    options.chunking = config.encryption.chunking;
    return options;
}

core::Result read_exact(std::ifstream& file, std::uint64_t offset, std::vector<std::uint8_t>& buffer) {
    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (!file || static_cast<size_t>(file.gcount()) != buffer.size()) {
        return core::Result(core::ErrorCode::STORAGE_IO,
                            "Short read of " + std::to_string(buffer.size()) + " bytes at offset " +
                            std::to_string(offset));
    }
    return core::Result();
}

}

DataClient::DataClient(storage::ChunkStore& store, ClientConfig config)
    : config_(validated(std::move(config)))
    , chunker_(config_.encryption.chunking)
    , network_(store, config_.network)
    , pool_(config_.worker_threads)
    , retrieval_(encryptor_, network_, pool_, retrieval_options(config_)) {
    LOG_DEBUG("Data client ready: {} workers, {} concurrent requests, chunks {}..{} bytes",
              pool_.thread_count(), config_.network.max_concurrent_requests,
              config_.encryption.chunking.min_chunk_size, config_.encryption.chunking.max_chunk_size);
}

core::Result DataClient::upload(std::span<const std::uint8_t> data,
                                storage::DataMap& out_map,
                                const core::CancellationToken& token) {
    if (token.is_cancelled()) {
        return core::Result(core::ErrorCode::CANCELLED, "Upload cancelled");
    }
    
    if (chunker_.is_inline_size(data.size())) {
        out_map = storage::DataMap::make_inline(data);
        LOG_DEBUG("Stored {} bytes inline in the data map", data.size());
        return core::Result();
    }
    
    auto checksum = crypto::Blake2bHasher::hash(data);
    
    std::vector<storage::ChunkDescriptor> descriptors;
    auto result = store_buffer(data, descriptors, token);
    if (!result) {
        return result;
    }
    
    return finish_map(std::move(descriptors), data.size(), checksum, out_map, token);
}

core::Result DataClient::upload_file(const std::filesystem::path& path,
                                     storage::DataMap& out_map,
                                     const core::CancellationToken& token) {
    std::error_code ec;
    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                            "Cannot read " + path.string() + ": " + ec.message());
    }
    
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return core::Result(core::ErrorCode::STORAGE_IO, "Cannot open " + path.string());
    }
    
    if (chunker_.is_inline_size(file_size)) {
        std::vector<std::uint8_t> content(file_size);
        if (file_size > 0) {
            auto result = read_exact(file, 0, content);
            if (!result) {
                return result;
            }
        }
        return upload(content, out_map, token);
    }
    
    auto plan = chunker_.plan(file_size);
    
    // Pass 1: chunk hashes and the whole-file checksum
    std::vector<crypto::Blake2bHash> source_hashes(plan.size());
    crypto::Blake2bHasher file_hasher;
    auto hash_result = file_hasher.initialize();
    if (!hash_result) {
        return core::Result(core::ErrorCode::ENCRYPTION_FAILED, hash_result.message);
    }
    
    std::vector<std::uint8_t> buffer;
    for (const auto& span : plan) {
        if (token.is_cancelled()) {
            return core::Result(core::ErrorCode::CANCELLED, "Upload cancelled");
        }
        
        buffer.resize(span.size);
        auto result = read_exact(file, span.offset, buffer);
        if (!result) {
            return result;
        }
        
        source_hashes[span.index] = crypto::Blake2bHasher::hash(buffer);
        hash_result = file_hasher.update(buffer);
        if (!hash_result) {
            return core::Result(core::ErrorCode::ENCRYPTION_FAILED, hash_result.message);
        }
    }
    auto checksum = file_hasher.finalize();
    
    // Pass 2: encrypt and store one batch of chunks per round
    const size_t count = plan.size();
    const size_t batch_size = std::max<size_t>(pool_.thread_count(), config_.network.max_concurrent_requests);
    std::vector<storage::ChunkDescriptor> descriptors(count);
    
    for (size_t batch_start = 0; batch_start < count; batch_start += batch_size) {
        size_t batch_end = std::min(count, batch_start + batch_size);
        
        std::vector<std::vector<std::uint8_t>> plaintexts(batch_end - batch_start);
        for (size_t i = batch_start; i < batch_end; ++i) {
            auto& plaintext = plaintexts[i - batch_start];
            plaintext.resize(plan[i].size);
            auto result = read_exact(file, plan[i].offset, plaintext);
            if (!result) {
                return result;
            }
        }
        
        auto result = pool_.parallel_for(plaintexts.size(), [&](size_t offset) {
            size_t i = batch_start + offset;
            encrypt::EncryptedChunk encrypted;
            auto encrypt_result = encryptor_.encrypt_chunk(static_cast<std::uint32_t>(i),
                                                           plaintexts[offset],
                                                           source_hashes[i],
                                                           source_hashes[(i + count - 1) % count],
                                                           source_hashes[(i + 1) % count],
                                                           encrypted);
            if (!encrypt_result) {
                return encrypt_result;
            }
            
            auto put_result = network_.put(encrypted.chunk, token);
            if (!put_result) {
                return put_result;
            }
            
            descriptors[i] = encrypted.descriptor;
            return core::Result();
        }, token);
        
        if (!result) {
            return result;
        }
    }
    
    LOG_INFO("Uploaded {} ({} bytes) as {} chunks", path.string(), file_size, count);
    return finish_map(std::move(descriptors), file_size, checksum, out_map, token);
}

core::Result DataClient::download(const storage::DataMap& map,
                                  std::vector<std::uint8_t>& out_data,
                                  const core::CancellationToken& token) {
    return retrieval_.retrieve(map, out_data, token);
}

core::Result DataClient::download_to(const storage::DataMap& map,
                                     const ByteSink& sink,
                                     const core::CancellationToken& token) {
    return retrieval_.retrieve_to(map, sink, token);
}

core::Result DataClient::download_range(const storage::DataMap& map,
                                        std::uint64_t offset,
                                        std::uint64_t length,
                                        std::vector<std::uint8_t>& out_data,
                                        const core::CancellationToken& token) {
    return retrieval_.retrieve_range(map, offset, length, out_data, token);
}

core::Result DataClient::download_to_file(const storage::DataMap& map,
                                          const std::filesystem::path& path,
                                          const core::CancellationToken& token) {
    auto temp_path = path;
    temp_path += ".partial";
    
    core::Result result;
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return core::Result(core::ErrorCode::STORAGE_IO, "Cannot create " + temp_path.string());
        }
        
        result = retrieval_.retrieve_to(map, [&file, &temp_path](std::span<const std::uint8_t> bytes) {
            file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (!file) {
                return core::Result(core::ErrorCode::STORAGE_IO, "Write to " + temp_path.string() + " failed");
            }
            return core::Result();
        }, token);
        
        if (result) {
            file.flush();
            if (!file) {
                result = core::Result(core::ErrorCode::STORAGE_IO, "Flush of " + temp_path.string() + " failed");
            }
        }
    }
    
    std::error_code ec;
    if (!result) {
        std::filesystem::remove(temp_path, ec);
        return result;
    }
    
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return core::Result(core::ErrorCode::STORAGE_IO,
                            "Cannot move download into " + path.string() + ": " + ec.message());
    }
    
    return core::Result();
}

core::Result DataClient::fetch_chunk(const storage::DataMap& map,
                                     size_t index,
                                     std::vector<std::uint8_t>& out_plaintext,
                                     const core::CancellationToken& token) {
    return retrieval_.fetch_chunk(map, index, out_plaintext, token);
}

core::Result DataClient::store_buffer(std::span<const std::uint8_t> data,
                                      std::vector<storage::ChunkDescriptor>& out_descriptors,
                                      const core::CancellationToken& token) {
    auto plan = chunker_.plan(data.size());
    if (plan.empty()) {
        return core::Result(core::ErrorCode::INPUT_TOO_SMALL,
                            std::to_string(data.size()) + " bytes is below the self-encryption minimum");
    }
    
    const size_t count = plan.size();
    auto chunk_data = [&](size_t i) {
        return data.subspan(plan[i].offset, plan[i].size);
    };
    
    std::vector<crypto::Blake2bHash> source_hashes(count);
    auto result = pool_.parallel_for(count, [&](size_t i) {
        source_hashes[i] = crypto::Blake2bHasher::hash(chunk_data(i));
        return core::Result();
    }, token);
    if (!result) {
        return result;
    }
    
    std::vector<storage::ChunkDescriptor> descriptors(count);
    result = pool_.parallel_for(count, [&](size_t i) {
        encrypt::EncryptedChunk encrypted;
        auto encrypt_result = encryptor_.encrypt_chunk(static_cast<std::uint32_t>(i),
                                                       chunk_data(i),
                                                       source_hashes[i],
                                                       source_hashes[(i + count - 1) % count],
                                                       source_hashes[(i + 1) % count],
                                                       encrypted);
        if (!encrypt_result) {
            return encrypt_result;
        }
        
        auto put_result = network_.put(encrypted.chunk, token);
        if (!put_result) {
            return put_result;
        }
        
        descriptors[i] = encrypted.descriptor;
        return core::Result();
    }, token);
    if (!result) {
        return result;
    }
    
    LOG_DEBUG("Stored {} bytes as {} chunks", data.size(), count);
    out_descriptors = std::move(descriptors);
    return core::Result();
}

core::Result DataClient::finish_map(std::vector<storage::ChunkDescriptor> descriptors,
                                    std::uint64_t total_size,
                                    const crypto::Blake2bHash& checksum,
                                    storage::DataMap& out_map,
                                    const core::CancellationToken& token) {
    encrypt::DataMapBuilder builder(config_.encryption,
        [this, &token](std::span<const std::uint8_t> plaintext,
                       std::vector<storage::ChunkDescriptor>& out_descriptors) {
            return store_buffer(plaintext, out_descriptors, token);
        });
    
    return builder.build(std::move(descriptors), total_size, checksum, out_map);
}

}
