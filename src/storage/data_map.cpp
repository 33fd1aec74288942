#include "selfcrypt/storage/data_map.hpp"
#include "selfcrypt/crypto/hash.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace selfcrypt::storage {

namespace {
    void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
        buffer.push_back(value);
    }
    
    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
        write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    }
    
    void write_array(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> data) {
        buffer.insert(buffer.end(), data.begin(), data.end());
    }
    
    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw std::runtime_error("Insufficient data for uint8");
        std::uint8_t value = data[0];
        data = data.subspan(1);
        return value;
    }
    
    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }
    
    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        std::uint64_t high = read_uint32(data);
        std::uint64_t low = read_uint32(data);
        return (high << 32) | low;
    }
    
    template<size_t N>
    std::array<std::uint8_t, N> read_array(std::span<const std::uint8_t>& data) {
        if (data.size() < N) throw std::runtime_error("Insufficient data for array");
        std::array<std::uint8_t, N> arr;
        std::copy(data.begin(), data.begin() + N, arr.begin());
        data = data.subspan(N);
        return arr;
    }
}

DataMap DataMap::make_inline(std::span<const std::uint8_t> data) {
    DataMap map;
    map.level = 0;
    map.total_size = data.size();
    map.checksum = crypto::Blake2bHasher::hash(data);
    map.content.assign(data.begin(), data.end());
    return map;
}

const crypto::Blake2bHash& DataMap::previous_source_hash(size_t index) const {
    if (chunks.empty() || index >= chunks.size()) {
        throw std::out_of_range("Chunk index out of range");
    }
    return chunks[(index + chunks.size() - 1) % chunks.size()].source_hash;
}

const crypto::Blake2bHash& DataMap::next_source_hash(size_t index) const {
    if (chunks.empty() || index >= chunks.size()) {
        throw std::out_of_range("Chunk index out of range");
    }
    return chunks[(index + 1) % chunks.size()].source_hash;
}

std::uint64_t DataMap::chunk_offset(size_t index) const {
    std::uint64_t offset = 0;
    for (size_t i = 0; i < index && i < chunks.size(); ++i) {
        offset += chunks[i].plaintext_size;
    }
    return offset;
}

size_t DataMap::serialized_size() const {
    return HEADER_SIZE + chunks.size() * DESCRIPTOR_SIZE + content.size();
}

std::vector<std::uint8_t> DataMap::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(serialized_size());
    
    write_uint32(buffer, MAGIC);
    write_uint8(buffer, VERSION);
    write_uint32(buffer, level);
    write_uint64(buffer, total_size);
    write_array(buffer, std::span(checksum));
    
    write_uint32(buffer, static_cast<std::uint32_t>(chunks.size()));
    for (const auto& chunk : chunks) {
        write_uint32(buffer, chunk.index);
        write_array(buffer, std::span(chunk.address));
        write_array(buffer, std::span(chunk.source_hash));
        write_uint64(buffer, chunk.plaintext_size);
        write_uint64(buffer, chunk.ciphertext_size);
    }
    
    write_uint32(buffer, static_cast<std::uint32_t>(content.size()));
    write_array(buffer, content);
    
    return buffer;
}

core::Result DataMap::deserialize(std::span<const std::uint8_t> data,
                                  DataMap& out_map,
                                  const ChunkingPolicy& policy) {
    DataMap map;
    auto span = data;
    
    try {
        if (read_uint32(span) != MAGIC) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP, "Bad data map magic");
        }
        
        auto version = read_uint8(span);
        if (version != VERSION) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP,
                                "Unsupported data map version " + std::to_string(version));
        }
        
        map.level = read_uint32(span);
        map.total_size = read_uint64(span);
        map.checksum = read_array<crypto::BLAKE2B_HASH_SIZE>(span);
        
        auto chunk_count = read_uint32(span);
        if (static_cast<std::uint64_t>(chunk_count) * DESCRIPTOR_SIZE > span.size()) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP, "Descriptor count exceeds buffer");
        }
        
        map.chunks.reserve(chunk_count);
        for (std::uint32_t i = 0; i < chunk_count; ++i) {
            ChunkDescriptor descriptor;
            descriptor.index = read_uint32(span);
            descriptor.address = read_array<crypto::BLAKE2B_HASH_SIZE>(span);
            descriptor.source_hash = read_array<crypto::BLAKE2B_HASH_SIZE>(span);
            descriptor.plaintext_size = read_uint64(span);
            descriptor.ciphertext_size = read_uint64(span);
            map.chunks.push_back(descriptor);
        }
        
        auto content_size = read_uint32(span);
        if (content_size > span.size()) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP, "Inline content exceeds buffer");
        }
        map.content.assign(span.begin(), span.begin() + content_size);
        span = span.subspan(content_size);
    } catch (const std::runtime_error& e) {
        return core::Result(core::ErrorCode::MALFORMED_DATA_MAP, std::string("Truncated data map: ") + e.what());
    }
    
    if (!span.empty()) {
        return core::Result(core::ErrorCode::MALFORMED_DATA_MAP,
                            "Trailing bytes after data map: " + std::to_string(span.size()));
    }
    
    auto result = map.validate(policy);
    if (!result) {
        return result;
    }
    
    out_map = std::move(map);
    return core::Result();
}

core::Result DataMap::validate(const ChunkingPolicy& policy) const {
    if (is_inline()) {
        if (level != 0) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP, "Inline data map with non-zero level");
        }
        if (total_size != content.size()) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP, "Inline content size does not match total size");
        }
        return core::Result();
    }
    
    if (!content.empty()) {
        return core::Result(core::ErrorCode::MALFORMED_DATA_MAP, "Data map carries both chunks and inline content");
    }
    
    if (chunks.size() < ChunkingPolicy::MIN_CHUNK_COUNT) {
        return core::Result(core::ErrorCode::MALFORMED_DATA_MAP,
                            "Chunked data map with only " + std::to_string(chunks.size()) + " descriptors");
    }
    
    std::uint64_t plaintext_total = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        if (chunk.index != i) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP,
                                "Descriptor " + std::to_string(i) + " out of order");
        }
        if (chunk.plaintext_size == 0) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP,
                                "Descriptor " + std::to_string(i) + " is empty");
        }
        if (chunk.plaintext_size > policy.largest_chunk_size()) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP,
                                "Descriptor " + std::to_string(i) + " claims " +
                                std::to_string(chunk.plaintext_size) + " bytes, above the chunk size limit");
        }
        if (chunk.ciphertext_size != chunk.plaintext_size + crypto::AEAD_TAG_SIZE) {
            return core::Result(core::ErrorCode::MALFORMED_DATA_MAP,
                                "Descriptor " + std::to_string(i) + " has inconsistent sizes");
        }
        plaintext_total += chunk.plaintext_size;
    }
    
    if (plaintext_total != total_size) {
        return core::Result(core::ErrorCode::MALFORMED_DATA_MAP, "Descriptor sizes do not sum to total size");
    }
    
    return core::Result();
}

}
