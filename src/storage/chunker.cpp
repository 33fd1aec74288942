#include "selfcrypt/storage/chunker.hpp"
#include <stdexcept>
#include <string>

namespace selfcrypt::storage {

bool ChunkingPolicy::validate() const {
    if (min_chunk_size == 0 || max_chunk_size == 0) {
        return false;
    }
    
    // The penultimate chunk donates min_chunk_size bytes to a short tail
    if (max_chunk_size < 2 * min_chunk_size) {
        return false;
    }
    
    return true;
}

Chunker::Chunker(ChunkingPolicy policy) : policy_(policy) {
    if (!policy_.validate()) {
        throw std::invalid_argument("Invalid chunking policy: max " + std::to_string(policy_.max_chunk_size) +
                                    ", min " + std::to_string(policy_.min_chunk_size));
    }
}

bool Chunker::is_inline_size(std::uint64_t total_size) const {
    return total_size < policy_.min_encryptable_bytes();
}

std::uint32_t Chunker::chunk_count(std::uint64_t total_size) const {
    if (is_inline_size(total_size)) {
        return 0;
    }
    
    const std::uint64_t max = policy_.max_chunk_size;
    if (total_size < ChunkingPolicy::MIN_CHUNK_COUNT * max) {
        return ChunkingPolicy::MIN_CHUNK_COUNT;
    }
    
    return static_cast<std::uint32_t>(total_size / max + (total_size % max != 0 ? 1 : 0));
}

std::uint64_t Chunker::chunk_size(std::uint64_t total_size, std::uint32_t chunk_index) const {
    auto count = chunk_count(total_size);
    if (chunk_index >= count) {
        return 0;
    }
    
    const std::uint64_t max = policy_.max_chunk_size;
    const std::uint64_t min = policy_.min_chunk_size;
    
    if (count == ChunkingPolicy::MIN_CHUNK_COUNT && total_size < ChunkingPolicy::MIN_CHUNK_COUNT * max) {
        auto base = total_size / ChunkingPolicy::MIN_CHUNK_COUNT;
        return chunk_index + 1 < count ? base : total_size - base * (count - 1);
    }
    
    auto remainder = total_size % max;
    
    if (chunk_index + 2 < count) {
        return max;
    }
    
    if (chunk_index + 2 == count) {
        // Penultimate chunk lends bytes to a tail shorter than min_chunk_size
        return (remainder != 0 && remainder < min) ? max - min : max;
    }
    
    if (remainder == 0) {
        return max;
    }
    return remainder < min ? remainder + min : remainder;
}

std::vector<ChunkSpan> Chunker::plan(std::uint64_t total_size) const {
    std::vector<ChunkSpan> spans;
    auto count = chunk_count(total_size);
    spans.reserve(count);
    
    std::uint64_t offset = 0;
    for (std::uint32_t i = 0; i < count; ++i) {
        auto size = chunk_size(total_size, i);
        spans.push_back(ChunkSpan{i, offset, size});
        offset += size;
    }
    
    return spans;
}

core::Result Chunker::split(std::span<const std::uint8_t> data,
                            std::vector<std::vector<std::uint8_t>>& out_chunks) const {
    out_chunks.clear();
    
    if (data.empty()) {
        return core::Result(core::ErrorCode::EMPTY_INPUT, "Cannot split empty input");
    }
    
    if (is_inline_size(data.size())) {
        return core::Result(core::ErrorCode::INPUT_TOO_SMALL,
                            std::to_string(data.size()) + " bytes is below the " +
                            std::to_string(policy_.min_encryptable_bytes()) +
                            " byte minimum; store inline");
    }
    
    auto spans = plan(data.size());
    out_chunks.reserve(spans.size());
    for (const auto& span : spans) {
        auto begin = data.begin() + static_cast<std::ptrdiff_t>(span.offset);
        out_chunks.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(span.size));
    }
    
    return core::Result();
}

}
