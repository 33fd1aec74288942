#include "selfcrypt/encrypt/self_encryptor.hpp"
#include "selfcrypt/core/logger.hpp"
#include "selfcrypt/crypto/hash.hpp"
#include "selfcrypt/storage/chunker.hpp"
#include <sodium.h>
#include <algorithm>
#include <string>

namespace selfcrypt::encrypt {

namespace {
    constexpr char KEY_CONTEXT[] = "selfcrypt.chunk.key";
    constexpr char NONCE_CONTEXT[] = "selfcrypt.chunk.nonce";
    constexpr char ASSOCIATED_DATA[] = "selfcrypt.chunk.v1";
}

ChunkKeys::~ChunkKeys() {
    sodium_memzero(key.data(), key.size());
    sodium_memzero(nonce.data(), nonce.size());
}

SelfEncryptor::SelfEncryptor() = default;

ChunkKeys SelfEncryptor::derive_keys(const crypto::Blake2bHash& previous_source_hash,
                                     const crypto::Blake2bHash& next_source_hash) {
    ChunkKeys keys;
    
    auto key_hash = crypto::hash_utils::hash_with_context(previous_source_hash, KEY_CONTEXT,
                                                          std::span(next_source_hash));
    std::copy(key_hash.begin(), key_hash.begin() + crypto::CHACHA20_KEY_SIZE, keys.key.begin());
    
    auto nonce_hash = crypto::hash_utils::hash_with_context(next_source_hash, NONCE_CONTEXT,
                                                            std::span(previous_source_hash));
    std::copy(nonce_hash.begin(), nonce_hash.begin() + crypto::CHACHA20_NONCE_SIZE, keys.nonce.begin());
    
    sodium_memzero(key_hash.data(), key_hash.size());
    return keys;
}

std::span<const std::uint8_t> SelfEncryptor::associated_data() {
    return std::span(reinterpret_cast<const std::uint8_t*>(ASSOCIATED_DATA), sizeof(ASSOCIATED_DATA) - 1);
}

core::Result SelfEncryptor::encrypt_chunk(std::uint32_t index,
                                          std::span<const std::uint8_t> plaintext,
                                          const crypto::Blake2bHash& source_hash,
                                          const crypto::Blake2bHash& previous_source_hash,
                                          const crypto::Blake2bHash& next_source_hash,
                                          EncryptedChunk& out_chunk) const {
    auto keys = derive_keys(previous_source_hash, next_source_hash);
    
    std::vector<std::uint8_t> ciphertext;
    auto result = engine_.encrypt(plaintext, associated_data(), keys.key, keys.nonce, ciphertext);
    if (!result) {
        LOG_CRITICAL("Encryption of chunk {} failed: {}", index, result.message);
        return core::Result(core::ErrorCode::ENCRYPTION_FAILED,
                            "Chunk " + std::to_string(index) + ": " + result.message);
    }
    
    out_chunk.descriptor.index = index;
    out_chunk.descriptor.source_hash = source_hash;
    out_chunk.descriptor.plaintext_size = plaintext.size();
    out_chunk.descriptor.ciphertext_size = ciphertext.size();
    out_chunk.chunk = storage::Chunk::from_ciphertext(std::move(ciphertext));
    out_chunk.descriptor.address = out_chunk.chunk.address;
    
    return core::Result();
}

core::Result SelfEncryptor::encrypt(const std::vector<std::vector<std::uint8_t>>& plaintext_chunks,
                                    std::vector<EncryptedChunk>& out_chunks) const {
    out_chunks.clear();
    
    if (plaintext_chunks.size() < storage::ChunkingPolicy::MIN_CHUNK_COUNT) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                            "Self-encryption needs at least " +
                            std::to_string(storage::ChunkingPolicy::MIN_CHUNK_COUNT) + " chunks, got " +
                            std::to_string(plaintext_chunks.size()));
    }
    
    std::vector<crypto::Blake2bHash> source_hashes;
    source_hashes.reserve(plaintext_chunks.size());
    for (const auto& chunk : plaintext_chunks) {
        if (chunk.empty()) {
            return core::Result(core::ErrorCode::EMPTY_INPUT, "Empty plaintext chunk");
        }
        source_hashes.push_back(crypto::Blake2bHasher::hash(chunk));
    }
    
    const size_t count = plaintext_chunks.size();
    out_chunks.resize(count);
    for (size_t i = 0; i < count; ++i) {
        auto result = encrypt_chunk(static_cast<std::uint32_t>(i),
                                    plaintext_chunks[i],
                                    source_hashes[i],
                                    source_hashes[(i + count - 1) % count],
                                    source_hashes[(i + 1) % count],
                                    out_chunks[i]);
        if (!result) {
            out_chunks.clear();
            return result;
        }
    }
    
    return core::Result();
}

core::Result SelfEncryptor::decrypt_chunk(const storage::DataMap& map,
                                          size_t index,
                                          std::span<const std::uint8_t> ciphertext,
                                          std::vector<std::uint8_t>& out_plaintext) const {
    if (index >= map.chunks.size()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                            "Chunk index " + std::to_string(index) + " outside data map");
    }
    
    const auto& descriptor = map.chunks[index];
    if (ciphertext.size() != descriptor.ciphertext_size) {
        return core::Result(core::ErrorCode::CORRUPT_CHUNK,
                            "Chunk " + std::to_string(index) + " is " + std::to_string(ciphertext.size()) +
                            " bytes, expected " + std::to_string(descriptor.ciphertext_size));
    }
    
    auto keys = derive_keys(map.previous_source_hash(index), map.next_source_hash(index));
    
    auto result = engine_.decrypt(ciphertext, associated_data(), keys.key, keys.nonce, out_plaintext);
    if (!result) {
        LOG_ERROR("Chunk {} ({}) failed authentication", index, storage::to_hex(descriptor.address));
        return core::Result(core::ErrorCode::CORRUPT_CHUNK,
                            "Chunk " + std::to_string(index) + ": " + result.message);
    }
    
    if (!crypto::hash_utils::verify_hash(out_plaintext, descriptor.source_hash)) {
        out_plaintext.clear();
        LOG_ERROR("Chunk {} plaintext does not match its recorded hash", index);
        return core::Result(core::ErrorCode::CORRUPT_CHUNK,
                            "Chunk " + std::to_string(index) + " plaintext hash mismatch");
    }
    
    return core::Result();
}

}
