#pragma once

#include "selfcrypt/core/result.hpp"
#include "selfcrypt/crypto/encryption.hpp"
#include "selfcrypt/storage/chunk.hpp"
#include "selfcrypt/storage/data_map.hpp"
#include <span>
#include <vector>

namespace selfcrypt::encrypt {

struct ChunkKeys {
    crypto::ChaCha20Key key{};
    crypto::ChaCha20Nonce nonce{};
    
    ~ChunkKeys();
};

struct EncryptedChunk {
    storage::Chunk chunk;
    storage::ChunkDescriptor descriptor;
};

// Convergent chunk encryption. The key and nonce of chunk i come from the
// plaintext hashes of chunks i-1 and i+1 (cyclically), so the same input
// always yields the same ciphertext and no secret has to be kept apart
// from the data map.
class SelfEncryptor {
public:
    SelfEncryptor();
    
    static ChunkKeys derive_keys(const crypto::Blake2bHash& previous_source_hash,
                                 const crypto::Blake2bHash& next_source_hash);
    
    static std::span<const std::uint8_t> associated_data();
    
    core::Result encrypt_chunk(std::uint32_t index,
                               std::span<const std::uint8_t> plaintext,
                               const crypto::Blake2bHash& source_hash,
                               const crypto::Blake2bHash& previous_source_hash,
                               const crypto::Blake2bHash& next_source_hash,
                               EncryptedChunk& out_chunk) const;
    
    // Encrypts an ordered chunk sequence of at least three chunks
    core::Result encrypt(const std::vector<std::vector<std::uint8_t>>& plaintext_chunks,
                         std::vector<EncryptedChunk>& out_chunks) const;
    
    // Everything needed comes from the map, so chunks decrypt independently
    core::Result decrypt_chunk(const storage::DataMap& map,
                               size_t index,
                               std::span<const std::uint8_t> ciphertext,
                               std::vector<std::uint8_t>& out_plaintext) const;

private:
    crypto::EncryptionEngine engine_;
};

}
