#include "selfcrypt/storage/chunk.hpp"
#include "selfcrypt/crypto/hash.hpp"

namespace selfcrypt::storage {

Chunk Chunk::from_ciphertext(std::vector<std::uint8_t> bytes) {
    auto address = crypto::Blake2bHasher::hash(bytes);
    return Chunk(address, std::move(bytes));
}

bool Chunk::verify() const {
    return crypto::hash_utils::verify_hash(data, address);
}

std::string to_hex(const Address& address) {
    return crypto::hash_utils::hash_to_hex(address);
}

}
