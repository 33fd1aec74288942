#include <gtest/gtest.h>
#include "selfcrypt/crypto/hash.hpp"
#include "selfcrypt/storage/data_map.hpp"
#include <string>
#include <vector>

namespace selfcrypt::storage::test {

class DataMapTest : public ::testing::Test {
protected:
    DataMap make_chunked_map(std::uint32_t chunk_count, std::uint64_t chunk_size) {
        DataMap map;
        map.level = 0;
        map.total_size = chunk_count * chunk_size;
        map.checksum = crypto::hash_utils::hash_string("stream");
        
        for (std::uint32_t i = 0; i < chunk_count; ++i) {
            ChunkDescriptor descriptor;
            descriptor.index = i;
            descriptor.address = crypto::hash_utils::hash_string("address-" + std::to_string(i));
            descriptor.source_hash = crypto::hash_utils::hash_string("source-" + std::to_string(i));
            descriptor.plaintext_size = chunk_size;
            descriptor.ciphertext_size = chunk_size + crypto::AEAD_TAG_SIZE;
            map.chunks.push_back(descriptor);
        }
        return map;
    }
};

TEST_F(DataMapTest, InlineMap) {
    std::vector<std::uint8_t> data = {1, 2, 3, 4, 5};
    auto map = DataMap::make_inline(data);
    
    EXPECT_TRUE(map.is_inline());
    EXPECT_FALSE(map.is_indirect());
    EXPECT_EQ(map.total_size, 5u);
    EXPECT_EQ(map.content, data);
    EXPECT_EQ(map.checksum, crypto::Blake2bHasher::hash(data));
    EXPECT_TRUE(map.validate());
}

TEST_F(DataMapTest, EmptyStreamIsInline) {
    auto map = DataMap::make_inline({});
    
    EXPECT_TRUE(map.is_inline());
    EXPECT_EQ(map.total_size, 0u);
    EXPECT_TRUE(map.validate());
    EXPECT_EQ(map.serialized_size(), DataMap::HEADER_SIZE);
}

TEST_F(DataMapTest, SerializationRoundTrip) {
    auto map = make_chunked_map(5, 4096);
    auto bytes = map.serialize();
    
    EXPECT_EQ(bytes.size(), map.serialized_size());
    EXPECT_EQ(bytes.size(), DataMap::HEADER_SIZE + 5 * DataMap::DESCRIPTOR_SIZE);
    
    // Big-endian "SCDM" magic then the version byte
    EXPECT_EQ(bytes[0], 'S');
    EXPECT_EQ(bytes[1], 'C');
    EXPECT_EQ(bytes[2], 'D');
    EXPECT_EQ(bytes[3], 'M');
    EXPECT_EQ(bytes[4], DataMap::VERSION);
    
    DataMap decoded;
    ASSERT_TRUE(DataMap::deserialize(bytes, decoded));
    EXPECT_EQ(decoded, map);
}

TEST_F(DataMapTest, InlineSerializationRoundTrip) {
    std::vector<std::uint8_t> data(300, 0x5A);
    auto map = DataMap::make_inline(data);
    
    DataMap decoded;
    ASSERT_TRUE(DataMap::deserialize(map.serialize(), decoded));
    EXPECT_EQ(decoded, map);
}

TEST_F(DataMapTest, NeighbourSourceHashesWrap) {
    auto map = make_chunked_map(3, 100);
    
    EXPECT_EQ(map.previous_source_hash(0), map.chunks[2].source_hash);
    EXPECT_EQ(map.next_source_hash(0), map.chunks[1].source_hash);
    EXPECT_EQ(map.previous_source_hash(2), map.chunks[1].source_hash);
    EXPECT_EQ(map.next_source_hash(2), map.chunks[0].source_hash);
    
    EXPECT_THROW(map.previous_source_hash(3), std::out_of_range);
}

TEST_F(DataMapTest, ChunkOffsets) {
    auto map = make_chunked_map(4, 1000);
    
    EXPECT_EQ(map.chunk_offset(0), 0u);
    EXPECT_EQ(map.chunk_offset(2), 2000u);
    EXPECT_EQ(map.chunk_offset(4), 4000u);
}

TEST_F(DataMapTest, RejectsBadMagicAndVersion) {
    auto bytes = make_chunked_map(3, 100).serialize();
    DataMap decoded;
    
    auto bad_magic = bytes;
    bad_magic[0] = 'X';
    EXPECT_EQ(DataMap::deserialize(bad_magic, decoded).error, core::ErrorCode::MALFORMED_DATA_MAP);
    
    auto bad_version = bytes;
    bad_version[4] = 2;
    EXPECT_EQ(DataMap::deserialize(bad_version, decoded).error, core::ErrorCode::MALFORMED_DATA_MAP);
}

TEST_F(DataMapTest, RejectsTruncationAndTrailingBytes) {
    auto bytes = make_chunked_map(3, 100).serialize();
    DataMap decoded;
    
    for (size_t length : {size_t{0}, size_t{3}, size_t{20}, bytes.size() - 1}) {
        std::vector<std::uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(length));
        EXPECT_EQ(DataMap::deserialize(truncated, decoded).error, core::ErrorCode::MALFORMED_DATA_MAP)
            << "length " << length;
    }
    
    auto extended = bytes;
    extended.push_back(0);
    EXPECT_EQ(DataMap::deserialize(extended, decoded).error, core::ErrorCode::MALFORMED_DATA_MAP);
}

TEST_F(DataMapTest, RejectsHugeDescriptorCount) {
    auto bytes = make_chunked_map(3, 100).serialize();
    
    // Descriptor count sits right after the checksum
    size_t count_offset = 4 + 1 + 4 + 8 + crypto::BLAKE2B_HASH_SIZE;
    bytes[count_offset] = 0xFF;
    
    DataMap decoded;
    EXPECT_EQ(DataMap::deserialize(bytes, decoded).error, core::ErrorCode::MALFORMED_DATA_MAP);
}

TEST_F(DataMapTest, ValidateCatchesInconsistencies) {
    auto out_of_order = make_chunked_map(3, 100);
    out_of_order.chunks[1].index = 2;
    EXPECT_EQ(out_of_order.validate().error, core::ErrorCode::MALFORMED_DATA_MAP);
    
    auto bad_sizes = make_chunked_map(3, 100);
    bad_sizes.chunks[0].ciphertext_size = 100;
    EXPECT_FALSE(bad_sizes.validate());
    
    auto wrong_total = make_chunked_map(3, 100);
    wrong_total.total_size = 301;
    EXPECT_FALSE(wrong_total.validate());
    
    auto both = make_chunked_map(3, 100);
    both.content = {1, 2, 3};
    EXPECT_FALSE(both.validate());
    
    auto inline_with_level = DataMap::make_inline(std::vector<std::uint8_t>{1});
    inline_with_level.level = 1;
    EXPECT_FALSE(inline_with_level.validate());
}

TEST_F(DataMapTest, DeserializeRunsValidation) {
    auto map = make_chunked_map(3, 100);
    map.total_size = 999;
    
    DataMap decoded;
    EXPECT_EQ(DataMap::deserialize(map.serialize(), decoded).error, core::ErrorCode::MALFORMED_DATA_MAP);
    
    // An indirect map claiming an absurd size must not get past decoding
    auto huge = make_chunked_map(1, 1ULL << 62);
    huge.level = 1;
    EXPECT_EQ(DataMap::deserialize(huge.serialize(), decoded).error, core::ErrorCode::MALFORMED_DATA_MAP);
    
    auto huge_chunks = make_chunked_map(3, 1ULL << 40);
    huge_chunks.level = 1;
    EXPECT_EQ(DataMap::deserialize(huge_chunks.serialize(), decoded).error, core::ErrorCode::MALFORMED_DATA_MAP);
}

TEST_F(DataMapTest, ChunkSizesBoundedByPolicy) {
    ChunkingPolicy policy;
    
    EXPECT_TRUE(make_chunked_map(3, policy.largest_chunk_size()).validate(policy));
    EXPECT_EQ(make_chunked_map(3, policy.largest_chunk_size() + 1).validate(policy).error,
              core::ErrorCode::MALFORMED_DATA_MAP);
    
    ChunkingPolicy small{1024, 64};
    EXPECT_FALSE(make_chunked_map(3, 4096).validate(small));
    EXPECT_TRUE(make_chunked_map(3, 4096).validate());
}

TEST_F(DataMapTest, ChunkedMapNeedsMinimumChunkCount) {
    EXPECT_EQ(make_chunked_map(2, 100).validate().error, core::ErrorCode::MALFORMED_DATA_MAP);
    EXPECT_EQ(make_chunked_map(1, 100).validate().error, core::ErrorCode::MALFORMED_DATA_MAP);
    EXPECT_TRUE(make_chunked_map(3, 100).validate());
}

}
