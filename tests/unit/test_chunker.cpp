#include <gtest/gtest.h>
#include "selfcrypt/storage/chunker.hpp"
#include <numeric>
#include <stdexcept>
#include <vector>

namespace selfcrypt::storage::test {

class ChunkerTest : public ::testing::Test {
protected:
    static constexpr std::uint64_t KB = 1024;
    static constexpr std::uint64_t MB = 1024 * 1024;
    
    Chunker chunker_;
    
    std::uint64_t planned_total(std::uint64_t total_size) {
        std::uint64_t sum = 0;
        std::uint64_t expected_offset = 0;
        for (const auto& span : chunker_.plan(total_size)) {
            EXPECT_EQ(span.offset, expected_offset);
            expected_offset += span.size;
            sum += span.size;
        }
        return sum;
    }
};

TEST_F(ChunkerTest, InlineBelowMinimum) {
    EXPECT_TRUE(chunker_.is_inline_size(0));
    EXPECT_TRUE(chunker_.is_inline_size(3 * KB - 1));
    EXPECT_FALSE(chunker_.is_inline_size(3 * KB));
    
    EXPECT_EQ(chunker_.chunk_count(3 * KB - 1), 0u);
    EXPECT_TRUE(chunker_.plan(100).empty());
}

TEST_F(ChunkerTest, ThreeChunksBelowThreeMax) {
    EXPECT_EQ(chunker_.chunk_count(3 * KB), 3u);
    EXPECT_EQ(chunker_.chunk_count(3 * MB - 1), 3u);
    
    // 10000 / 3 = 3333, the last takes the remainder
    EXPECT_EQ(chunker_.chunk_size(10000, 0), 3333u);
    EXPECT_EQ(chunker_.chunk_size(10000, 1), 3333u);
    EXPECT_EQ(chunker_.chunk_size(10000, 2), 3334u);
    EXPECT_EQ(chunker_.chunk_size(10000, 3), 0u);
}

TEST_F(ChunkerTest, MaxSizedChunksAboveThreeMax) {
    EXPECT_EQ(chunker_.chunk_count(3 * MB), 3u);
    EXPECT_EQ(chunker_.chunk_size(3 * MB, 2), MB);
    
    EXPECT_EQ(chunker_.chunk_count(10 * MB), 10u);
    for (std::uint32_t i = 0; i < 10; ++i) {
        EXPECT_EQ(chunker_.chunk_size(10 * MB, i), MB);
    }
    
    auto size = 5 * MB + 300 * KB;
    EXPECT_EQ(chunker_.chunk_count(size), 6u);
    EXPECT_EQ(chunker_.chunk_size(size, 4), MB);
    EXPECT_EQ(chunker_.chunk_size(size, 5), 300 * KB);
}

TEST_F(ChunkerTest, ShortTailBorrowsFromPenultimate) {
    auto size = 4 * MB + 10;
    ASSERT_EQ(chunker_.chunk_count(size), 5u);
    
    EXPECT_EQ(chunker_.chunk_size(size, 2), MB);
    EXPECT_EQ(chunker_.chunk_size(size, 3), MB - KB);
    EXPECT_EQ(chunker_.chunk_size(size, 4), KB + 10);
    
    for (std::uint32_t i = 0; i < 5; ++i) {
        EXPECT_GE(chunker_.chunk_size(size, i), KB);
    }
}

TEST_F(ChunkerTest, ChunksNeverExceedLargestChunkSize) {
    const auto& policy = chunker_.policy();
    for (std::uint64_t total : {3 * MB - 1, 3 * MB - 2, 3 * MB, 3 * MB + 1, 10 * MB + 7}) {
        for (const auto& span : chunker_.plan(total)) {
            EXPECT_LE(span.size, policy.largest_chunk_size()) << total << " bytes, chunk " << span.index;
        }
    }
    
    // Two bytes of remainder land on the last of three chunks
    auto spans = chunker_.plan(3 * MB - 1);
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[2].size, MB + 1);
}

TEST_F(ChunkerTest, PlanCoversInputExactly) {
    for (std::uint64_t size : {3 * KB, 3 * KB + 1, 100 * KB, 3 * MB, 3 * MB + 1, 7 * MB + 1023, 12 * MB}) {
        EXPECT_EQ(planned_total(size), size) << "size " << size;
    }
}

TEST_F(ChunkerTest, SplitMatchesPlan) {
    std::vector<std::uint8_t> data(3 * MB + 17);
    std::iota(data.begin(), data.end(), 0);
    
    std::vector<std::vector<std::uint8_t>> chunks;
    ASSERT_TRUE(chunker_.split(data, chunks));
    
    auto plan = chunker_.plan(data.size());
    ASSERT_EQ(chunks.size(), plan.size());
    
    std::vector<std::uint8_t> joined;
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].size(), plan[i].size);
        joined.insert(joined.end(), chunks[i].begin(), chunks[i].end());
    }
    EXPECT_EQ(joined, data);
}

TEST_F(ChunkerTest, SplitRejectsEmptyAndSmallInput) {
    std::vector<std::vector<std::uint8_t>> chunks;
    
    std::vector<std::uint8_t> empty;
    EXPECT_EQ(chunker_.split(empty, chunks).error, core::ErrorCode::EMPTY_INPUT);
    
    std::vector<std::uint8_t> small(100, 0xAB);
    EXPECT_EQ(chunker_.split(small, chunks).error, core::ErrorCode::INPUT_TOO_SMALL);
    EXPECT_TRUE(chunks.empty());
}

TEST_F(ChunkerTest, CustomPolicy) {
    Chunker small(ChunkingPolicy{1024, 64});
    
    EXPECT_TRUE(small.is_inline_size(191));
    EXPECT_EQ(small.chunk_count(192), 3u);
    EXPECT_EQ(small.chunk_count(1024 * 1024), 1024u);
}

TEST_F(ChunkerTest, RejectsInvalidPolicy) {
    EXPECT_THROW({ Chunker chunker(ChunkingPolicy{1000, 600}); }, std::invalid_argument);
    EXPECT_THROW({ Chunker chunker(ChunkingPolicy{1024, 0}); }, std::invalid_argument);
}

}
