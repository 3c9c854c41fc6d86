// =============================================================================
// bamseek - Index Chunk Tests
// =============================================================================

#include "bamseek/index/chunk.h"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <vector>

namespace bamseek::index {
namespace {

Chunk makeChunk(BlockAddress startBlock, BlockOffset startOffset, BlockAddress endBlock,
                BlockOffset endOffset) {
    return Chunk{VirtualOffset{startBlock, startOffset}, VirtualOffset{endBlock, endOffset}};
}

// =============================================================================
// Chunk Tests
// =============================================================================

TEST(ChunkTest, Accessors) {
    const auto chunk = makeChunk(100, 3, 500, 20);

    EXPECT_EQ(chunk.blockStart(), 100U);
    EXPECT_EQ(chunk.blockOffsetStart(), 3);
    EXPECT_EQ(chunk.blockEnd(), 500U);
    EXPECT_EQ(chunk.blockOffsetEnd(), 20);
    EXPECT_TRUE(chunk.isValid());
}

TEST(ChunkTest, ZeroEndOffsetExcludesEndBlock) {
    const auto chunk = makeChunk(100, 0, 500, 0);

    EXPECT_TRUE(chunk.excludesEndBlock());
    EXPECT_FALSE(chunk.isPastEnd(499));
    EXPECT_TRUE(chunk.isPastEnd(500));
    EXPECT_TRUE(chunk.isPastEnd(501));
}

TEST(ChunkTest, NonZeroEndOffsetIncludesEndBlock) {
    const auto chunk = makeChunk(100, 0, 500, 20);

    EXPECT_FALSE(chunk.excludesEndBlock());
    EXPECT_FALSE(chunk.isPastEnd(500));
    EXPECT_TRUE(chunk.isPastEnd(501));
}

TEST(ChunkTest, InvertedChunkIsInvalid) {
    EXPECT_FALSE(makeChunk(500, 0, 100, 0).isValid());
    EXPECT_FALSE(makeChunk(500, 9, 500, 8).isValid());
    EXPECT_TRUE(makeChunk(500, 8, 500, 8).isValid());
}

TEST(ChunkTest, FromPackedDecodesBothEnds) {
    const auto chunk = Chunk::fromPacked((100ULL << 16) | 7, (400ULL << 16) | 0);

    EXPECT_EQ(chunk, makeChunk(100, 7, 400, 0));
}

TEST(ChunkTest, ToStringIsHalfOpen) {
    EXPECT_EQ(makeChunk(100, 0, 500, 20).toString(), "[100:0, 500:20)");
}

// =============================================================================
// ChunkSequence Tests
// =============================================================================

TEST(ChunkSequenceTest, EmptyByDefault) {
    const ChunkSequence sequence;

    EXPECT_TRUE(sequence.empty());
    EXPECT_EQ(sequence.size(), 0U);
    EXPECT_EQ(sequence.firstBlockAddress(), std::nullopt);
    EXPECT_EQ(sequence.lastBlockAddress(), std::nullopt);
    EXPECT_TRUE(sequence.isWellFormed());
}

TEST(ChunkSequenceTest, PreservesOrderAndContents) {
    const ChunkSequence sequence({makeChunk(100, 0, 200, 0), makeChunk(400, 0, 600, 9)});

    ASSERT_EQ(sequence.size(), 2U);
    EXPECT_EQ(sequence[0].blockStart(), 100U);
    EXPECT_EQ(sequence[1].blockStart(), 400U);
    EXPECT_EQ(sequence.firstBlockAddress(), 100U);
    EXPECT_EQ(sequence.lastBlockAddress(), 600U);

    std::size_t count = 0;
    for (const auto& chunk : sequence) {
        EXPECT_TRUE(chunk.isValid());
        ++count;
    }
    EXPECT_EQ(count, 2U);
}

TEST(ChunkSequenceTest, DetectsUnsortedChunks) {
    const ChunkSequence sequence({makeChunk(400, 0, 600, 0), makeChunk(100, 0, 200, 0)});

    EXPECT_FALSE(sequence.isSorted());
    EXPECT_FALSE(sequence.isWellFormed());
}

TEST(ChunkSequenceTest, EqualStartsCountAsSorted) {
    const ChunkSequence sequence({makeChunk(100, 0, 600, 0), makeChunk(100, 0, 200, 0)});

    EXPECT_TRUE(sequence.isSorted());
}

TEST(ChunkSequenceTest, DetectsInvalidChunk) {
    const ChunkSequence sequence({makeChunk(100, 0, 200, 0), makeChunk(400, 0, 300, 0)});

    EXPECT_TRUE(sequence.isSorted());
    EXPECT_FALSE(sequence.isWellFormed());
}

TEST(ChunkSequenceTest, FromPackedPairs) {
    const std::array<std::uint64_t, 4> packed{(100ULL << 16), (200ULL << 16) | 5,
                                              (400ULL << 16) | 1, (600ULL << 16)};

    auto result = ChunkSequence::fromPackedPairs(packed);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2U);
    EXPECT_EQ((*result)[0], makeChunk(100, 0, 200, 5));
    EXPECT_EQ((*result)[1], makeChunk(400, 1, 600, 0));
}

TEST(ChunkSequenceTest, FromPackedPairsRejectsOddCount) {
    const std::vector<std::uint64_t> packed{1, 2, 3};

    auto result = ChunkSequence::fromPackedPairs(packed);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

}  // namespace
}  // namespace bamseek::index
