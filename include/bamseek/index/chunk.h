// =============================================================================
// bamseek - Index Chunks
// =============================================================================
// Chunks are the unit an index hands to the reader: half-open ranges of
// virtual offsets that may contain records overlapping a query.
//
// This module provides:
// - Chunk: a single [start, end) range with the BAM half-open block rule
// - ChunkSequence: an immutable, start-ordered list of chunks
//
// Half-open rule: a chunk covers block end.blockAddress unless
// end.offsetInBlock == 0, in which case it stops at the end of the previous
// block.
// =============================================================================

#ifndef BAMSEEK_INDEX_CHUNK_H
#define BAMSEEK_INDEX_CHUNK_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "bamseek/common/error.h"
#include "bamseek/common/types.h"
#include "bamseek/index/virtual_offset.h"

namespace bamseek::index {

// =============================================================================
// Chunk
// =============================================================================

/// @brief Half-open range [start, end) of virtual offsets.
struct Chunk {
    VirtualOffset start;
    VirtualOffset end;

    /// @brief Build from the two packed virtual offsets stored in an index.
    [[nodiscard]] static constexpr Chunk fromPacked(std::uint64_t startPacked,
                                                    std::uint64_t endPacked) noexcept {
        return Chunk{VirtualOffset::unpack(startPacked), VirtualOffset::unpack(endPacked)};
    }

    [[nodiscard]] constexpr BlockAddress blockStart() const noexcept { return start.blockAddress; }

    [[nodiscard]] constexpr BlockOffset blockOffsetStart() const noexcept {
        return start.offsetInBlock;
    }

    [[nodiscard]] constexpr BlockAddress blockEnd() const noexcept { return end.blockAddress; }

    [[nodiscard]] constexpr BlockOffset blockOffsetEnd() const noexcept {
        return end.offsetInBlock;
    }

    /// @brief True when start <= end.
    [[nodiscard]] constexpr bool isValid() const noexcept { return start <= end; }

    /// @brief True when the block at end.blockAddress is not part of the chunk.
    [[nodiscard]] constexpr bool excludesEndBlock() const noexcept {
        return end.offsetInBlock == 0;
    }

    /// @brief True when a reader positioned at filePosition has consumed this chunk.
    /// @param filePosition Block address the reader has reached.
    [[nodiscard]] constexpr bool isPastEnd(BlockAddress filePosition) const noexcept {
        return filePosition > end.blockAddress ||
               (filePosition == end.blockAddress && excludesEndBlock());
    }

    /// @brief Render as "[start, end)".
    [[nodiscard]] std::string toString() const;

    friend constexpr bool operator==(const Chunk&, const Chunk&) = default;
};

// =============================================================================
// ChunkSequence
// =============================================================================

/// @brief Immutable list of chunks in non-decreasing start order.
/// @note Ordering is the index layer's responsibility; nothing here sorts.
class ChunkSequence {
public:
    using const_iterator = std::vector<Chunk>::const_iterator;

    ChunkSequence() = default;

    explicit ChunkSequence(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

    /// @brief Build from a flat array of packed offsets: start0, end0, start1, end1, ...
    /// @return kFormatError if the array has an odd number of elements.
    [[nodiscard]] static Result<ChunkSequence> fromPackedPairs(
        std::span<const std::uint64_t> packed);

    [[nodiscard]] std::size_t size() const noexcept { return chunks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return chunks_.empty(); }

    [[nodiscard]] const Chunk& operator[](ChunkIndex index) const noexcept {
        return chunks_[index];
    }

    [[nodiscard]] const_iterator begin() const noexcept { return chunks_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return chunks_.end(); }

    [[nodiscard]] std::span<const Chunk> chunks() const noexcept { return chunks_; }

    /// @brief True when chunk starts never decrease.
    [[nodiscard]] bool isSorted() const noexcept;

    /// @brief True when sorted and every chunk satisfies start <= end.
    [[nodiscard]] bool isWellFormed() const noexcept;

    /// @brief Block address of the first chunk's start, if any.
    [[nodiscard]] std::optional<BlockAddress> firstBlockAddress() const noexcept;

    /// @brief Block address of the last chunk's end, if any.
    [[nodiscard]] std::optional<BlockAddress> lastBlockAddress() const noexcept;

    friend bool operator==(const ChunkSequence&, const ChunkSequence&) = default;

private:
    std::vector<Chunk> chunks_;
};

}  // namespace bamseek::index

#endif  // BAMSEEK_INDEX_CHUNK_H
