// =============================================================================
// bamseek - Chunk Position Tracker
// =============================================================================
// Navigation state for index-assisted random access into a BGZF file.
//
// A block-read loop drives the tracker:
//
//   ChunkPositionTracker tracker(std::move(chunks), readerId, streamId);
//   while (auto address = tracker.getBlockAddress()) {
//       auto extent = source.readBlock(*address);
//       tracker.advancePosition(extent->nextAddress());
//   }
//
// After each block the loop reports the file position it reached. The tracker
// either keeps that position (continue sequentially), replaces it with the
// start of the next chunk (seek over a gap), or reports nullopt (done).
//
// States: AT_CHUNK(i) while cursor() < chunks().size(), EXHAUSTED otherwise.
// EXHAUSTED is terminal until reset().
//
// Reported positions must not decrease between resets; a position lower than
// the previous one is rejected with InvalidStateError and leaves the tracker
// unchanged.
// =============================================================================

#ifndef BAMSEEK_READER_CHUNK_POSITION_TRACKER_H
#define BAMSEEK_READER_CHUNK_POSITION_TRACKER_H

#include <optional>

#include "bamseek/common/types.h"
#include "bamseek/index/chunk.h"
#include "bamseek/reader/reader_id.h"

namespace bamseek::reader {

/// @brief Tracks which chunk a reader is in and where it must read next.
/// @note Not thread-safe. One tracker per reader/stream pair.
class ChunkPositionTracker {
public:
    /// @brief Bind to a chunk sequence and initialize navigation state.
    /// @param chunks Chunks in non-decreasing start order. Not validated.
    /// @param readerId Reader this tracker belongs to (not owned).
    /// @param streamId Block stream this tracker directs (not owned).
    ChunkPositionTracker(index::ChunkSequence chunks, ReaderId readerId, StreamId streamId);

    [[nodiscard]] ReaderId readerId() const noexcept { return readerId_; }
    [[nodiscard]] StreamId streamId() const noexcept { return streamId_; }

    [[nodiscard]] const index::ChunkSequence& chunks() const noexcept { return chunks_; }

    /// @brief Block address to seek to and read next.
    /// @return nullopt when the sequence is empty or exhausted.
    [[nodiscard]] std::optional<BlockAddress> getBlockAddress() const noexcept {
        return nextBlockAddress_;
    }

    /// @brief Index of the chunk being consumed; equals chunks().size() when exhausted.
    [[nodiscard]] ChunkIndex cursor() const noexcept { return cursor_; }

    /// @brief Chunk being consumed, or nullopt when exhausted.
    [[nodiscard]] std::optional<index::Chunk> currentChunk() const noexcept;

    [[nodiscard]] bool isExhausted() const noexcept { return cursor_ >= chunks_.size(); }

    /// @brief Position passed to the most recent advancePosition() since the last reset.
    [[nodiscard]] std::optional<BlockAddress> lastFilePosition() const noexcept {
        return lastFilePosition_;
    }

    /// @brief Rewind to the first chunk without touching the chunk sequence.
    void reset() noexcept;

    /// @brief Report the block address the reader has reached.
    /// @param filePosition Address of the next unread block in the file.
    /// @throws InvalidStateError if filePosition is lower than the previous report.
    /// @throws InvariantViolationError if a chunk's end precedes its start.
    void advancePosition(BlockAddress filePosition);

private:
    void initialize() noexcept;

    /// @brief Half-open end check with chunk consistency enforcement.
    [[nodiscard]] bool isFilePositionPastEndOfChunk(BlockAddress filePosition,
                                                    ChunkIndex chunkIndex) const;

    index::ChunkSequence chunks_;
    ReaderId readerId_;
    StreamId streamId_;

    ChunkIndex cursor_ = 0;
    std::optional<BlockAddress> nextBlockAddress_;
    std::optional<BlockAddress> lastFilePosition_;
};

}  // namespace bamseek::reader

#endif  // BAMSEEK_READER_CHUNK_POSITION_TRACKER_H
