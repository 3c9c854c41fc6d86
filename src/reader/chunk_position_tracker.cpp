// =============================================================================
// bamseek - Chunk Position Tracker Implementation
// =============================================================================

#include "bamseek/reader/chunk_position_tracker.h"

#include <format>
#include <utility>

#include "bamseek/common/error.h"
#include "bamseek/common/logger.h"

namespace bamseek::reader {

ChunkPositionTracker::ChunkPositionTracker(index::ChunkSequence chunks, ReaderId readerId,
                                           StreamId streamId)
    : chunks_(std::move(chunks)), readerId_(readerId), streamId_(streamId) {
    initialize();
}

std::optional<index::Chunk> ChunkPositionTracker::currentChunk() const noexcept {
    if (isExhausted()) {
        return std::nullopt;
    }
    return chunks_[cursor_];
}

void ChunkPositionTracker::reset() noexcept {
    initialize();
}

void ChunkPositionTracker::initialize() noexcept {
    cursor_ = 0;
    lastFilePosition_.reset();
    if (chunks_.empty()) {
        nextBlockAddress_.reset();
    } else {
        nextBlockAddress_ = chunks_[0].blockStart();
    }
}

void ChunkPositionTracker::advancePosition(BlockAddress filePosition) {
    if (lastFilePosition_.has_value() && filePosition < *lastFilePosition_) {
        throw InvalidStateError(
            std::format("file position moved backwards from {} to {} (reader {})",
                        *lastFilePosition_, filePosition, readerId_.value),
            ErrorContext{}.withBlockAddress(filePosition).withChunk(cursor_));
    }
    lastFilePosition_ = filePosition;

    if (isExhausted()) {
        return;
    }

    nextBlockAddress_ = filePosition;

    // Coordinates are half-open: see Chunk::isPastEnd().
    while (!isExhausted() && isFilePositionPastEndOfChunk(filePosition, cursor_)) {
        ++cursor_;

        if (isExhausted()) {
            nextBlockAddress_.reset();
            BAMSEEK_LOG_TRACE("reader {}: all {} chunks consumed at {}", readerId_.value,
                              chunks_.size(), filePosition);
            break;
        }

        BAMSEEK_LOG_TRACE("reader {}: entering chunk {} {}", readerId_.value, cursor_,
                          chunks_[cursor_].toString());

        if (filePosition < chunks_[cursor_].blockStart()) {
            nextBlockAddress_ = chunks_[cursor_].blockStart();
            break;
        }
    }
}

bool ChunkPositionTracker::isFilePositionPastEndOfChunk(BlockAddress filePosition,
                                                        ChunkIndex chunkIndex) const {
    const index::Chunk& chunk = chunks_[chunkIndex];
    if (!chunk.isValid()) {
        throw InvariantViolationError(
            std::format("chunk {} ends before it starts: {}", chunkIndex, chunk.toString()),
            ErrorContext{}.withChunk(chunkIndex).withOffset(chunk.start.pack()));
    }
    return chunk.isPastEnd(filePosition);
}

}  // namespace bamseek::reader
