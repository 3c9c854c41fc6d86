// =============================================================================
// bamseek - Chunk Block Scanner Implementation
// =============================================================================

#include "bamseek/io/chunk_block_scanner.h"

#include <format>
#include <string>

#include "bamseek/common/error.h"
#include "bamseek/common/logger.h"

namespace bamseek::io {

ChunkBlockScanner::ChunkBlockScanner(reader::ChunkPositionTracker& tracker, BlockSource& source,
                                     ScanOptions options)
    : tracker_(tracker), source_(source), options_(options) {}

std::optional<BlockExtent> ChunkBlockScanner::next() {
    while (true) {
        const auto address = tracker_.getBlockAddress();
        if (!address.has_value()) {
            return std::nullopt;
        }

        const std::uint64_t fileSize = source_.size();
        if (*address == fileSize) {
            // Sequential reading ran off the end of the last block.
            BAMSEEK_LOG_DEBUG("reader {}: reached end of file at {} inside chunk {}",
                              tracker_.readerId().value, fileSize, tracker_.cursor());
            return std::nullopt;
        }
        if (*address > fileSize) {
            throw FormatError(std::format("chunk {} addresses block {} beyond end of file ({} bytes)",
                                          tracker_.cursor(), *address, fileSize),
                              ErrorContext{}.withBlockAddress(*address).withChunk(tracker_.cursor()));
        }

        const auto extent = source_.readBlock(*address);
        if (!extent.has_value()) {
            throw FormatError("block source returned no block inside the file",
                              ErrorContext{}.withBlockAddress(*address));
        }

        const bool seeked = !expectedAddress_.has_value() || *expectedAddress_ != extent->address;
        expectedAddress_ = extent->nextAddress();
        tracker_.advancePosition(extent->nextAddress());

        if (options_.skipEofMarker && source_.isEofMarker(*extent)) {
            continue;
        }

        ++stats_.blocksVisited;
        stats_.bytesVisited += extent->compressedSize;
        if (seeked) {
            ++stats_.seeks;
        }
        return extent;
    }
}

ScanStats ChunkBlockScanner::scan(const BlockVisitor& visitor) {
    try {
        while (options_.maxBlocks == 0 || stats_.blocksVisited < options_.maxBlocks) {
            const auto extent = next();
            if (!extent.has_value()) {
                break;
            }
            visitor(*extent);
        }
    } catch (const InvariantViolationError& ex) {
        BAMSEEK_LOG_CRITICAL("reader {}: aborting scan: {}", tracker_.readerId().value,
                             std::string(ex.what()));
        throw;
    }

    BAMSEEK_LOG_DEBUG("reader {}: scanned {} blocks ({} bytes, {} seeks), exhausted={}",
                      tracker_.readerId().value, stats_.blocksVisited, stats_.bytesVisited,
                      stats_.seeks, tracker_.isExhausted());
    return stats_;
}

}  // namespace bamseek::io
