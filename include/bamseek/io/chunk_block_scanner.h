// =============================================================================
// bamseek - Chunk Block Scanner
// =============================================================================
// The block-read loop for index-assisted access: asks a ChunkPositionTracker
// where to read, reads that block from a BlockSource, and reports the
// resulting position back to the tracker.
//
// Usage:
//   BgzfBlockSource source(path);
//   source.open();
//   ChunkPositionTracker tracker(chunks, readerId, streamId);
//   ChunkBlockScanner scanner(tracker, source);
//   auto stats = scanner.scan([&](const BlockExtent& extent) { ... });
//
// The scanner holds references only; tracker and source must outlive it.
// =============================================================================

#ifndef BAMSEEK_IO_CHUNK_BLOCK_SCANNER_H
#define BAMSEEK_IO_CHUNK_BLOCK_SCANNER_H

#include <cstdint>
#include <functional>
#include <optional>

#include "bamseek/io/block_source.h"
#include "bamseek/reader/chunk_position_tracker.h"

namespace bamseek::io {

/// @brief Scanner configuration.
struct ScanOptions {
    /// @brief Stop after this many blocks. 0 = unlimited.
    std::uint64_t maxBlocks = 0;

    /// @brief Do not report the BGZF EOF marker block to visitors.
    bool skipEofMarker = true;
};

/// @brief Counters accumulated over a scan.
struct ScanStats {
    std::uint64_t blocksVisited = 0;
    std::uint64_t bytesVisited = 0;

    /// @brief Reads that did not continue where the previous block ended.
    std::uint64_t seeks = 0;
};

/// @brief Drives a tracker and a block source through the chunks.
class ChunkBlockScanner {
public:
    using BlockVisitor = std::function<void(const BlockExtent&)>;

    ChunkBlockScanner(reader::ChunkPositionTracker& tracker, BlockSource& source,
                      ScanOptions options = {});

    /// @brief Read the next block the tracker directs to.
    /// @return The block's extent, or nullopt once the tracker is exhausted or the
    ///         reader has reached exactly the end of the file.
    /// @throws FormatError if the tracker addresses a position past end of file.
    std::optional<BlockExtent> next();

    /// @brief Visit every remaining block, honouring ScanOptions.
    ScanStats scan(const BlockVisitor& visitor);

    /// @brief Counters for the blocks returned so far.
    [[nodiscard]] const ScanStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const ScanOptions& options() const noexcept { return options_; }

private:
    reader::ChunkPositionTracker& tracker_;
    BlockSource& source_;
    ScanOptions options_;
    ScanStats stats_;
    std::optional<BlockAddress> expectedAddress_;
};

}  // namespace bamseek::io

#endif  // BAMSEEK_IO_CHUNK_BLOCK_SCANNER_H
