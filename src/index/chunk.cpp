// =============================================================================
// bamseek - Index Chunks Implementation
// =============================================================================

#include "bamseek/index/chunk.h"

#include <algorithm>
#include <format>

namespace bamseek::index {

// =============================================================================
// Chunk Implementation
// =============================================================================

std::string Chunk::toString() const {
    return std::format("[{}, {})", start.toString(), end.toString());
}

// =============================================================================
// ChunkSequence Implementation
// =============================================================================

Result<ChunkSequence> ChunkSequence::fromPackedPairs(std::span<const std::uint64_t> packed) {
    if (packed.size() % 2 != 0) {
        return makeError<ChunkSequence>(
            ErrorCode::kFormatError,
            std::format("chunk offsets must come in pairs, got {} values", packed.size()));
    }

    std::vector<Chunk> chunks;
    chunks.reserve(packed.size() / 2);
    for (std::size_t i = 0; i < packed.size(); i += 2) {
        chunks.push_back(Chunk::fromPacked(packed[i], packed[i + 1]));
    }
    return ChunkSequence(std::move(chunks));
}

bool ChunkSequence::isSorted() const noexcept {
    return std::is_sorted(chunks_.begin(), chunks_.end(),
                          [](const Chunk& a, const Chunk& b) { return a.start < b.start; });
}

bool ChunkSequence::isWellFormed() const noexcept {
    return isSorted() &&
           std::all_of(chunks_.begin(), chunks_.end(),
                       [](const Chunk& chunk) { return chunk.isValid(); });
}

std::optional<BlockAddress> ChunkSequence::firstBlockAddress() const noexcept {
    if (chunks_.empty()) {
        return std::nullopt;
    }
    return chunks_.front().blockStart();
}

std::optional<BlockAddress> ChunkSequence::lastBlockAddress() const noexcept {
    if (chunks_.empty()) {
        return std::nullopt;
    }
    return chunks_.back().blockEnd();
}

}  // namespace bamseek::index
