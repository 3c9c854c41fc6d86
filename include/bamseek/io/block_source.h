// =============================================================================
// bamseek - Block Source Interface
// =============================================================================
// Abstract seam between the chunk-driven read loop and whatever reads blocks
// from storage. Implementations seek to a block address, read the block, and
// report how many compressed bytes it occupies.
// =============================================================================

#ifndef BAMSEEK_IO_BLOCK_SOURCE_H
#define BAMSEEK_IO_BLOCK_SOURCE_H

#include <cstdint>
#include <optional>

#include "bamseek/common/types.h"

namespace bamseek::io {

/// @brief Physical extent of one compressed block.
struct BlockExtent {
    /// @brief Address of the block's first byte.
    BlockAddress address = 0;

    /// @brief Total compressed size including header and trailer.
    std::uint32_t compressedSize = 0;

    /// @brief Address of the block that follows this one.
    [[nodiscard]] constexpr BlockAddress nextAddress() const noexcept {
        return address + compressedSize;
    }

    friend constexpr bool operator==(const BlockExtent&, const BlockExtent&) = default;
};

/// @brief Reads compressed blocks by address.
class BlockSource {
public:
    virtual ~BlockSource() = default;

    /// @brief Seek to address and read the block there.
    /// @return The block's extent, or nullopt when address is at or past end of file.
    virtual std::optional<BlockExtent> readBlock(BlockAddress address) = 0;

    /// @brief Physical size of the underlying file in bytes.
    [[nodiscard]] virtual std::uint64_t size() const = 0;

    /// @brief True if extent is a format-level end-of-file marker carrying no records.
    [[nodiscard]] virtual bool isEofMarker(const BlockExtent& /*extent*/) const noexcept {
        return false;
    }

protected:
    BlockSource() = default;
    BlockSource(const BlockSource&) = default;
    BlockSource& operator=(const BlockSource&) = default;
    BlockSource(BlockSource&&) = default;
    BlockSource& operator=(BlockSource&&) = default;
};

}  // namespace bamseek::io

#endif  // BAMSEEK_IO_BLOCK_SOURCE_H
