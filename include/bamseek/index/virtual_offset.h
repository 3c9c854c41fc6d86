// =============================================================================
// bamseek - Virtual Offset
// =============================================================================
// A position inside a BGZF file: the address of a compressed block plus a
// byte offset into that block's decompressed contents.
//
// Packed form (as stored by BAI indexes):
//   bits 63..16  block address (48 bits)
//   bits 15..0   offset in block
//
// Ordering is lexicographic on (blockAddress, offsetInBlock), which is also
// the numeric ordering of the packed form.
// =============================================================================

#ifndef BAMSEEK_INDEX_VIRTUAL_OFFSET_H
#define BAMSEEK_INDEX_VIRTUAL_OFFSET_H

#include <compare>
#include <cstdint>
#include <string>

#include "bamseek/common/error.h"
#include "bamseek/common/types.h"

namespace bamseek::index {

/// @brief Logical position inside a block-compressed file.
struct VirtualOffset {
    BlockAddress blockAddress = 0;
    BlockOffset offsetInBlock = 0;

    /// @brief Build from parts, rejecting addresses wider than 48 bits.
    [[nodiscard]] static Result<VirtualOffset> fromParts(BlockAddress blockAddress,
                                                         BlockOffset offsetInBlock);

    /// @brief Decode a packed 64-bit virtual offset.
    [[nodiscard]] static constexpr VirtualOffset unpack(std::uint64_t packed) noexcept {
        return VirtualOffset{packed >> kVirtualOffsetShift,
                             static_cast<BlockOffset>(packed & kBlockOffsetMask)};
    }

    /// @brief Encode as a packed 64-bit virtual offset.
    /// @note Bits of blockAddress above 48 are discarded.
    [[nodiscard]] constexpr std::uint64_t pack() const noexcept {
        return (blockAddress << kVirtualOffsetShift) | offsetInBlock;
    }

    /// @brief True when this offset names the very start of its block.
    [[nodiscard]] constexpr bool isBlockStart() const noexcept { return offsetInBlock == 0; }

    /// @brief Render as "blockAddress:offsetInBlock".
    [[nodiscard]] std::string toString() const;

    friend constexpr auto operator<=>(const VirtualOffset&, const VirtualOffset&) = default;
};

}  // namespace bamseek::index

#endif  // BAMSEEK_INDEX_VIRTUAL_OFFSET_H
