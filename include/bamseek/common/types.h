// =============================================================================
// bamseek - Common Type Definitions
// =============================================================================
// Type aliases and constants shared by the index, reader and io modules.
// =============================================================================

#ifndef BAMSEEK_COMMON_TYPES_H
#define BAMSEEK_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>

namespace bamseek {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Byte offset of a compressed block's first byte in the physical file.
using BlockAddress = std::uint64_t;

/// @brief Byte offset inside a block's decompressed contents.
using BlockOffset = std::uint16_t;

/// @brief Index of a chunk within a ChunkSequence.
using ChunkIndex = std::size_t;

// =============================================================================
// Virtual Offset Layout
// =============================================================================

/// @brief Bits of a packed virtual offset holding the in-block offset.
inline constexpr unsigned kVirtualOffsetShift = 16;

/// @brief Mask selecting the in-block offset from a packed virtual offset.
inline constexpr std::uint64_t kBlockOffsetMask = (1ULL << kVirtualOffsetShift) - 1;

/// @brief Largest block address representable in a packed virtual offset.
inline constexpr BlockAddress kMaxBlockAddress = (1ULL << 48) - 1;

// =============================================================================
// BGZF Constants
// =============================================================================

/// @brief Size of a BGZF block header including the BC extra subfield.
inline constexpr std::size_t kBgzfHeaderSize = 18;

/// @brief Size of the empty block that terminates a BGZF file.
inline constexpr std::size_t kBgzfEofMarkerSize = 28;

}  // namespace bamseek

#endif  // BAMSEEK_COMMON_TYPES_H
