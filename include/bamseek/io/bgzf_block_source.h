// =============================================================================
// bamseek - BGZF Block Source
// =============================================================================
// File-backed BlockSource for BGZF files (the container format of BAM).
//
// Blocks are located from their headers alone; payloads are never inflated.
// Header layout (little-endian):
//
//   offset  size  field
//        0     2  ID1 ID2 = 0x1f 0x8b
//        2     1  CM = 8 (deflate)
//        3     1  FLG, FEXTRA (0x04) set
//        4     6  MTIME, XFL, OS
//       10     2  XLEN
//       12     2  SI1 SI2 = 'B' 'C'
//       14     2  SLEN = 2
//       16     2  BSIZE = total block size - 1
//
// Usage:
//   BgzfBlockSource source("/path/to/reads.bam");
//   source.open();
//   auto extent = source.readBlock(0);
// =============================================================================

#ifndef BAMSEEK_IO_BGZF_BLOCK_SOURCE_H
#define BAMSEEK_IO_BGZF_BLOCK_SOURCE_H

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>

#include "bamseek/common/types.h"
#include "bamseek/io/block_source.h"

namespace bamseek::io {

/// @brief Parse the total block size out of a BGZF header.
/// @param header At least kBgzfHeaderSize bytes starting at a block boundary.
/// @return Total compressed block size, or nullopt if the header is not BGZF.
[[nodiscard]] std::optional<std::uint32_t> parseBgzfBlockSize(
    std::span<const std::uint8_t> header) noexcept;

/// @brief Locates BGZF blocks in a file on disk.
class BgzfBlockSource : public BlockSource {
public:
    explicit BgzfBlockSource(std::filesystem::path path);
    ~BgzfBlockSource() override;

    BgzfBlockSource(const BgzfBlockSource&) = delete;
    BgzfBlockSource& operator=(const BgzfBlockSource&) = delete;
    BgzfBlockSource(BgzfBlockSource&&) = default;
    BgzfBlockSource& operator=(BgzfBlockSource&&) = default;

    /// @brief Open the file.
    /// @throws IOError (kFileOpenFailed) if the file cannot be opened.
    void open();

    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return stream_.is_open(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @throws FormatError on a malformed or truncated block.
    /// @throws IOError on seek or read failure. The source stays usable.
    std::optional<BlockExtent> readBlock(BlockAddress address) override;

    [[nodiscard]] std::uint64_t size() const override { return fileSize_; }

    /// @brief True if extent is the empty block that terminates a BGZF file.
    [[nodiscard]] bool isEofMarker(const BlockExtent& extent) const noexcept override;

private:
    void ensureOpen() const;
    void seekTo(std::uint64_t position);
    void readBytes(void* buffer, std::size_t size, std::uint64_t position);

    std::filesystem::path path_;
    std::ifstream stream_;
    std::uint64_t fileSize_ = 0;
};

}  // namespace bamseek::io

#endif  // BAMSEEK_IO_BGZF_BLOCK_SOURCE_H
