// =============================================================================
// bamseek - BGZF Block Source Implementation
// =============================================================================

#include "bamseek/io/bgzf_block_source.h"

#include <format>
#include <utility>

#include "bamseek/common/error.h"
#include "bamseek/common/logger.h"

namespace bamseek::io {

namespace {

constexpr std::uint8_t kGzipId1 = 0x1f;
constexpr std::uint8_t kGzipId2 = 0x8b;
constexpr std::uint8_t kDeflateMethod = 8;
constexpr std::uint8_t kFlagExtra = 0x04;
constexpr std::uint16_t kMinExtraLength = 6;
constexpr std::uint8_t kSubfieldId1 = 'B';
constexpr std::uint8_t kSubfieldId2 = 'C';
constexpr std::uint16_t kSubfieldLength = 2;

constexpr std::uint16_t readUint16LE(std::span<const std::uint8_t> bytes,
                                     std::size_t offset) noexcept {
    return static_cast<std::uint16_t>(bytes[offset] |
                                      (static_cast<std::uint16_t>(bytes[offset + 1]) << 8));
}

}  // namespace

std::optional<std::uint32_t> parseBgzfBlockSize(std::span<const std::uint8_t> header) noexcept {
    if (header.size() < kBgzfHeaderSize) {
        return std::nullopt;
    }
    if (header[0] != kGzipId1 || header[1] != kGzipId2 || header[2] != kDeflateMethod ||
        (header[3] & kFlagExtra) == 0) {
        return std::nullopt;
    }
    if (readUint16LE(header, 10) < kMinExtraLength) {
        return std::nullopt;
    }
    if (header[12] != kSubfieldId1 || header[13] != kSubfieldId2 ||
        readUint16LE(header, 14) != kSubfieldLength) {
        return std::nullopt;
    }

    const std::uint32_t blockSize = static_cast<std::uint32_t>(readUint16LE(header, 16)) + 1;
    if (blockSize < kBgzfHeaderSize) {
        return std::nullopt;
    }
    return blockSize;
}

// =============================================================================
// BgzfBlockSource Implementation
// =============================================================================

BgzfBlockSource::BgzfBlockSource(std::filesystem::path path) : path_(std::move(path)) {}

BgzfBlockSource::~BgzfBlockSource() {
    close();
}

void BgzfBlockSource::open() {
    if (isOpen()) {
        return;
    }

    stream_.open(path_, std::ios::binary);
    if (!stream_.is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed, "Failed to open BGZF file: " + path_.string(),
                      ErrorContext(path_.string()));
    }

    stream_.seekg(0, std::ios::end);
    fileSize_ = static_cast<std::uint64_t>(stream_.tellg());
    stream_.seekg(0, std::ios::beg);

    BAMSEEK_LOG_DEBUG("BgzfBlockSource opened: {}, size={}", path_.string(), fileSize_);
}

void BgzfBlockSource::close() noexcept {
    if (stream_.is_open()) {
        stream_.close();
    }
    fileSize_ = 0;
}

std::optional<BlockExtent> BgzfBlockSource::readBlock(BlockAddress address) {
    ensureOpen();

    if (address >= fileSize_) {
        return std::nullopt;
    }
    if (fileSize_ - address < kBgzfHeaderSize) {
        throw FormatError("Truncated BGZF block header",
                          ErrorContext(path_.string()).withBlockAddress(address));
    }

    seekTo(address);
    std::array<std::uint8_t, kBgzfHeaderSize> header{};
    readBytes(header.data(), header.size(), address);

    const auto blockSize = parseBgzfBlockSize(header);
    if (!blockSize.has_value()) {
        throw FormatError("Invalid BGZF block header",
                          ErrorContext(path_.string()).withBlockAddress(address));
    }
    if (*blockSize > fileSize_ - address) {
        throw FormatError(std::format("BGZF block of {} bytes runs past end of file ({} bytes)",
                                      *blockSize, fileSize_),
                          ErrorContext(path_.string()).withBlockAddress(address));
    }

    return BlockExtent{address, *blockSize};
}

bool BgzfBlockSource::isEofMarker(const BlockExtent& extent) const noexcept {
    return extent.compressedSize == kBgzfEofMarkerSize && extent.nextAddress() == fileSize_;
}

void BgzfBlockSource::ensureOpen() const {
    if (!isOpen()) {
        throw InvalidStateError("BGZF file is not open", ErrorContext(path_.string()));
    }
}

// Both helpers clear the stream state before throwing so that a failed read
// does not poison later reads on the same open source.

void BgzfBlockSource::seekTo(std::uint64_t position) {
    stream_.seekg(static_cast<std::streamoff>(position), std::ios::beg);
    if (!stream_.good()) {
        stream_.clear();
        throw IOError(ErrorCode::kSeekFailed, "Failed to seek in file",
                      ErrorContext(path_.string()).withBlockAddress(position));
    }
}

void BgzfBlockSource::readBytes(void* buffer, std::size_t size, std::uint64_t position) {
    stream_.read(static_cast<char*>(buffer), static_cast<std::streamsize>(size));
    if (!stream_.good()) {
        const auto got = stream_.gcount();
        stream_.clear();
        throw IOError(std::format("Short read: got {} of {} bytes", got, size),
                      ErrorContext(path_.string()).withBlockAddress(position));
    }
}

}  // namespace bamseek::io
