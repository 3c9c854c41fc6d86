// =============================================================================
// bamseek - BGZF Block Source Tests
// =============================================================================
// Unit tests for locating BGZF blocks from their headers.
// =============================================================================

#include "bamseek/io/bgzf_block_source.h"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <vector>

#include "bamseek/common/error.h"
#include "bgzf_test_utils.h"

namespace bamseek::io::test {
namespace {

// =============================================================================
// Header Parsing
// =============================================================================

TEST(BgzfHeaderTest, ParsesBlockSize) {
    std::vector<std::uint8_t> bytes;
    appendBlock(bytes, 1234);

    EXPECT_EQ(parseBgzfBlockSize(bytes), 1234U);
}

TEST(BgzfHeaderTest, ParsesEofMarker) {
    EXPECT_EQ(parseBgzfBlockSize(kEofMarker), kBgzfEofMarkerSize);
}

TEST(BgzfHeaderTest, RejectsShortInput) {
    const std::array<std::uint8_t, 4> bytes{0x1f, 0x8b, 0x08, 0x04};

    EXPECT_EQ(parseBgzfBlockSize(bytes), std::nullopt);
}

TEST(BgzfHeaderTest, RejectsPlainGzip) {
    std::vector<std::uint8_t> bytes;
    appendBlock(bytes, 100);
    bytes[3] = 0x00;  // clear FEXTRA

    EXPECT_EQ(parseBgzfBlockSize(bytes), std::nullopt);
}

TEST(BgzfHeaderTest, RejectsWrongSubfield) {
    std::vector<std::uint8_t> bytes;
    appendBlock(bytes, 100);
    bytes[12] = 'X';

    EXPECT_EQ(parseBgzfBlockSize(bytes), std::nullopt);
}

TEST(BgzfHeaderTest, RejectsBadMagic) {
    std::vector<std::uint8_t> bytes;
    appendBlock(bytes, 100);
    bytes[0] = 0x42;

    EXPECT_EQ(parseBgzfBlockSize(bytes), std::nullopt);
}

// =============================================================================
// BgzfBlockSource
// =============================================================================

class BgzfBlockSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        appendBlock(bytes_, 200);
        appendBlock(bytes_, 350);
        appendBlock(bytes_, 4096);
        appendEofMarker(bytes_);
        writeFile(guard_.path(), bytes_);
    }

    std::vector<std::uint8_t> bytes_;
    TempFileGuard guard_{tempFilePath()};
};

TEST_F(BgzfBlockSourceTest, OpenReportsFileSize) {
    BgzfBlockSource source(guard_.path());
    EXPECT_FALSE(source.isOpen());

    source.open();

    EXPECT_TRUE(source.isOpen());
    EXPECT_EQ(source.size(), bytes_.size());
    EXPECT_EQ(source.path(), guard_.path());
}

TEST_F(BgzfBlockSourceTest, ReadsBlocksByAddress) {
    BgzfBlockSource source(guard_.path());
    source.open();

    auto first = source.readBlock(0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->address, 0U);
    EXPECT_EQ(first->compressedSize, 200U);
    EXPECT_EQ(first->nextAddress(), 200U);

    // Out of order access is allowed: the source just seeks.
    auto third = source.readBlock(550);
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->compressedSize, 4096U);

    auto second = source.readBlock(200);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->compressedSize, 350U);
}

TEST_F(BgzfBlockSourceTest, RecognizesEofMarker) {
    BgzfBlockSource source(guard_.path());
    source.open();

    auto data = source.readBlock(550);
    auto eof = source.readBlock(550 + 4096);

    ASSERT_TRUE(data.has_value());
    ASSERT_TRUE(eof.has_value());
    EXPECT_FALSE(source.isEofMarker(*data));
    EXPECT_TRUE(source.isEofMarker(*eof));
    EXPECT_EQ(eof->nextAddress(), source.size());
}

TEST_F(BgzfBlockSourceTest, EndOfFileYieldsNoBlock) {
    BgzfBlockSource source(guard_.path());
    source.open();

    EXPECT_EQ(source.readBlock(source.size()), std::nullopt);
    EXPECT_EQ(source.readBlock(source.size() + 1000), std::nullopt);
}

TEST_F(BgzfBlockSourceTest, MisalignedAddressIsFormatError) {
    BgzfBlockSource source(guard_.path());
    source.open();

    try {
        (void)source.readBlock(17);
        FAIL() << "expected FormatError";
    } catch (const FormatError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kFormatError);
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->blockAddress, 17U);
        EXPECT_EQ(ex.context()->filePath, guard_.path().string());
    }
}

TEST_F(BgzfBlockSourceTest, ReadBeforeOpenIsInvalidState) {
    BgzfBlockSource source(guard_.path());

    EXPECT_THROW((void)source.readBlock(0), InvalidStateError);
}

TEST_F(BgzfBlockSourceTest, CloseResetsState) {
    BgzfBlockSource source(guard_.path());
    source.open();
    source.close();

    EXPECT_FALSE(source.isOpen());
    EXPECT_EQ(source.size(), 0U);
}

TEST_F(BgzfBlockSourceTest, ReadFailureLeavesSourceUsable) {
    BgzfBlockSource source(guard_.path());
    source.open();

    // Shrink the file behind the open source: only the first block remains,
    // but the source still believes the original size.
    std::vector<std::uint8_t> firstBlockOnly(bytes_.begin(), bytes_.begin() + 200);
    writeFile(guard_.path(), firstBlockOnly);

    try {
        (void)source.readBlock(200);
        FAIL() << "expected IOError";
    } catch (const IOError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kIOError);
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->blockAddress, 200U);
    }

    auto first = source.readBlock(0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->compressedSize, 200U);
}

TEST(BgzfBlockSourceFileTest, MissingFileFailsToOpen) {
    BgzfBlockSource source(tempFilePath());

    try {
        source.open();
        FAIL() << "expected IOError";
    } catch (const IOError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kFileOpenFailed);
    }
}

TEST(BgzfBlockSourceFileTest, TruncatedBlockIsFormatError) {
    std::vector<std::uint8_t> bytes;
    appendBlock(bytes, 300);
    bytes.resize(120);

    TempFileGuard guard(tempFilePath());
    writeFile(guard.path(), bytes);

    BgzfBlockSource source(guard.path());
    source.open();

    EXPECT_THROW((void)source.readBlock(0), FormatError);
}

TEST(BgzfBlockSourceFileTest, TruncatedHeaderIsFormatError) {
    std::vector<std::uint8_t> bytes;
    appendBlock(bytes, 300);
    bytes.resize(310);  // 10 trailing bytes: less than a header

    TempFileGuard guard(tempFilePath());
    writeFile(guard.path(), bytes);

    BgzfBlockSource source(guard.path());
    source.open();

    EXPECT_TRUE(source.readBlock(0).has_value());
    EXPECT_THROW((void)source.readBlock(300), FormatError);
}

}  // namespace
}  // namespace bamseek::io::test
