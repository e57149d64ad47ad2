#include "rtpcodec/memory/padding.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;

namespace rtpcodec {
namespace test {

MY_TEST(PaddingTest, AlignmentPaddingFor) {
    EXPECT_EQ(0u, padding::AlignmentPaddingFor(0));
    EXPECT_EQ(3u, padding::AlignmentPaddingFor(1));
    EXPECT_EQ(2u, padding::AlignmentPaddingFor(6));
    EXPECT_EQ(1u, padding::AlignmentPaddingFor(11));
    EXPECT_EQ(0u, padding::AlignmentPaddingFor(12));
}

MY_TEST(PaddingTest, WriteZeroAlignmentPadding) {
    BitWriter writer;
    writer.Write<uint8_t>(0xAA);
    const size_t mark = writer.BitPosition();
    writer.Write<uint8_t>(0x01);
    EXPECT_EQ(3u, padding::WriteAlignmentPadding(writer, mark));
    EXPECT_THAT(writer.Release(), ElementsAre(0xAA, 0x01, 0x00, 0x00, 0x00));
}

MY_TEST(PaddingTest, WriteKeptAlignmentPadding) {
    const BinaryBuffer kept = {0x11, 0x22};
    BitWriter writer;
    writer.Write<uint16_t>(0x0102);
    EXPECT_EQ(2u, padding::WriteAlignmentPadding(writer, 0, kept));
    EXPECT_THAT(writer.Release(), ElementsAre(0x01, 0x02, 0x11, 0x22));
}

MY_TEST(PaddingTest, KeptPaddingOfAnotherSizeIsReplacedByZeros) {
    const BinaryBuffer kept = {0x11, 0x22};
    BitWriter writer;
    writer.Write<uint8_t>(0x01);
    EXPECT_EQ(3u, padding::WriteAlignmentPadding(writer, 0, kept));
    EXPECT_THAT(writer.Release(), ElementsAre(0x01, 0x00, 0x00, 0x00));
}

MY_TEST(PaddingTest, MakeSignaledPadding) {
    EXPECT_TRUE(padding::MakeSignaledPadding(0).empty());
    EXPECT_THAT(padding::MakeSignaledPadding(3), ElementsAre(0x00, 0x00, 0x03));
}

MY_TEST(PaddingTest, IsSignaledPadding) {
    const uint8_t valid[] = {0x7F, 0x00, 0x03};
    const uint8_t invalid[] = {0x00, 0x00, 0x02};
    EXPECT_TRUE(padding::IsSignaledPadding(ArrayView<const uint8_t>()));
    EXPECT_TRUE(padding::IsSignaledPadding(valid));
    EXPECT_FALSE(padding::IsSignaledPadding(invalid));
}

MY_TEST(PaddingTest, ReadZeroAlignmentPadding) {
    const uint8_t bytes[] = {0x05, 0x06, 0x00, 0x00, 0xFF};
    BitReader reader(bytes, sizeof(bytes));
    const size_t mark = reader.BitPosition();
    reader.ConsumeBytes(2);
    EXPECT_TRUE(padding::ReadAlignmentPadding(reader, mark).empty());
    EXPECT_EQ(1u, reader.RemainingByteCount());
    EXPECT_TRUE(padding::ReadAlignmentPadding(reader, mark).empty());
    EXPECT_EQ(1u, reader.RemainingByteCount());
}

MY_TEST(PaddingTest, ReadNonZeroAlignmentPadding) {
    const uint8_t bytes[] = {0x05, 0x00, 0xAB, 0x00};
    BitReader reader(bytes, sizeof(bytes));
    reader.ConsumeBytes(1);
    EXPECT_THAT(padding::ReadAlignmentPadding(reader, 0), ElementsAre(0x00, 0xAB, 0x00));
    EXPECT_EQ(0u, reader.RemainingByteCount());
}

MY_TEST(PaddingTest, ReadAlignmentPaddingUnaligned) {
    const uint8_t bytes[] = {0x05, 0x06, 0x00, 0x00};
    BitReader reader(bytes, sizeof(bytes));
    reader.ConsumeBits(3);
    try {
        padding::ReadAlignmentPadding(reader, 0);
        FAIL() << "Padding at an unaligned position";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

MY_TEST(PaddingTest, ReadAlignmentPaddingPastTheEnd) {
    const uint8_t bytes[] = {0x05, 0x06, 0x00};
    BitReader reader(bytes, sizeof(bytes));
    reader.ConsumeBytes(1);
    try {
        padding::ReadAlignmentPadding(reader, 0);
        FAIL() << "Padding past the end";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::OUT_OF_BOUNDS, e.kind());
    }
}

MY_TEST(PaddingTest, ReadSignaledPaddingSize) {
    const uint8_t packet[] = {0x80, 0xC8, 0x00, 0x01, 0x00, 0x00, 0x00, 0x04};
    EXPECT_EQ(4u, padding::ReadSignaledPaddingSize(packet, 4));
}

MY_TEST(PaddingTest, ReadInvalidSignaledPaddingSize) {
    const uint8_t zero[] = {0x00, 0x00, 0x00, 0x00};
    EXPECT_THROW(padding::ReadSignaledPaddingSize(zero, 4), CodecError);

    const uint8_t too_large[] = {0x00, 0x00, 0x00, 0x05};
    try {
        padding::ReadSignaledPaddingSize(too_large, 4);
        FAIL() << "More padding than payload";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }

    EXPECT_THROW(padding::ReadSignaledPaddingSize(ArrayView<const uint8_t>(), 0), CodecError);
}

} // namespace test
} // namespace rtpcodec
