#include "rtpcodec/memory/bit_writer.hpp"
#include "rtpcodec/memory/bit_reader.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;

namespace rtpcodec {
namespace test {

MY_TEST(BitWriterTest, WriteBitsAcrossBytes) {
    BitWriter writer;
    writer.WriteBits(0x2, 2);
    writer.WriteFlag(true);
    writer.WriteBits(0x3, 5);
    writer.WriteBits(0xC9, 8);
    writer.WriteBits(0x5, 4);
    EXPECT_EQ(20u, writer.BitPosition());
    EXPECT_FALSE(writer.IsByteAligned());
    EXPECT_EQ(3u, writer.size());
    EXPECT_THAT(writer.Release(), ElementsAre(0xA3, 0xC9, 0x50));
}

MY_TEST(BitWriterTest, WriteBigEndianIntegers) {
    BitWriter writer;
    writer.Write<uint16_t>(0x1234);
    writer.Write<uint32_t>(0xDEADBEEF);
    writer.Write<int32_t, 3>(-2);
    EXPECT_THAT(writer.Release(), ElementsAre(0x12, 0x34, 0xDE, 0xAD, 0xBE, 0xEF, 0xFF, 0xFF, 0xFE));
}

MY_TEST(BitWriterTest, UnalignedBytes) {
    BitWriter writer;
    writer.WriteBits(0xF, 4);
    const uint8_t bytes[] = {0x12, 0x34};
    writer.WriteBytes(bytes, sizeof(bytes));
    writer.WriteBits(0, 4);
    EXPECT_THAT(writer.Release(), ElementsAre(0xF1, 0x23, 0x40));
}

MY_TEST(BitWriterTest, SeekBackKeepsSize) {
    BitWriter writer;
    writer.Write<uint32_t>(0);
    writer.Seek(8);
    writer.Write<uint8_t>(0xAB);
    EXPECT_EQ(16u, writer.BitPosition());
    EXPECT_EQ(4u, writer.size());
    EXPECT_THAT(writer.Release(), ElementsAre(0x00, 0xAB, 0x00, 0x00));
    EXPECT_EQ(0u, writer.size());
}

MY_TEST(BitWriterTest, SeekBeyondWritten) {
    BitWriter writer;
    writer.WriteBits(1, 3);
    EXPECT_THROW(writer.Seek(9), CodecError);
    writer.Seek(8);
    EXPECT_EQ(8u, writer.BitPosition());
}

MY_TEST(BitWriterTest, FixedCapacity) {
    BitWriter writer(3);
    ASSERT_TRUE(writer.max_size().has_value());
    EXPECT_EQ(3u, *writer.max_size());
    writer.Write<uint16_t>(0xFFFF);
    try {
        writer.Write<uint16_t>(0xFFFF);
        FAIL() << "Wrote past the capacity";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::OUT_OF_BOUNDS, e.kind());
    }
    writer.WriteBits(0x7F, 7);
    EXPECT_THROW(writer.WriteBits(0, 2), CodecError);
    writer.WriteFlag(true);
    EXPECT_THAT(writer.Release(), ElementsAre(0xFF, 0xFF, 0xFF));
}

MY_TEST(BitWriterTest, BytesWrittenSinceMark) {
    BitWriter writer;
    writer.Write<uint8_t>(1);
    const size_t mark = writer.BitPosition();
    writer.WriteBits(0, 9);
    EXPECT_EQ(2u, writer.BytesWrittenSince(mark));
    EXPECT_THROW(writer.BytesWrittenSince(writer.BitPosition() + 1), CodecError);
}

MY_TEST(BitWriterTest, ReadBackWhatWasWritten) {
    BitWriter writer;
    writer.WriteBits(5, 3);
    writer.WriteBits(0x1FFFF, 17);
    writer.WriteBits(0x2A, 12);
    writer.Write<uint64_t>(0x0102030405060708ull);
    BinaryBuffer bytes = writer.Release();

    BitReader reader(bytes);
    EXPECT_EQ(5u, reader.ReadBits<uint8_t>(3));
    EXPECT_EQ(0x1FFFFu, reader.ReadBits<uint32_t>(17));
    EXPECT_EQ(0x2Au, reader.ReadBits<uint16_t>(12));
    EXPECT_EQ(0x0102030405060708ull, reader.Read<uint64_t>());
    EXPECT_EQ(0u, reader.RemainingBitCount());
}

} // namespace test
} // namespace rtpcodec
