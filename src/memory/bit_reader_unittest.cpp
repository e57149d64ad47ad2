#include "rtpcodec/memory/bit_reader.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace rtpcodec {
namespace test {

MY_TEST(BitReaderTest, ConsumeBits) {
    const uint8_t bytes[64] = {0};
    BitReader reader(bytes, 32);
    uint64_t total_bits = 32 * 8;
    EXPECT_EQ(total_bits, reader.RemainingBitCount());
    reader.ConsumeBits(3);
    total_bits -= 3;
    EXPECT_EQ(total_bits, reader.RemainingBitCount());
    reader.ConsumeBits(3);
    total_bits -= 3;
    EXPECT_EQ(total_bits, reader.RemainingBitCount());
    reader.ConsumeBits(15);
    total_bits -= 15;
    EXPECT_EQ(total_bits, reader.RemainingBitCount());
    reader.ConsumeBits(67);
    total_bits -= 67;
    EXPECT_EQ(total_bits, reader.RemainingBitCount());

    reader.Seek(0);
    reader.ConsumeBits(32 * 8);
    EXPECT_EQ(0u, reader.RemainingBitCount());
    EXPECT_THROW(reader.ConsumeBits(1), CodecError);
}

MY_TEST(BitReaderTest, ReadBitsAcrossBytes) {
    const uint8_t bytes[8] = {0x4D, 0x32, 0xAB, 0x54, 0x00, 0xFF, 0xFE, 0x01};
    BitReader reader(bytes, 8);
    // 0b01001101
    EXPECT_EQ(0x0u, reader.ReadBits<uint8_t>(1));
    EXPECT_EQ(0x2u, reader.ReadBits<uint8_t>(2));
    EXPECT_EQ(0x3u, reader.ReadBits<uint8_t>(3));
    // The remaining 2 bits of 0x4D and 0x32.
    EXPECT_EQ(0x132u, reader.ReadBits<uint16_t>(10));
    EXPECT_TRUE(reader.IsByteAligned());
    EXPECT_EQ(0xAB54u, reader.ReadBits<uint16_t>(16));
    EXPECT_EQ(0x00FFFE01u, reader.ReadBits<uint32_t>(32));
    EXPECT_EQ(0u, reader.RemainingBitCount());
}

MY_TEST(BitReaderTest, PeekDoesNotMove) {
    const uint8_t bytes[2] = {0xA5, 0x5A};
    BitReader reader(bytes, 2);
    EXPECT_EQ(0xA5u, reader.PeekBits<uint8_t>(8));
    EXPECT_EQ(0xA5u, reader.PeekBits<uint8_t>(8));
    EXPECT_EQ(0u, reader.BitPosition());
    reader.ConsumeBits(4);
    EXPECT_EQ(0x55u, reader.PeekBits<uint8_t>(8));
    EXPECT_EQ(4u, reader.BitPosition());
}

MY_TEST(BitReaderTest, ReadBigEndianIntegers) {
    const uint8_t bytes[] = {0x12, 0x34, 0x56, 0x78, 0xFF, 0xFF, 0xFE, 0x80, 0x00, 0x01};
    BitReader reader(bytes, sizeof(bytes));
    EXPECT_EQ(0x12345678u, reader.Read<uint32_t>());
    EXPECT_EQ(-2, (reader.Read<int32_t, 3>()));
    EXPECT_EQ(-32768, reader.Read<int16_t>());
    EXPECT_EQ(0x01u, reader.Read<uint8_t>());
    EXPECT_THROW(reader.Read<uint8_t>(), CodecError);
}

MY_TEST(BitReaderTest, FailedReadKeepsPosition) {
    const uint8_t bytes[3] = {0x01, 0x02, 0x03};
    BitReader reader(bytes, 3);
    reader.ConsumeBits(4);
    try {
        reader.ReadBits<uint32_t>(24);
        FAIL() << "Read past the end";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::OUT_OF_BOUNDS, e.kind());
    }
    EXPECT_EQ(4u, reader.BitPosition());
    EXPECT_EQ(0x10203u & 0xFFFFF, reader.ReadBits<uint32_t>(20));
}

MY_TEST(BitReaderTest, TooManyBitsForType) {
    const uint8_t bytes[4] = {0};
    BitReader reader(bytes, 4);
    EXPECT_THROW(reader.ReadBits<uint8_t>(9), CodecError);
    EXPECT_EQ(0u, reader.BitPosition());
}

MY_TEST(BitReaderTest, ConsumedSinceMark) {
    const uint8_t bytes[8] = {0};
    BitReader reader(bytes, 8);
    reader.ConsumeBytes(1);
    const size_t mark = reader.BitPosition();
    reader.ConsumeBits(13);
    EXPECT_EQ(13u, reader.BitsConsumedSince(mark));
    EXPECT_EQ(1u, reader.BytesConsumedSince(mark));
    EXPECT_THROW(reader.BitsConsumedSince(reader.BitPosition() + 1), CodecError);
}

MY_TEST(BitReaderTest, Seek) {
    const uint8_t bytes[4] = {0x00, 0xF0, 0x00, 0x00};
    BitReader reader(bytes, 4);
    reader.Seek(1, 2);
    EXPECT_EQ(10u, reader.BitPosition());
    EXPECT_EQ(0x3u, reader.ReadBits<uint8_t>(2));
    reader.Seek(32);
    EXPECT_EQ(0u, reader.RemainingBitCount());
    EXPECT_THROW(reader.Seek(33), CodecError);
    EXPECT_THROW(reader.Seek(0, 8), CodecError);
    EXPECT_THROW(reader.Seek(4, 1), CodecError);
    EXPECT_EQ(32u, reader.BitPosition());
}

MY_TEST(BitReaderTest, ReadBytes) {
    const uint8_t bytes[5] = {0x01, 0x02, 0x03, 0x04, 0x05};
    BitReader reader(bytes, 5);
    EXPECT_THAT(reader.ReadBytes(2), testing::ElementsAre(0x01, 0x02));
    reader.ConsumeBits(4);
    // Unaligned
    EXPECT_THAT(reader.ReadBytes(1), testing::ElementsAre(0x30));
    EXPECT_THROW(reader.ReadBytes(2), CodecError);
}

MY_TEST(BitReaderTest, Slice) {
    const uint8_t bytes[6] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06};
    BitReader reader(bytes, 6);
    reader.ConsumeBytes(1);
    BitReader slice = reader.Slice(3);
    EXPECT_EQ(4u, reader.BitPosition() / 8);
    EXPECT_EQ(3u, slice.RemainingByteCount());
    EXPECT_EQ(0x020304u, (slice.Read<uint32_t, 3>()));
    EXPECT_THROW(slice.Read<uint8_t>(), CodecError);
    EXPECT_THROW(reader.Slice(3), CodecError);
    reader.ConsumeBits(1);
    EXPECT_THROW(reader.Slice(1), CodecError);
}

} // namespace test
} // namespace rtpcodec
