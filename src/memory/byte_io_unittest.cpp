#include "rtpcodec/memory/byte_io_reader.hpp"
#include "rtpcodec/memory/byte_io_writer.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;

namespace rtpcodec {
namespace test {

MY_TEST(ByteIOTest, ReadUnsigned) {
    const uint8_t kData[] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    EXPECT_EQ(0x01u, ByteReader<uint8_t>::ReadBigEndian(kData));
    EXPECT_EQ(0x0102u, ByteReader<uint16_t>::ReadBigEndian(kData));
    EXPECT_EQ(0x010203u, (ByteReader<uint32_t, 3>::ReadBigEndian(kData)));
    EXPECT_EQ(0x01020304u, ByteReader<uint32_t>::ReadBigEndian(kData));
    EXPECT_EQ(0x0102030405060708ull, ByteReader<uint64_t>::ReadBigEndian(kData));
}

MY_TEST(ByteIOTest, ReadSigned) {
    const uint8_t kNegative[] = {0xFF, 0xFE, 0xFD, 0xFC};
    EXPECT_EQ(-259, ByteReader<int16_t>::ReadBigEndian(kNegative + 1));
    EXPECT_EQ(static_cast<int32_t>(0xFFFEFDFC), ByteReader<int32_t>::ReadBigEndian(kNegative));
    const uint8_t kMin[] = {0x80, 0x00};
    EXPECT_EQ(std::numeric_limits<int16_t>::min(), ByteReader<int16_t>::ReadBigEndian(kMin));
}

MY_TEST(ByteIOTest, SignExtendSmallerSizes) {
    // 24-bit cumulative lost values.
    const uint8_t kMinusThree[] = {0xFF, 0xFF, 0xFD};
    EXPECT_EQ(-3, (ByteReader<int32_t, 3>::ReadBigEndian(kMinusThree)));
    const uint8_t kNegative[] = {0x82, 0x03, 0xEF};
    EXPECT_EQ(static_cast<int32_t>(0xFF8203EF), (ByteReader<int32_t, 3>::ReadBigEndian(kNegative)));
    const uint8_t kPositive[] = {0x72, 0x03, 0xEF};
    EXPECT_EQ(0x007203EF, (ByteReader<int32_t, 3>::ReadBigEndian(kPositive)));
}

MY_TEST(ByteIOTest, WriteUnsigned) {
    uint8_t data[4] = {0};
    ByteWriter<uint16_t>::WriteBigEndian(data, 0xABCD);
    EXPECT_THAT(data, ElementsAre(0xAB, 0xCD, 0x00, 0x00));
    ByteWriter<uint32_t, 3>::WriteBigEndian(data + 1, 0x12345678);
    EXPECT_THAT(data, ElementsAre(0xAB, 0x34, 0x56, 0x78));
}

MY_TEST(ByteIOTest, WriteSigned) {
    uint8_t data[3] = {0};
    ByteWriter<int32_t, 3>::WriteBigEndian(data, -3);
    EXPECT_THAT(data, ElementsAre(0xFF, 0xFF, 0xFD));
    EXPECT_EQ(-3, (ByteReader<int32_t, 3>::ReadBigEndian(data)));

    ByteWriter<int16_t>::WriteBigEndian(data, std::numeric_limits<int16_t>::min());
    EXPECT_THAT(data, ElementsAre(0x80, 0x00, 0xFD));
}

} // namespace test
} // namespace rtpcodec
