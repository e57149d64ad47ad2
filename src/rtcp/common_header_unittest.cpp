#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;

namespace rtpcodec {
namespace rtcp {
namespace test {

MY_TEST(RtcpCommonHeaderTest, TooSmallBuffer) {
    const uint8_t buffer[] = {0x80, 0x00, 0x00, 0x00};
    BitReader reader(buffer, 3);
    try {
        CommonHeader::Parse(reader);
        FAIL() << "Parsed a 3 bytes header";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::OUT_OF_BOUNDS, e.kind());
    }
}

MY_TEST(RtcpCommonHeaderTest, Version) {
    uint8_t buffer[] = {0x00, 0x00, 0x00, 0x00};
    BitReader reader1(buffer, 4);
    EXPECT_THROW(CommonHeader::Parse(reader1), CodecError);
    buffer[0] = 0x40;
    BitReader reader2(buffer, 4);
    EXPECT_THROW(CommonHeader::Parse(reader2), CodecError);
    buffer[0] = 0xC0;
    BitReader reader3(buffer, 4);
    EXPECT_THROW(CommonHeader::Parse(reader3), CodecError);
    buffer[0] = 0x80;
    BitReader reader4(buffer, 4);
    EXPECT_NO_THROW(CommonHeader::Parse(reader4));
}

MY_TEST(RtcpCommonHeaderTest, PacketSize) {
    uint8_t buffer[] = {0x80, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    BitReader short_reader(buffer, sizeof(buffer) - 1);
    try {
        CommonHeader::Parse(short_reader);
        FAIL() << "Length field beyond the buffer";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }

    BitReader reader(buffer, sizeof(buffer));
    CommonHeader header = CommonHeader::Parse(reader);
    EXPECT_EQ(2u, header.length_field());
    EXPECT_EQ(12u, header.packet_size());
    EXPECT_EQ(8u, header.payload_size());
    EXPECT_EQ(8u, header.content_size());
    EXPECT_FALSE(header.has_padding());
    // Only the header is consumed.
    EXPECT_EQ(8u, reader.RemainingByteCount());
}

MY_TEST(RtcpCommonHeaderTest, PaddingAndPayloadSize) {
    // Set v = 2, p = 1, but leave fmt, pt as 0.
    uint8_t buffer[] = {0xa0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    // Padding bit set, but no byte for padding (can't specify padding length).
    BitReader no_payload(buffer, 4);
    EXPECT_THROW(CommonHeader::Parse(no_payload), CodecError);

    buffer[3] = 2;  // Set payload size to 2x32bit.
    const size_t kPayloadSizeBytes = buffer[3] * 4;
    const size_t kPaddingAddress = CommonHeader::kFixedHeaderSize + kPayloadSizeBytes - 1;

    // Padding one byte larger than possible.
    buffer[kPaddingAddress] = kPayloadSizeBytes + 1;
    BitReader too_much_padding(buffer, sizeof(buffer));
    EXPECT_THROW(CommonHeader::Parse(too_much_padding), CodecError);

    // Invalid zero padding size.
    buffer[kPaddingAddress] = 0;
    BitReader zero_padding(buffer, sizeof(buffer));
    EXPECT_THROW(CommonHeader::Parse(zero_padding), CodecError);

    // Pure padding packet.
    buffer[kPaddingAddress] = kPayloadSizeBytes;
    BitReader pure_padding(buffer, sizeof(buffer));
    CommonHeader header = CommonHeader::Parse(pure_padding);
    EXPECT_EQ(0u, header.type());
    EXPECT_EQ(kPayloadSizeBytes, header.payload_size());
    EXPECT_EQ(kPayloadSizeBytes, header.padding_size());
    EXPECT_EQ(0u, header.content_size());

    // Single byte of actual data.
    buffer[kPaddingAddress] = kPayloadSizeBytes - 1;
    BitReader one_data_byte(buffer, sizeof(buffer));
    header = CommonHeader::Parse(one_data_byte);
    EXPECT_EQ(1u, header.content_size());
}

MY_TEST(RtcpCommonHeaderTest, FormatAndPayloadType) {
    const uint8_t buffer[] = {0x9e, 0xab, 0x00, 0x00};
    BitReader reader(buffer, sizeof(buffer));
    CommonHeader header = CommonHeader::Parse(reader);
    EXPECT_EQ(0x1e, header.count());
    EXPECT_EQ(0x1e, header.feedback_message_type());
    EXPECT_EQ(0xab, header.type());
    EXPECT_EQ(0u, header.payload_size());
}

MY_TEST(RtcpCommonHeaderTest, PackInto) {
    BitWriter writer;
    CommonHeader(205, 15, 3, 0).PackInto(writer);
    CommonHeader(200, 1, 0x1234, 4).PackInto(writer);
    EXPECT_THAT(writer.Release(), ElementsAre(0x8F, 205, 0x00, 0x03, 0xA1, 200, 0x12, 0x34));
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
