#include "rtpcodec/rtcp/packet_sync.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;

namespace rtpcodec {
namespace rtcp {
namespace test {
namespace {

// A packet of a fixed body for the header synchronization.
class FakePacket {
public:
    FakePacket(HeaderTemplate header_template, SerializedBody body) 
        : header_template_(header_template), body_(std::move(body)) {}

    HeaderTemplate header_template() const { return header_template_; }
    SerializedBody Serialize() const { return body_; }

private:
    HeaderTemplate header_template_;
    SerializedBody body_;
};

} // namespace

MY_TEST(RtcpPacketSyncTest, CountAndLength) {
    SerializedBody body{BinaryBuffer(8, 0x11), 3};
    CommonHeader header = Finalize(HeaderTemplate{201, std::nullopt}, body);
    EXPECT_EQ(201, header.type());
    EXPECT_EQ(3, header.count());
    EXPECT_EQ(2, header.length_field());
    EXPECT_FALSE(header.has_padding());
}

MY_TEST(RtcpPacketSyncTest, FeedbackFormatReplacesCount) {
    SerializedBody body{BinaryBuffer(8, 0x00), 7};
    CommonHeader header = Finalize(HeaderTemplate{206, uint8_t(1)}, body);
    EXPECT_EQ(1, header.feedback_message_type());
}

MY_TEST(RtcpPacketSyncTest, EmptyBody) {
    CommonHeader header = Finalize(HeaderTemplate{204, uint8_t(0)}, SerializedBody{});
    EXPECT_EQ(0, header.length_field());
    EXPECT_EQ(4u, header.packet_size());
}

MY_TEST(RtcpPacketSyncTest, PaddingFromTheLastByte) {
    SerializedBody body{{0x01, 0x02, 0x03, 0x04}, 0, {0x00, 0x00, 0x00, 0x04}};
    CommonHeader header = Finalize(HeaderTemplate{200, std::nullopt}, body);
    EXPECT_TRUE(header.has_padding());
    EXPECT_EQ(4, header.padding_size());
    EXPECT_EQ(4u, header.content_size());
    EXPECT_EQ(2, header.length_field());
}

MY_TEST(RtcpPacketSyncTest, PaddingCompletesTheLastWord) {
    SerializedBody body{{0x01, 0x02, 0x03, 0x04, 0x05}, 0, {0xEE, 0xEE, 0x03}};
    CommonHeader header = Finalize(HeaderTemplate{200, std::nullopt}, body);
    EXPECT_EQ(3, header.padding_size());
    EXPECT_EQ(1, header.length_field());
}

MY_TEST(RtcpPacketSyncTest, RejectInvalidBodies) {
    try {
        Finalize(HeaderTemplate{200, std::nullopt}, SerializedBody{BinaryBuffer(6, 0), 0});
        FAIL() << "Unaligned body";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
    try {
        Finalize(HeaderTemplate{201, std::nullopt}, SerializedBody{BinaryBuffer(4, 0), 32});
        FAIL() << "Count over 31";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
    try {
        Finalize(HeaderTemplate{204, std::nullopt}, SerializedBody{BinaryBuffer(0x40000, 0), 0});
        FAIL() << "Body too long for the length field";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::OUT_OF_BOUNDS, e.kind());
    }
    EXPECT_THROW(Finalize(HeaderTemplate{204, std::nullopt}, 
                          SerializedBody{BinaryBuffer(4, 0), 0, BinaryBuffer(4, 0)}), CodecError);
    EXPECT_THROW(Finalize(HeaderTemplate{204, std::nullopt}, 
                          SerializedBody{BinaryBuffer(4, 0), 0, BinaryBuffer{0, 0, 0, 5}}), CodecError);
    EXPECT_THROW(Finalize(HeaderTemplate{204, std::nullopt}, 
                          SerializedBody{BinaryBuffer(3, 0), 0, BinaryBuffer{1, 2}}), CodecError);
}

MY_TEST(RtcpPacketSyncTest, LongestBody) {
    SerializedBody body{BinaryBuffer(0xFFFF * 4, 0), 0};
    CommonHeader header = Finalize(HeaderTemplate{204, std::nullopt}, body);
    EXPECT_EQ(0xFFFF, header.length_field());
}

MY_TEST(RtcpPacketSyncTest, BuildPacket) {
    FakePacket packet(HeaderTemplate{204, std::nullopt}, 
                      SerializedBody{{0xAA, 0xBB, 0xCC, 0xDD}, 2});
    EXPECT_THAT(BuildPacket(packet), ElementsAre(0x82, 204, 0x00, 0x01, 0xAA, 0xBB, 0xCC, 0xDD));
}

MY_TEST(RtcpPacketSyncTest, BuildPacketWithPadding) {
    FakePacket packet(HeaderTemplate{204, std::nullopt}, 
                      SerializedBody{{0xAA, 0xBB}, 1, {0x7F, 0x02}});
    EXPECT_THAT(BuildPacket(packet), ElementsAre(0xA1, 204, 0x00, 0x01, 0xAA, 0xBB, 0x7F, 0x02));
}

MY_TEST(RtcpPacketSyncTest, PacketPadding) {
    PacketPadding padding;
    EXPECT_EQ(0, padding.padding_size());
    padding.set_padding_size(3);
    EXPECT_THAT(padding.padding(), ElementsAre(0x00, 0x00, 0x03));
    padding.set_padding({0x01, 0x02});
    EXPECT_THAT(padding.padding(), ElementsAre(0x01, 0x02));
    try {
        padding.set_padding({0x01, 0x03});
        FAIL() << "Padding not ending with its size";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
    EXPECT_THAT(padding.padding(), ElementsAre(0x01, 0x02));
    padding.set_padding_size(0);
    EXPECT_TRUE(padding.padding().empty());
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
