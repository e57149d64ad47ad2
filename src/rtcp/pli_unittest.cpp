#include "rtpcodec/rtcp/pli.hpp"
#include "rtpcodec/rtcp/rtcp_packet.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAreArray;

namespace rtpcodec {
namespace rtcp {
namespace test {
namespace {

constexpr uint32_t kSenderSsrc = 0x12345678;
constexpr uint32_t kRemoteSsrc = 0x23456789;
// Manually created Pli packet matching constants above.
constexpr uint8_t kPacket[] = {0x81, 206,  0x00, 0x02, 0x12, 0x34,
                               0x56, 0x78, 0x23, 0x45, 0x67, 0x89};

} // namespace

MY_TEST(RtcpPliTest, Parse) {
    BitReader reader(kPacket, sizeof(kPacket));
    RtcpPacket packet = ParsePacket(reader);
    ASSERT_TRUE(std::holds_alternative<Pli>(packet));
    const Pli& parsed = std::get<Pli>(packet);

    EXPECT_EQ(kSenderSsrc, parsed.sender_ssrc());
    EXPECT_EQ(kRemoteSsrc, parsed.media_ssrc());
}

MY_TEST(RtcpPliTest, Create) {
    Pli pli;
    pli.set_sender_ssrc(kSenderSsrc);
    pli.set_media_ssrc(kRemoteSsrc);

    EXPECT_THAT(BuildPacket(pli), ElementsAreArray(kPacket));
}

MY_TEST(RtcpPliTest, ParseFailsOnTooSmallPacket) {
    const uint8_t kTooSmallPacket[] = {0x81, 206,  0x00, 0x01,
                                       0x12, 0x34, 0x56, 0x78};
    BitReader reader(kTooSmallPacket, sizeof(kTooSmallPacket));
    try {
        ParsePacket(reader);
        FAIL() << "Parsed a PLI without media SSRC";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

MY_TEST(RtcpPliTest, ParseFailsOnFci) {
    const uint8_t kPacketWithFci[] = {0x81, 206,  0x00, 0x03, 
                                      0x12, 0x34, 0x56, 0x78,
                                      0x23, 0x45, 0x67, 0x89,
                                      0x00, 0x00, 0x00, 0x00};
    BitReader reader(kPacketWithFci, sizeof(kPacketWithFci));
    try {
        ParsePacket(reader);
        FAIL() << "Ignored the FCI of a PLI";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::TRAILING_DATA, e.kind());
    }
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
