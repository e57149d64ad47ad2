#include "rtpcodec/demuxer.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace rtpcodec {
namespace test {
namespace {

constexpr uint8_t kRtpPacket[] = {
    0x90, 0xef, 0x16, 0xad, 
    0x65, 0xf3, 0xe1, 0x4e, 
    0x32, 0x0f, 0x22, 0x3a, 
    0xbe, 0xde, 0x00, 0x01, 
    0x10, 0xff, 0x00, 0x00};

constexpr uint8_t kRtcpPacket[] = {0x80, 201, 0x00, 0x01, 0x12, 0x34, 0x56, 0x78};

void ExpectAmbiguous(const Demuxer& demuxer, ArrayView<const uint8_t> datagram) {
    try {
        demuxer.Classify(datagram);
        FAIL() << "Classified an ambiguous datagram";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::AMBIGUOUS_PACKET_TYPE, e.kind());
    }
}

} // namespace

MY_TEST(DemuxerTest, DefaultConfig) {
    Demuxer demuxer;
    EXPECT_EQ(192, demuxer.config().rtcp_packet_type_min);
    EXPECT_EQ(223, demuxer.config().rtcp_packet_type_max);
    EXPECT_FALSE(demuxer.config().strict);
}

MY_TEST(DemuxerTest, Classify) {
    Demuxer demuxer;
    EXPECT_EQ(PacketKind::RTP, demuxer.Classify(kRtpPacket));
    EXPECT_EQ(PacketKind::RTCP, demuxer.Classify(kRtcpPacket));

    uint8_t datagram[] = {0x80, 0x00, 0x00, 0x00};
    for (int second_byte = 0; second_byte <= 0xFF; ++second_byte) {
        datagram[1] = static_cast<uint8_t>(second_byte);
        const PacketKind expected = (second_byte >= 192 && second_byte <= 223) ? PacketKind::RTCP 
                                                                                : PacketKind::RTP;
        EXPECT_EQ(expected, demuxer.Classify(datagram)) << "second byte " << second_byte;
    }
}

MY_TEST(DemuxerTest, TooShortToClassify) {
    Demuxer demuxer;
    ExpectAmbiguous(demuxer, ArrayView<const uint8_t>());
    ExpectAmbiguous(demuxer, ArrayView<const uint8_t>(kRtcpPacket, 3));
}

MY_TEST(DemuxerTest, StrictVersionCheck) {
    const uint8_t kVersion1Rtcp[] = {0x40, 201, 0x00, 0x01, 0x12, 0x34, 0x56, 0x78};
    const uint8_t kVersion1Rtp[] = {0x40, 96, 0x00, 0x01, 0x12, 0x34, 0x56, 0x78};

    Demuxer lenient;
    EXPECT_EQ(PacketKind::RTCP, lenient.Classify(kVersion1Rtcp));

    DemuxerConfig config;
    config.strict = true;
    Demuxer strict(config);
    ExpectAmbiguous(strict, kVersion1Rtcp);
    EXPECT_EQ(PacketKind::RTP, strict.Classify(kVersion1Rtp));
    EXPECT_EQ(PacketKind::RTCP, strict.Classify(kRtcpPacket));
}

MY_TEST(DemuxerTest, CustomRange) {
    DemuxerConfig config;
    config.rtcp_packet_type_min = 200;
    config.rtcp_packet_type_max = 204;
    Demuxer demuxer(config);
    uint8_t datagram[] = {0x80, 205, 0x00, 0x00};
    EXPECT_EQ(PacketKind::RTP, demuxer.Classify(datagram));
    datagram[1] = 200;
    EXPECT_EQ(PacketKind::RTCP, demuxer.Classify(datagram));
}

MY_TEST(DemuxerTest, DemuxRtp) {
    Demuxer demuxer;
    Demuxer::Demuxed demuxed = demuxer.Demux(kRtpPacket);
    ASSERT_TRUE(std::holds_alternative<rtp::RtpPacket>(demuxed));
    const auto& packet = std::get<rtp::RtpPacket>(demuxed);
    EXPECT_EQ(5805, packet.sequence_number());
    EXPECT_EQ(111, packet.payload_type());
}

MY_TEST(DemuxerTest, DemuxRtcp) {
    Demuxer demuxer;
    Demuxer::Demuxed demuxed = demuxer.Demux(kRtcpPacket);
    ASSERT_TRUE(std::holds_alternative<rtcp::CompoundPacket>(demuxed));
    const auto& compound = std::get<rtcp::CompoundPacket>(demuxed);
    ASSERT_EQ(1u, compound.packet_count());
    EXPECT_EQ(0x12345678u, std::get<rtcp::ReceiverReport>(compound.packets()[0]).sender_ssrc());
}

MY_TEST(DemuxerTest, DemuxPropagatesParseErrors) {
    const uint8_t kVersion1Rtcp[] = {0x40, 201, 0x00, 0x01, 0x12, 0x34, 0x56, 0x78};
    Demuxer demuxer;
    try {
        demuxer.Demux(kVersion1Rtcp);
        FAIL() << "Parsed RTCP version 1";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

MY_TEST(DemuxerTest, PrintPacketKind) {
    std::ostringstream oss;
    oss << PacketKind::RTP << " " << PacketKind::RTCP;
    EXPECT_EQ("rtp rtcp", oss.str());
}

} // namespace test
} // namespace rtpcodec
