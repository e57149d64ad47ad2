#include "rtpcodec/rtcp/nack.hpp"
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

const std::vector<uint16_t> kList = {0, 1, 3, 8, 16};
constexpr uint8_t kPacket[] = {0x81, 205,  0x00, 0x03, 0x12, 0x34, 0x56, 0x78,
                               0x23, 0x45, 0x67, 0x89, 0x00, 0x00, 0x80, 0x85};

const std::vector<uint16_t> kWrapList = {0xffdc, 0xffec, 0xfffe, 0xffff, 0x0000,
                                         0x0001, 0x0003, 0x0014, 0x0064};

Nack ParseNack(ArrayView<const uint8_t> data) {
    BitReader reader(data);
    RtcpPacket packet = ParsePacket(reader);
    EXPECT_EQ(0u, reader.RemainingByteCount());
    return std::get<Nack>(std::move(packet));
}

} // namespace

MY_TEST(RtcpNackTest, Create) {
    Nack nack;
    nack.set_sender_ssrc(kSenderSsrc);
    nack.set_media_ssrc(kRemoteSsrc);
    nack.set_packet_ids(kList);

    EXPECT_THAT(BuildPacket(nack), ElementsAreArray(kPacket));
}

MY_TEST(RtcpNackTest, Parse) {
    Nack parsed = ParseNack(kPacket);

    EXPECT_EQ(kSenderSsrc, parsed.sender_ssrc());
    EXPECT_EQ(kRemoteSsrc, parsed.media_ssrc());
    EXPECT_THAT(parsed.packet_ids(), ElementsAreArray(kList));
    ASSERT_EQ(1u, parsed.fci_items().size());
    EXPECT_EQ(0x8085, parsed.fci_items()[0].bitmask);
}

MY_TEST(RtcpNackTest, CreateAndParseWrap) {
    Nack nack;
    nack.set_sender_ssrc(kSenderSsrc);
    nack.set_media_ssrc(kRemoteSsrc);
    nack.set_packet_ids(kWrapList);

    ASSERT_EQ(4u, nack.fci_items().size());
    EXPECT_EQ(0xffdc, nack.fci_items()[0].first_pid);
    EXPECT_EQ(0x8000, nack.fci_items()[0].bitmask);
    EXPECT_EQ(0xfffe, nack.fci_items()[1].first_pid);
    EXPECT_EQ(0x0017, nack.fci_items()[1].bitmask);

    BinaryBuffer raw = BuildPacket(nack);
    EXPECT_EQ(12u + 4 * 4, raw.size());
    Nack parsed = ParseNack(raw);
    EXPECT_THAT(parsed.packet_ids(), ElementsAreArray(kWrapList));
    EXPECT_EQ(nack, parsed);
}

MY_TEST(RtcpNackTest, BadOrder) {
    // Does not guarantee optimal packing, but should guarantee correctness.
    const std::vector<uint16_t> kUnorderedList = {1, 25, 13, 12, 9, 27, 29};
    Nack nack;
    nack.set_sender_ssrc(kSenderSsrc);
    nack.set_media_ssrc(kRemoteSsrc);
    nack.set_packet_ids(kUnorderedList);

    Nack parsed = ParseNack(BuildPacket(nack));
    EXPECT_THAT(parsed.packet_ids(), ::testing::UnorderedElementsAreArray(kUnorderedList));
}

MY_TEST(RtcpNackTest, CreateWithoutLostPackets) {
    Nack nack;
    nack.set_sender_ssrc(kSenderSsrc);
    nack.set_packet_ids({});
    EXPECT_THROW(BuildPacket(nack), CodecError);
}

MY_TEST(RtcpNackTest, ParseFailsOnInvalidFci) {
    const uint8_t kPacketWithoutFci[] = {0x81, 205,  0x00, 0x02, 0x12, 0x34, 0x56, 0x78,
                                         0x23, 0x45, 0x67, 0x89};
    BitReader no_fci(kPacketWithoutFci, sizeof(kPacketWithoutFci));
    try {
        ParsePacket(no_fci);
        FAIL() << "Parsed a NACK without FCI";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }

    const uint8_t kPacketTooSmall[] = {0x81, 205,  0x00, 0x01, 0x12, 0x34, 0x56, 0x78};
    BitReader too_small(kPacketTooSmall, sizeof(kPacketTooSmall));
    EXPECT_THROW(ParsePacket(too_small), CodecError);
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
