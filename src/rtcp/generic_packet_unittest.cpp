#include "rtpcodec/rtcp/generic_packet.hpp"
#include "rtpcodec/rtcp/rtcp_packet.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

namespace rtpcodec {
namespace rtcp {
namespace test {
namespace {

constexpr uint8_t kAppPacketType = 204;

GenericPacket ParseGeneric(ArrayView<const uint8_t> data) {
    BitReader reader(data);
    RtcpPacket packet = ParsePacket(reader);
    EXPECT_EQ(0u, reader.RemainingByteCount());
    return std::get<GenericPacket>(std::move(packet));
}

} // namespace

MY_TEST(RtcpGenericPacketTest, ParseAppPacket) {
    const uint8_t kPacket[] = {0x85, kAppPacketType, 0x00, 0x03,
                               0x12, 0x34, 0x56, 0x78,
                               'n',  'a',  'm',  'e',
                               0x01, 0x02, 0x03, 0x04};
    GenericPacket app = ParseGeneric(kPacket);
    EXPECT_EQ(kAppPacketType, app.packet_type());
    EXPECT_EQ(5, app.count_or_format());
    EXPECT_EQ(0, app.padding_size());
    EXPECT_THAT(app.payload(), ElementsAreArray(kPacket + 4, 12));
    EXPECT_THAT(BuildPacket(app), ElementsAreArray(kPacket));
}

MY_TEST(RtcpGenericPacketTest, PaddingIsKept) {
    const uint8_t kPacket[] = {0xA5, kAppPacketType, 0x00, 0x02,
                               'n',  'a',  'm',  'e',
                               0x00, 0x00, 0x00, 0x04};
    GenericPacket app = ParseGeneric(kPacket);
    EXPECT_EQ(4, app.padding_size());
    EXPECT_THAT(app.payload(), ElementsAre('n', 'a', 'm', 'e'));
    EXPECT_THAT(BuildPacket(app), ElementsAreArray(kPacket));
}

MY_TEST(RtcpGenericPacketTest, PaddingContentIsKept) {
    const uint8_t kPacket[] = {0xA0, kAppPacketType, 0x00, 0x02,
                               'n',  'a',  'm',  'e',
                               0xDE, 0xAD, 0xBE, 0x04};
    GenericPacket app = ParseGeneric(kPacket);
    EXPECT_THAT(app.padding(), ElementsAre(0xDE, 0xAD, 0xBE, 0x04));
    EXPECT_THAT(BuildPacket(app), ElementsAreArray(kPacket));

    GenericPacket zero_padded = app;
    zero_padded.set_padding_size(4);
    EXPECT_NE(app, zero_padded);
}

MY_TEST(RtcpGenericPacketTest, UnsupportedFeedbackMessages) {
    // Transport layer feedback with FMT 3, TMMBR.
    const uint8_t kTmmbr[] = {0x83, 205,  0x00, 0x02,
                              0x12, 0x34, 0x56, 0x78,
                              0x23, 0x45, 0x67, 0x89};
    GenericPacket tmmbr = ParseGeneric(kTmmbr);
    EXPECT_EQ(205, tmmbr.packet_type());
    EXPECT_EQ(3, tmmbr.count_or_format());
    EXPECT_EQ(8u, tmmbr.payload().size());

    // Payload-specific feedback with FMT 15, application layer feedback.
    const uint8_t kAfb[] = {0x8F, 206,  0x00, 0x03,
                            0x12, 0x34, 0x56, 0x78,
                            0x00, 0x00, 0x00, 0x00,
                            'R',  'E',  'M',  'B'};
    GenericPacket afb = ParseGeneric(kAfb);
    EXPECT_EQ(206, afb.packet_type());
    EXPECT_EQ(15, afb.count_or_format());
    EXPECT_THAT(BuildPacket(afb), ElementsAreArray(kAfb));
}

MY_TEST(RtcpGenericPacketTest, Create) {
    GenericPacket packet(207, 0);
    EXPECT_FALSE(packet.set_count_or_format(32));
    EXPECT_TRUE(packet.set_count_or_format(31));
    const uint8_t kPayload[] = {0x01, 0x02, 0x03, 0x04, 0x05};
    packet.set_payload(kPayload);
    packet.set_padding_size(3);

    EXPECT_THAT(BuildPacket(packet), ElementsAre(0xBF, 207, 0x00, 0x02, 
                                                 0x01, 0x02, 0x03, 0x04, 
                                                 0x05, 0x00, 0x00, 0x03));
}

MY_TEST(RtcpGenericPacketTest, CreateUnalignedPayload) {
    GenericPacket packet(kAppPacketType, 0);
    const uint8_t kPayload[] = {0x01, 0x02, 0x03};
    packet.set_payload(kPayload);
    try {
        BuildPacket(packet);
        FAIL() << "Built a packet of 7 bytes";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
