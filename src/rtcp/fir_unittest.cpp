#include "rtpcodec/rtcp/fir.hpp"
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
constexpr uint8_t kSeqNr = 13;
// Manually created Fir packet matching constants above.
constexpr uint8_t kPacket[] = {0x84, 206,  0x00, 0x04, 0x12, 0x34, 0x56,
                               0x78, 0x00, 0x00, 0x00, 0x00, 0x23, 0x45,
                               0x67, 0x89, 0x0d, 0x00, 0x00, 0x00};

Fir ParseFir(ArrayView<const uint8_t> data) {
    BitReader reader(data);
    RtcpPacket packet = ParsePacket(reader);
    EXPECT_EQ(0u, reader.RemainingByteCount());
    return std::get<Fir>(std::move(packet));
}

} // namespace

MY_TEST(RtcpFirTest, Parse) {
    Fir fir = ParseFir(kPacket);

    EXPECT_EQ(kSenderSsrc, fir.sender_ssrc());
    EXPECT_EQ(0u, fir.media_ssrc());
    ASSERT_EQ(1u, fir.requests().size());
    EXPECT_EQ(kRemoteSsrc, fir.requests()[0].ssrc);
    EXPECT_EQ(kSeqNr, fir.requests()[0].seq_nr);
}

MY_TEST(RtcpFirTest, Create) {
    Fir fir;
    fir.set_sender_ssrc(kSenderSsrc);
    fir.AddRequest(kRemoteSsrc, kSeqNr);

    EXPECT_THAT(BuildPacket(fir), ElementsAreArray(kPacket));
}

MY_TEST(RtcpFirTest, TwoFciEntries) {
    Fir fir;
    fir.set_sender_ssrc(kSenderSsrc);
    fir.AddRequest(kRemoteSsrc, kSeqNr);
    fir.AddRequest(kRemoteSsrc + 1, kSeqNr + 1);

    BinaryBuffer raw = BuildPacket(fir);
    EXPECT_EQ(28u, raw.size());
    Fir parsed = ParseFir(raw);

    EXPECT_EQ(kSenderSsrc, parsed.sender_ssrc());
    ASSERT_EQ(2u, parsed.requests().size());
    EXPECT_EQ(kRemoteSsrc, parsed.requests()[0].ssrc);
    EXPECT_EQ(kSeqNr, parsed.requests()[0].seq_nr);
    EXPECT_EQ(kRemoteSsrc + 1, parsed.requests()[1].ssrc);
    EXPECT_EQ(kSeqNr + 1, parsed.requests()[1].seq_nr);
    EXPECT_EQ(fir, parsed);
}

MY_TEST(RtcpFirTest, RebuildKeepsMediaSsrcAndReservedBits) {
    const uint8_t kPacketWithUnusedFields[] = {0x84, 206,  0x00, 0x04, 
                                               0x12, 0x34, 0x56, 0x78, 
                                               0x23, 0x45, 0x67, 0x89, 
                                               0x23, 0x45, 0x67, 0x89, 
                                               0x0d, 0x00, 0x01, 0x80};
    Fir fir = ParseFir(kPacketWithUnusedFields);
    EXPECT_EQ(kRemoteSsrc, fir.media_ssrc());
    ASSERT_EQ(1u, fir.requests().size());
    EXPECT_EQ(0x000180u, fir.requests()[0].reserved);

    EXPECT_THAT(BuildPacket(fir), ElementsAreArray(kPacketWithUnusedFields));
}

MY_TEST(RtcpFirTest, RebuildWithPadding) {
    const uint8_t kPaddedPacket[] = {0xA4, 206,  0x00, 0x05, 0x12, 0x34, 0x56, 
                                     0x78, 0x00, 0x00, 0x00, 0x00, 0x23, 0x45, 
                                     0x67, 0x89, 0x0d, 0x00, 0x00, 0x00, 0x00, 
                                     0x00, 0x00, 0x04};
    Fir fir = ParseFir(kPaddedPacket);
    EXPECT_EQ(4, fir.padding_size());
    EXPECT_THAT(BuildPacket(fir), ElementsAreArray(kPaddedPacket));
}

MY_TEST(RtcpFirTest, ParseFailsOnZeroFciEntries) {
    const uint8_t kPacketWithoutFci[] = {0x84, 206,  0x00, 0x02, 
                                         0x12, 0x34, 0x56, 0x78, 
                                         0x00, 0x00, 0x00, 0x00};
    BitReader reader(kPacketWithoutFci, sizeof(kPacketWithoutFci));
    EXPECT_THROW(ParsePacket(reader), CodecError);
}

MY_TEST(RtcpFirTest, ParseFailsOnFractionalFciEntries) {
    const uint8_t kPacketWithFractionalFci[] = {0x84, 206,  0x00, 0x05, 0x12, 0x34, 0x56, 
                                                0x78, 0x00, 0x00, 0x00, 0x00, 0x23, 0x45, 
                                                0x67, 0x89, 0x0d, 0x00, 0x00, 0x00, 0x23, 
                                                0x45, 0x67, 0x89};
    BitReader reader(kPacketWithFractionalFci, sizeof(kPacketWithFractionalFci));
    try {
        ParsePacket(reader);
        FAIL() << "Parsed 12 bytes of FCI";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

MY_TEST(RtcpFirTest, CreateWithoutRequests) {
    Fir fir;
    fir.set_sender_ssrc(kSenderSsrc);
    EXPECT_THROW(BuildPacket(fir), CodecError);
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
