#include "rtpcodec/rtcp/compound_packet.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace rtpcodec {
namespace rtcp {
namespace test {
namespace {

constexpr uint32_t kSenderSsrc = 0x12345678;
constexpr uint32_t kRemoteSsrc = 0x23456789;

CompoundPacket CreateCompound() {
    ReportBlock rb;
    rb.set_source_ssrc(kRemoteSsrc);
    rb.set_fraction_lost(10);
    ReceiverReport rr;
    rr.set_sender_ssrc(kSenderSsrc);
    rr.AddReportBlock(rb);

    Sdes sdes;
    sdes.AddCName(kSenderSsrc, "compound");

    Bye bye;
    bye.set_sender_ssrc(kSenderSsrc);

    CompoundPacket compound;
    compound.Append(rr);
    compound.Append(sdes);
    compound.Append(bye);
    return compound;
}

std::vector<uint8_t> PacketTypes(const CompoundPacket& compound) {
    std::vector<uint8_t> types;
    for (const auto& packet : compound.packets()) {
        types.push_back(PacketTypeOf(packet));
    }
    return types;
}

} // namespace

MY_TEST(RtcpCompoundPacketTest, AppendPackets) {
    CompoundPacket compound;
    EXPECT_TRUE(compound.empty());
    compound = CreateCompound();
    EXPECT_FALSE(compound.empty());
    EXPECT_EQ(3u, compound.packet_count());
    EXPECT_THAT(PacketTypes(compound), ElementsAre(201, 202, 203));
}

MY_TEST(RtcpCompoundPacketTest, BuildAndParse) {
    CompoundPacket compound = CreateCompound();
    BinaryBuffer raw = compound.Build();
    // RR with one block, SDES with one CNAME chunk and BYE.
    EXPECT_EQ(32u + 20 + 8, raw.size());

    CompoundPacket parsed = CompoundPacket::Parse(raw);
    ASSERT_EQ(3u, parsed.packet_count());
    EXPECT_EQ(compound, parsed);

    const auto& rr = std::get<ReceiverReport>(parsed.packets()[0]);
    EXPECT_EQ(kSenderSsrc, rr.sender_ssrc());
    ASSERT_EQ(1u, rr.report_blocks().size());
    EXPECT_EQ(10, rr.report_blocks()[0].fraction_lost());
    EXPECT_EQ("compound", std::get<Sdes>(parsed.packets()[1]).chunks()[0].cname().value());
    EXPECT_EQ(kSenderSsrc, std::get<Bye>(parsed.packets()[2]).sender_ssrc());
}

MY_TEST(RtcpCompoundPacketTest, PackIntoAFixedBuffer) {
    CompoundPacket compound = CreateCompound();
    BitWriter large_enough(60);
    compound.PackInto(large_enough);
    EXPECT_EQ(compound.Build(), large_enough.Release());

    BitWriter too_small(59);
    try {
        compound.PackInto(too_small);
        FAIL() << "Packed 60 bytes into 59";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::OUT_OF_BOUNDS, e.kind());
    }
}

MY_TEST(RtcpCompoundPacketTest, ParseEmptyDatagram) {
    try {
        CompoundPacket::Parse(ArrayView<const uint8_t>());
        FAIL() << "Parsed an empty datagram";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

MY_TEST(RtcpCompoundPacketTest, ParseFailsOnBrokenSubPacket) {
    BinaryBuffer raw = CreateCompound().Build();
    // The SDES packet claims two chunks.
    raw[32] = 0x82;
    try {
        CompoundPacket::Parse(raw);
        FAIL() << "Parsed a broken SDES";
    } catch (const CodecError& e) {
        EXPECT_THAT(std::string(e.what()), HasSubstr("sub packet 1: rtcp sdes: chunk 1"));
    }
}

MY_TEST(RtcpCompoundPacketTest, ParseFailsOnTruncatedHeader) {
    BinaryBuffer raw = CreateCompound().Build();
    raw.resize(32 + 2);
    try {
        CompoundPacket::Parse(raw);
        FAIL() << "Parsed 2 bytes of header";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::OUT_OF_BOUNDS, e.kind());
        EXPECT_THAT(std::string(e.what()), HasSubstr("sub packet 1"));
    }
}

MY_TEST(RtcpCompoundPacketTest, ParseFailsOnLengthBeyondTheDatagram) {
    BinaryBuffer raw = CreateCompound().Build();
    raw.resize(raw.size() - 4);
    try {
        CompoundPacket::Parse(raw);
        FAIL() << "Parsed a truncated BYE";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
        EXPECT_THAT(std::string(e.what()), HasSubstr("sub packet 2"));
    }
}

MY_TEST(RtcpCompoundPacketTest, DispatchByTypeAndFormat) {
    Pli pli;
    pli.set_sender_ssrc(kSenderSsrc);
    Fir fir;
    fir.AddRequest(kRemoteSsrc, 1);
    Nack nack;
    nack.set_packet_ids({1, 2});
    TransportFeedback feedback;
    feedback.SetBase(1, 0);
    feedback.AddReceivedPacket(1, 1);
    SenderReport sr;
    GenericPacket app(204, 0);

    CompoundPacket compound;
    compound.Append(sr);
    compound.Append(pli);
    compound.Append(fir);
    compound.Append(nack);
    compound.Append(feedback);
    compound.Append(app);

    CompoundPacket parsed = CompoundPacket::Parse(compound.Build());
    ASSERT_EQ(6u, parsed.packet_count());
    EXPECT_TRUE(std::holds_alternative<SenderReport>(parsed.packets()[0]));
    EXPECT_TRUE(std::holds_alternative<Pli>(parsed.packets()[1]));
    EXPECT_TRUE(std::holds_alternative<Fir>(parsed.packets()[2]));
    EXPECT_TRUE(std::holds_alternative<Nack>(parsed.packets()[3]));
    EXPECT_TRUE(std::holds_alternative<TransportFeedback>(parsed.packets()[4]));
    EXPECT_TRUE(std::holds_alternative<GenericPacket>(parsed.packets()[5]));
    EXPECT_EQ(compound, parsed);
    EXPECT_THAT(PacketTypes(parsed), ElementsAre(200, 206, 206, 205, 205, 204));
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
