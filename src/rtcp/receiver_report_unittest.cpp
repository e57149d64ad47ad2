#include "rtpcodec/rtcp/receiver_report.hpp"
#include "rtpcodec/rtcp/rtcp_packet.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;
using ::testing::HasSubstr;

namespace rtpcodec {
namespace rtcp {
namespace test {
namespace {

constexpr uint32_t kSenderSsrc = 0x12345678;
constexpr uint32_t kRemoteSsrc = 0x23456789;
constexpr uint8_t kFractionLost = 55;
constexpr int32_t kCumulativeLost = 0x111213;
constexpr uint32_t kExtHighestSeqNum = 0x22232425;
constexpr uint32_t kJitter = 0x33343536;
constexpr uint32_t kLastSr = 0x44454647;
constexpr uint32_t kDelayLastSr = 0x55565758;
// RTCP-RR packet with a single report block.
constexpr uint8_t kPacket[] = {0x81, 201,  0x00, 0x07, 0x12, 0x34, 0x56, 0x78,
                               0x23, 0x45, 0x67, 0x89, 55,   0x11, 0x12, 0x13,
                               0x22, 0x23, 0x24, 0x25, 0x33, 0x34, 0x35, 0x36,
                               0x44, 0x45, 0x46, 0x47, 0x55, 0x56, 0x57, 0x58};

ReceiverReport ParseReceiverReport(ArrayView<const uint8_t> data) {
    BitReader reader(data);
    RtcpPacket packet = ParsePacket(reader);
    EXPECT_EQ(0u, reader.RemainingByteCount());
    return std::get<ReceiverReport>(std::move(packet));
}

} // namespace

MY_TEST(RtcpReceiverReportTest, ParseWithOneReportBlock) {
    ReceiverReport rr = ParseReceiverReport(kPacket);

    EXPECT_EQ(kSenderSsrc, rr.sender_ssrc());
    ASSERT_EQ(1u, rr.report_blocks().size());
    const ReportBlock& rb = rr.report_blocks().front();
    EXPECT_EQ(kRemoteSsrc, rb.source_ssrc());
    EXPECT_EQ(kFractionLost, rb.fraction_lost());
    EXPECT_EQ(kCumulativeLost, rb.cumulative_packet_lost());
    EXPECT_EQ(kExtHighestSeqNum, rb.extended_highest_seq_num());
    EXPECT_EQ(0x2223, rb.sequence_num_cycles());
    EXPECT_EQ(0x2425, rb.highest_seq_num());
    EXPECT_EQ(kJitter, rb.jitter());
    EXPECT_EQ(kLastSr, rb.last_sr_ntp_timestamp());
    EXPECT_EQ(kDelayLastSr, rb.delay_since_last_sr());
}

MY_TEST(RtcpReceiverReportTest, ParseFailsOnIncorrectSize) {
    BinaryBuffer damaged_packet(kPacket, kPacket + sizeof(kPacket));
    // Claims one more report block than the 32 bytes hold.
    damaged_packet[0]++;
    BitReader reader(damaged_packet);
    try {
        ParsePacket(reader);
        FAIL() << "Parsed 2 report blocks out of 1";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
        EXPECT_THAT(std::string(e.what()), HasSubstr("rtcp rr"));
        EXPECT_THAT(std::string(e.what()), HasSubstr("2 report blocks need 52 bytes, got 28"));
    }
}

MY_TEST(RtcpReceiverReportTest, ParseFailsOnTrailingData) {
    const uint8_t kPacketWithExtraWord[] = {0x80, 201, 0x00, 0x02, 
                                            0x12, 0x34, 0x56, 0x78,
                                            0x00, 0x00, 0x00, 0x00};
    BitReader reader(kPacketWithExtraWord, sizeof(kPacketWithExtraWord));
    try {
        ParsePacket(reader);
        FAIL() << "Ignored 4 bytes after the body";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::TRAILING_DATA, e.kind());
    }
}

MY_TEST(RtcpReceiverReportTest, ParseWithPadding) {
    const uint8_t kPaddedPacket[] = {0xA0, 201, 0x00, 0x02, 
                                     0x12, 0x34, 0x56, 0x78,
                                     0x00, 0x00, 0x00, 0x04};
    ReceiverReport rr = ParseReceiverReport(kPaddedPacket);
    EXPECT_EQ(kSenderSsrc, rr.sender_ssrc());
    EXPECT_TRUE(rr.report_blocks().empty());
    EXPECT_EQ(4, rr.padding_size());
    EXPECT_THAT(BuildPacket(rr), ElementsAreArray(kPaddedPacket));
}

MY_TEST(RtcpReceiverReportTest, RebuildPaddedReportBlock) {
    BinaryBuffer padded(kPacket, kPacket + sizeof(kPacket));
    padded[0] |= 0x20;
    padded[3] = 0x08;
    padded.insert(padded.end(), {0x00, 0x00, 0x00, 0x04});

    ReceiverReport rr = ParseReceiverReport(padded);
    ASSERT_EQ(1u, rr.report_blocks().size());
    EXPECT_EQ(kRemoteSsrc, rr.report_blocks()[0].source_ssrc());
    EXPECT_EQ(4, rr.padding_size());

    BinaryBuffer rebuilt = BuildPacket(rr);
    ASSERT_EQ(36u, rebuilt.size());
    EXPECT_THAT(rebuilt, ElementsAreArray(padded));
    EXPECT_EQ(rr, ParseReceiverReport(rebuilt));
}

MY_TEST(RtcpReceiverReportTest, CreateWithPadding) {
    ReceiverReport rr;
    rr.set_sender_ssrc(kSenderSsrc);
    rr.set_padding_size(4);
    EXPECT_THAT(BuildPacket(rr), ElementsAre(0xA0, 201, 0x00, 0x02, 
                                             0x12, 0x34, 0x56, 0x78,
                                             0x00, 0x00, 0x00, 0x04));

    rr.set_padding_size(3);
    EXPECT_THROW(BuildPacket(rr), CodecError);
}

MY_TEST(RtcpReceiverReportTest, CreateWithOneReportBlock) {
    ReceiverReport rr;
    rr.set_sender_ssrc(kSenderSsrc);
    ReportBlock rb;
    rb.set_source_ssrc(kRemoteSsrc);
    rb.set_fraction_lost(kFractionLost);
    EXPECT_TRUE(rb.set_cumulative_packet_lost(kCumulativeLost));
    rb.set_extended_highest_seq_num(kExtHighestSeqNum);
    rb.set_jitter(kJitter);
    rb.set_last_sr_ntp_timestamp(kLastSr);
    rb.set_delay_since_last_sr(kDelayLastSr);
    EXPECT_TRUE(rr.AddReportBlock(rb));

    EXPECT_THAT(BuildPacket(rr), ElementsAreArray(kPacket));
}

MY_TEST(RtcpReceiverReportTest, LengthFieldOfOneReportBlock) {
    ReportBlock rb;
    rb.set_source_ssrc(0x11223344);
    ReceiverReport rr;
    EXPECT_TRUE(rr.AddReportBlock(rb));

    BinaryBuffer raw = BuildPacket(rr);
    ASSERT_EQ(32u, raw.size());
    EXPECT_THAT(std::vector<uint8_t>(raw.begin(), raw.begin() + 4), ElementsAre(0x81, 201, 0x00, 0x07));
    EXPECT_THAT(std::vector<uint8_t>(raw.begin() + 8, raw.begin() + 12), ElementsAre(0x11, 0x22, 0x33, 0x44));
}

MY_TEST(RtcpReceiverReportTest, CreateAndParseWithoutReportBlocks) {
    ReceiverReport rr;
    rr.set_sender_ssrc(kSenderSsrc);

    BinaryBuffer raw = BuildPacket(rr);
    ASSERT_EQ(8u, raw.size());
    EXPECT_EQ(0x80, raw[0]);
    ReceiverReport parsed = ParseReceiverReport(raw);
    EXPECT_EQ(kSenderSsrc, parsed.sender_ssrc());
    EXPECT_TRUE(parsed.report_blocks().empty());
    EXPECT_EQ(rr, parsed);
}

MY_TEST(RtcpReceiverReportTest, NegativeCumulativeLost) {
    ReceiverReport rr;
    ReportBlock rb;
    EXPECT_TRUE(rb.set_cumulative_packet_lost(-3));
    EXPECT_TRUE(rr.AddReportBlock(rb));
    BinaryBuffer raw = BuildPacket(rr);
    // fraction lost and the 24-bit cumulative lost
    EXPECT_EQ(0x00, raw[12]);
    EXPECT_EQ(0xFF, raw[13]);
    EXPECT_EQ(0xFF, raw[14]);
    EXPECT_EQ(0xFD, raw[15]);
    EXPECT_EQ(-3, ParseReceiverReport(raw).report_blocks()[0].cumulative_packet_lost());
}

MY_TEST(RtcpReceiverReportTest, CumulativeLostOutOfRange) {
    ReportBlock rb;
    EXPECT_TRUE(rb.set_cumulative_packet_lost((1 << 23) - 1));
    EXPECT_TRUE(rb.set_cumulative_packet_lost(-(1 << 23)));
    EXPECT_FALSE(rb.set_cumulative_packet_lost(1 << 23));
    EXPECT_FALSE(rb.set_cumulative_packet_lost(-(1 << 23) - 1));
    EXPECT_EQ(-(1 << 23), rb.cumulative_packet_lost());
}

MY_TEST(RtcpReceiverReportTest, AddReportBlockLimit) {
    ReceiverReport rr;
    rr.set_sender_ssrc(kSenderSsrc);
    ReportBlock rb;
    for (size_t i = 0; i < ReceiverReport::kMaxNumberOfReportBlocks; ++i) {
        rb.set_source_ssrc(static_cast<uint32_t>(i));
        EXPECT_TRUE(rr.AddReportBlock(rb));
    }
    rb.set_source_ssrc(ReceiverReport::kMaxNumberOfReportBlocks);
    EXPECT_FALSE(rr.AddReportBlock(rb));
    EXPECT_EQ(ReceiverReport::kMaxNumberOfReportBlocks, rr.report_blocks().size());

    BinaryBuffer raw = BuildPacket(rr);
    EXPECT_EQ(0x9F, raw[0]);
    EXPECT_EQ(rr, ParseReceiverReport(raw));
}

MY_TEST(RtcpReceiverReportTest, SetReportBlocksLimit) {
    ReceiverReport rr;
    std::vector<ReportBlock> blocks(ReceiverReport::kMaxNumberOfReportBlocks + 1);
    EXPECT_FALSE(rr.SetReportBlocks(blocks));
    EXPECT_TRUE(rr.report_blocks().empty());
    blocks.pop_back();
    EXPECT_TRUE(rr.SetReportBlocks(blocks));
    EXPECT_EQ(ReceiverReport::kMaxNumberOfReportBlocks, rr.report_blocks().size());
    rr.ClearReportBlocks();
    EXPECT_TRUE(rr.report_blocks().empty());
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
