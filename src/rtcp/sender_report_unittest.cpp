#include "rtpcodec/rtcp/sender_report.hpp"
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
constexpr uint32_t kNtpSeconds = 0x11121418;
constexpr uint32_t kNtpFractions = 0x22242628;
constexpr uint32_t kRtpTimestamp = 0x33343536;
constexpr uint32_t kPacketCount = 0x44454647;
constexpr uint32_t kOctetCount = 0x55565758;
constexpr uint8_t kPacket[] = {0x80, 200,  0x00, 0x06, 0x12, 0x34, 0x56,
                               0x78, 0x11, 0x12, 0x14, 0x18, 0x22, 0x24,
                               0x26, 0x28, 0x33, 0x34, 0x35, 0x36, 0x44,
                               0x45, 0x46, 0x47, 0x55, 0x56, 0x57, 0x58};

SenderReport ParseSenderReport(ArrayView<const uint8_t> data) {
    BitReader reader(data);
    RtcpPacket packet = ParsePacket(reader);
    EXPECT_EQ(0u, reader.RemainingByteCount());
    return std::get<SenderReport>(std::move(packet));
}

} // namespace

MY_TEST(RtcpSenderReportTest, CreateWithoutReportBlocks) {
    SenderReport sr;
    sr.set_sender_ssrc(kSenderSsrc);
    sr.set_ntp(kNtpSeconds, kNtpFractions);
    sr.set_rtp_timestamp(kRtpTimestamp);
    sr.set_sender_packet_count(kPacketCount);
    sr.set_sender_octet_count(kOctetCount);

    EXPECT_THAT(BuildPacket(sr), ElementsAreArray(kPacket));
}

MY_TEST(RtcpSenderReportTest, ParseWithoutReportBlocks) {
    SenderReport parsed = ParseSenderReport(kPacket);

    EXPECT_EQ(kSenderSsrc, parsed.sender_ssrc());
    EXPECT_EQ(kNtpSeconds, parsed.ntp_seconds());
    EXPECT_EQ(kNtpFractions, parsed.ntp_fractions());
    EXPECT_EQ(kRtpTimestamp, parsed.rtp_timestamp());
    EXPECT_EQ(kPacketCount, parsed.sender_packet_count());
    EXPECT_EQ(kOctetCount, parsed.sender_octet_count());
    EXPECT_TRUE(parsed.report_blocks().empty());
}

MY_TEST(RtcpSenderReportTest, CreateAndParseWithOneReportBlock) {
    ReportBlock rb;
    rb.set_source_ssrc(0x4567);
    rb.set_fraction_lost(12);
    EXPECT_TRUE(rb.set_cumulative_packet_lost(1000));

    SenderReport sr;
    sr.set_sender_ssrc(kSenderSsrc);
    EXPECT_TRUE(sr.AddReportBlock(rb));

    BinaryBuffer raw = BuildPacket(sr);
    ASSERT_EQ(4u + 24 + 24, raw.size());
    EXPECT_EQ(0x81, raw[0]);
    EXPECT_EQ(12, raw[3]);

    SenderReport parsed = ParseSenderReport(raw);
    EXPECT_EQ(kSenderSsrc, parsed.sender_ssrc());
    ASSERT_EQ(1u, parsed.report_blocks().size());
    EXPECT_EQ(0x4567u, parsed.report_blocks()[0].source_ssrc());
    EXPECT_EQ(12, parsed.report_blocks()[0].fraction_lost());
    EXPECT_EQ(1000, parsed.report_blocks()[0].cumulative_packet_lost());
    EXPECT_EQ(sr, parsed);
}

MY_TEST(RtcpSenderReportTest, CreateWithTooManyReportBlocks) {
    SenderReport sr;
    sr.set_sender_ssrc(kSenderSsrc);
    ReportBlock rb;
    for (size_t i = 0; i < SenderReport::kMaxNumberOfReportBlocks; ++i) {
        rb.set_source_ssrc(static_cast<uint32_t>(i));
        EXPECT_TRUE(sr.AddReportBlock(rb));
    }
    EXPECT_FALSE(sr.AddReportBlock(rb));
    EXPECT_FALSE(sr.SetReportBlocks(std::vector<ReportBlock>(SenderReport::kMaxNumberOfReportBlocks + 1)));
    EXPECT_EQ(SenderReport::kMaxNumberOfReportBlocks, sr.report_blocks().size());
}

MY_TEST(RtcpSenderReportTest, ParseTruncatedSenderInfo) {
    const uint8_t kTruncated[] = {0x80, 200, 0x00, 0x02, 
                                  0x12, 0x34, 0x56, 0x78,
                                  0x11, 0x12, 0x14, 0x18};
    BitReader reader(kTruncated, sizeof(kTruncated));
    try {
        ParsePacket(reader);
        FAIL() << "Parsed a sender report without sender info";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
