#include "rtpcodec/rtcp/transport_feedback.hpp"
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
constexpr uint32_t kMediaSsrc = 0x23456789;

constexpr PacketStatus kNotReceived = PacketStatus::NOT_RECEIVED;
constexpr PacketStatus kSmall = PacketStatus::RECEIVED_SMALL_DELTA;
constexpr PacketStatus kLarge = PacketStatus::RECEIVED_LARGE_DELTA;

// Captured feedback of 9 packets with small deltas, ending in one
// byte of zero padding without the padding bit.
constexpr uint8_t kPacket[] = {0x8F, 205,  0x00, 0x07, 
                               0x12, 0x34, 0x56, 0x78,
                               0x23, 0x45, 0x67, 0x89,
                               0xFF, 0xFA, 0x00, 0x09, 
                               0x19, 0xB0, 0xB1, 0x57, 
                               0x20, 0x09, 0xD8, 0x00, 
                               0x18, 0x14, 0x18, 0x14, 
                               0x18, 0x14, 0x18, 0x00};

TransportFeedback ParseFeedback(ArrayView<const uint8_t> data) {
    BitReader reader(data);
    RtcpPacket packet = ParsePacket(reader);
    EXPECT_EQ(0u, reader.RemainingByteCount());
    return std::get<TransportFeedback>(std::move(packet));
}

void ExpectParseError(ArrayView<const uint8_t> data, ErrorKind kind) {
    BitReader reader(data);
    try {
        ParsePacket(reader);
        FAIL() << "Parsed an invalid transport feedback";
    } catch (const CodecError& e) {
        EXPECT_EQ(kind, e.kind());
        EXPECT_THAT(std::string(e.what()), HasSubstr("rtcp transport feedback"));
    }
}

} // namespace

MY_TEST(RtcpTransportFeedbackTest, ParseCapturedPacket) {
    TransportFeedback feedback = ParseFeedback(kPacket);

    EXPECT_EQ(kSenderSsrc, feedback.sender_ssrc());
    EXPECT_EQ(kMediaSsrc, feedback.media_ssrc());
    EXPECT_EQ(65530, feedback.base_sequence_number());
    EXPECT_EQ(9u, feedback.packet_status_count());
    EXPECT_EQ(0x19B0B1, feedback.reference_time());
    EXPECT_EQ(int64_t(0x19B0B1) * 64000, feedback.base_time_us());
    EXPECT_EQ(0x57, feedback.feedback_sequence_number());

    const std::vector<int16_t> kDeltas = {216, 0, 24, 20, 24, 20, 24, 20, 24};
    ASSERT_EQ(kDeltas.size(), feedback.received_packets().size());
    uint16_t seq_num = 65530;
    for (size_t i = 0; i < kDeltas.size(); ++i, ++seq_num) {
        EXPECT_EQ(seq_num, feedback.received_packets()[i].sequence_number());
        EXPECT_EQ(kDeltas[i], feedback.received_packets()[i].delta_ticks());
        EXPECT_EQ(kDeltas[i] * 250, feedback.received_packets()[i].delta_us());
    }
    EXPECT_EQ(0, feedback.received_packets()[6].sequence_number());
}

MY_TEST(RtcpTransportFeedbackTest, RebuildCapturedPacket) {
    TransportFeedback feedback = ParseFeedback(kPacket);
    EXPECT_EQ(0, feedback.padding_size());

    BinaryBuffer raw = BuildPacket(feedback);
    EXPECT_THAT(raw, ElementsAreArray(kPacket));
    EXPECT_EQ(feedback, ParseFeedback(raw));
}

MY_TEST(RtcpTransportFeedbackTest, RebuildSignaledPadding) {
    // The padding bit form of the packet built in CreateWithSmallAndLargeDeltas.
    const uint8_t kSignaled[] = {0xAF, 205,  0x00, 0x06,
                                 0x12, 0x34, 0x56, 0x78,
                                 0x23, 0x45, 0x67, 0x89,
                                 0x00, 0x64, 0x00, 0x04,
                                 0x00, 0x03, 0xE8, 0x03,
                                 0xD0, 0x80, 0x04, 0x01,
                                 0x2C, 0x00, 0x00, 0x03};
    TransportFeedback feedback = ParseFeedback(kSignaled);
    EXPECT_EQ(3, feedback.padding_size());
    EXPECT_EQ(2u, feedback.received_packets().size());
    EXPECT_THAT(BuildPacket(feedback), ElementsAreArray(kSignaled));
}

MY_TEST(RtcpTransportFeedbackTest, RebuildChunksTheEncoderWouldNotChoose) {
    // Three small deltas in a two-bit vector instead of a run length chunk.
    const uint8_t kTwoBitVector[] = {0x8F, 205,  0x00, 0x06,
                                     0x12, 0x34, 0x56, 0x78,
                                     0x23, 0x45, 0x67, 0x89,
                                     0x00, 0x0A, 0x00, 0x03,
                                     0x00, 0x00, 0x00, 0x00,
                                     0xD5, 0x00, 0x01, 0x02,
                                     0x03, 0x00, 0x00, 0x00};
    TransportFeedback feedback = ParseFeedback(kTwoBitVector);
    EXPECT_THAT(feedback.packet_statuses(), ElementsAre(kSmall, kSmall, kSmall));
    EXPECT_THAT(BuildPacket(feedback), ElementsAreArray(kTwoBitVector));

    // New statuses are encoded from scratch.
    EXPECT_TRUE(feedback.AddReceivedPacket(13, 4));
    BinaryBuffer raw = BuildPacket(feedback);
    EXPECT_THAT(BinaryBuffer(raw.begin() + 20, raw.begin() + 22), ElementsAre(0x20, 0x04));
}

MY_TEST(RtcpTransportFeedbackTest, RebuildLargeDeltaOfSmallValue) {
    const uint8_t kLargeDelta[] = {0x8F, 205,  0x00, 0x05,
                                   0x12, 0x34, 0x56, 0x78,
                                   0x23, 0x45, 0x67, 0x89,
                                   0x00, 0x0A, 0x00, 0x01,
                                   0x00, 0x00, 0x00, 0x00,
                                   0xE0, 0x00, 0x00, 0x05};
    TransportFeedback feedback = ParseFeedback(kLargeDelta);
    EXPECT_THAT(feedback.packet_statuses(), ElementsAre(kLarge));
    ASSERT_EQ(1u, feedback.received_packets().size());
    EXPECT_EQ(5, feedback.received_packets()[0].delta_ticks());
    EXPECT_THAT(BuildPacket(feedback), ElementsAreArray(kLargeDelta));
}

MY_TEST(RtcpTransportFeedbackTest, RebuildNonZeroBarePadding) {
    BinaryBuffer packet(kPacket, kPacket + sizeof(kPacket));
    packet.back() = 0x5A;
    TransportFeedback feedback = ParseFeedback(packet);
    EXPECT_THAT(BuildPacket(feedback), ElementsAreArray(packet));
    EXPECT_NE(ParseFeedback(kPacket), feedback);
}

MY_TEST(RtcpTransportFeedbackTest, CreateWithSmallAndLargeDeltas) {
    TransportFeedback feedback;
    feedback.set_sender_ssrc(kSenderSsrc);
    feedback.set_media_ssrc(kMediaSsrc);
    feedback.SetBase(100, 1000);
    feedback.set_feedback_sequence_number(3);
    EXPECT_TRUE(feedback.AddReceivedPacket(100, 4));
    EXPECT_TRUE(feedback.AddReceivedPacket(103, 300));

    EXPECT_THAT(feedback.packet_statuses(), ElementsAre(kSmall, kNotReceived, kNotReceived, kLarge));

    // Zero padding without the padding bit.
    const uint8_t kExpected[] = {0x8F, 205,  0x00, 0x06,
                                 0x12, 0x34, 0x56, 0x78,
                                 0x23, 0x45, 0x67, 0x89,
                                 0x00, 0x64, 0x00, 0x04,
                                 0x00, 0x03, 0xE8, 0x03,
                                 0xD0, 0x80, 0x04, 0x01,
                                 0x2C, 0x00, 0x00, 0x00};
    BinaryBuffer raw = BuildPacket(feedback);
    EXPECT_THAT(raw, ElementsAreArray(kExpected));

    TransportFeedback parsed = ParseFeedback(raw);
    EXPECT_EQ(feedback, parsed);
    ASSERT_EQ(2u, parsed.received_packets().size());
    EXPECT_EQ(1000, parsed.received_packets()[0].delta_us());
    EXPECT_EQ(103, parsed.received_packets()[1].sequence_number());
    EXPECT_EQ(75000, parsed.received_packets()[1].delta_us());
}

MY_TEST(RtcpTransportFeedbackTest, SmallDeltasAsOneRunLengthChunk) {
    TransportFeedback feedback;
    feedback.set_sender_ssrc(kSenderSsrc);
    feedback.set_media_ssrc(kMediaSsrc);
    feedback.SetBase(10, 0);
    EXPECT_TRUE(feedback.AddReceivedPacket(10, 1));
    EXPECT_TRUE(feedback.AddReceivedPacket(11, 2));
    EXPECT_TRUE(feedback.AddReceivedPacket(12, 3));

    const uint8_t kExpected[] = {0x8F, 205,  0x00, 0x06,
                                 0x12, 0x34, 0x56, 0x78,
                                 0x23, 0x45, 0x67, 0x89,
                                 0x00, 0x0A, 0x00, 0x03,
                                 0x00, 0x00, 0x00, 0x00,
                                 // Run of 3 small deltas, then the deltas.
                                 0x20, 0x03, 0x01, 0x02,
                                 0x03, 0x00, 0x00, 0x00};
    EXPECT_THAT(BuildPacket(feedback), ElementsAreArray(kExpected));
}

MY_TEST(RtcpTransportFeedbackTest, NegativeDeltaIsLarge) {
    TransportFeedback feedback;
    feedback.SetBase(0, 0);
    EXPECT_TRUE(feedback.AddReceivedPacket(0, -1));
    EXPECT_THAT(feedback.packet_statuses(), ElementsAre(kLarge));

    TransportFeedback parsed = ParseFeedback(BuildPacket(feedback));
    ASSERT_EQ(1u, parsed.received_packets().size());
    EXPECT_EQ(-1, parsed.received_packets()[0].delta_ticks());
    EXPECT_EQ(-250, parsed.received_packets()[0].delta_us());
}

MY_TEST(RtcpTransportFeedbackTest, NotReceivedPackets) {
    TransportFeedback feedback;
    feedback.SetBase(10, 0);
    EXPECT_TRUE(feedback.AddNotReceivedPacket(12));
    EXPECT_TRUE(feedback.AddReceivedPacket(13, 1));
    EXPECT_THAT(feedback.packet_statuses(), ElementsAre(kNotReceived, kNotReceived, kNotReceived, kSmall));

    TransportFeedback parsed = ParseFeedback(BuildPacket(feedback));
    EXPECT_EQ(4u, parsed.packet_status_count());
    ASSERT_EQ(1u, parsed.received_packets().size());
    EXPECT_EQ(13, parsed.received_packets()[0].sequence_number());
}

MY_TEST(RtcpTransportFeedbackTest, SequenceNumberWrapAround) {
    TransportFeedback feedback;
    feedback.SetBase(0xFFFE, 0);
    EXPECT_TRUE(feedback.AddReceivedPacket(0xFFFE, 1));
    EXPECT_TRUE(feedback.AddReceivedPacket(0x0001, 2));
    EXPECT_EQ(4u, feedback.packet_status_count());

    TransportFeedback parsed = ParseFeedback(BuildPacket(feedback));
    ASSERT_EQ(2u, parsed.received_packets().size());
    EXPECT_EQ(0xFFFE, parsed.received_packets()[0].sequence_number());
    EXPECT_EQ(0x0001, parsed.received_packets()[1].sequence_number());
}

MY_TEST(RtcpTransportFeedbackTest, RejectOutOfOrderPackets) {
    TransportFeedback feedback;
    feedback.SetBase(100, 0);
    EXPECT_FALSE(feedback.AddReceivedPacket(99, 1));
    EXPECT_TRUE(feedback.AddReceivedPacket(101, 1));
    EXPECT_FALSE(feedback.AddReceivedPacket(101, 1));
    EXPECT_FALSE(feedback.AddNotReceivedPacket(100));
    EXPECT_EQ(2u, feedback.packet_status_count());
}

MY_TEST(RtcpTransportFeedbackTest, MaxReportedPackets) {
    TransportFeedback feedback;
    feedback.SetBase(0, 0);
    EXPECT_TRUE(feedback.AddReceivedPacket(0x7FFF, 1));
    EXPECT_TRUE(feedback.AddReceivedPacket(0xFFFD, 1));
    EXPECT_EQ(TransportFeedback::kMaxReportedPackets - 1, feedback.packet_status_count());
    EXPECT_TRUE(feedback.AddNotReceivedPacket(0xFFFE));
    EXPECT_FALSE(feedback.AddReceivedPacket(0xFFFF, 1));
    EXPECT_EQ(TransportFeedback::kMaxReportedPackets, feedback.packet_status_count());

    TransportFeedback parsed = ParseFeedback(BuildPacket(feedback));
    EXPECT_EQ(feedback, parsed);
}

MY_TEST(RtcpTransportFeedbackTest, ReferenceTimeIsSigned24Bits) {
    TransportFeedback feedback;
    feedback.SetBase(0, -1);
    EXPECT_EQ(-1, feedback.reference_time());
    feedback.SetBase(0, 0x800000);
    EXPECT_EQ(-0x800000, feedback.reference_time());
    feedback.SetBase(0, 0x1000001);
    EXPECT_EQ(1, feedback.reference_time());

    feedback.SetBase(0, -2);
    EXPECT_TRUE(feedback.AddReceivedPacket(0, 1));
    TransportFeedback parsed = ParseFeedback(BuildPacket(feedback));
    EXPECT_EQ(-2, parsed.reference_time());
    EXPECT_EQ(-2 * 64000, parsed.base_time_us());
}

MY_TEST(RtcpTransportFeedbackTest, SetBaseClearsStatuses) {
    TransportFeedback feedback;
    feedback.SetBase(0, 0);
    EXPECT_TRUE(feedback.AddReceivedPacket(5, 1));
    feedback.SetBase(10, 0);
    EXPECT_EQ(0u, feedback.packet_status_count());
    EXPECT_TRUE(feedback.received_packets().empty());
}

MY_TEST(RtcpTransportFeedbackTest, CreateEmptyFeedback) {
    TransportFeedback feedback;
    feedback.SetBase(0, 0);
    EXPECT_THROW(BuildPacket(feedback), CodecError);
}

MY_TEST(RtcpTransportFeedbackTest, ParseEmptyFeedback) {
    const uint8_t kEmpty[] = {0x8F, 205,  0x00, 0x04, 
                              0x12, 0x34, 0x56, 0x78,
                              0x23, 0x45, 0x67, 0x89,
                              0x00, 0x01, 0x00, 0x00, 
                              0x00, 0x00, 0x01, 0x00};
    ExpectParseError(kEmpty, ErrorKind::MALFORMED_HEADER);
}

MY_TEST(RtcpTransportFeedbackTest, ParseTooSmallFeedback) {
    const uint8_t kTooSmall[] = {0x8F, 205,  0x00, 0x03, 
                                 0x12, 0x34, 0x56, 0x78,
                                 0x23, 0x45, 0x67, 0x89,
                                 0x00, 0x01, 0x00, 0x01};
    ExpectParseError(kTooSmall, ErrorKind::MALFORMED_HEADER);
}

MY_TEST(RtcpTransportFeedbackTest, ParseReservedStatus) {
    const uint8_t kReserved[] = {0x8F, 205,  0x00, 0x05, 
                                 0x12, 0x34, 0x56, 0x78,
                                 0x23, 0x45, 0x67, 0x89,
                                 0x00, 0x01, 0x00, 0x01, 
                                 0x00, 0x00, 0x01, 0x00,
                                 0x60, 0x01, 0x00, 0x00};
    ExpectParseError(kReserved, ErrorKind::MALFORMED_HEADER);
}

MY_TEST(RtcpTransportFeedbackTest, ParseMissingDeltas) {
    // Two large deltas announced, one present.
    const uint8_t kMissingDelta[] = {0x8F, 205,  0x00, 0x05, 
                                     0x12, 0x34, 0x56, 0x78,
                                     0x23, 0x45, 0x67, 0x89,
                                     0x00, 0x01, 0x00, 0x02, 
                                     0x00, 0x00, 0x01, 0x00,
                                     0x40, 0x02, 0x01, 0x00};
    ExpectParseError(kMissingDelta, ErrorKind::OUT_OF_BOUNDS);
}

MY_TEST(RtcpTransportFeedbackTest, ParseTrailingWord) {
    const uint8_t kTrailing[] = {0x8F, 205,  0x00, 0x06, 
                                 0x12, 0x34, 0x56, 0x78,
                                 0x23, 0x45, 0x67, 0x89,
                                 0x00, 0x01, 0x00, 0x01, 
                                 0x00, 0x00, 0x01, 0x00,
                                 0x20, 0x01, 0x05, 0x00,
                                 0x00, 0x00, 0x00, 0x00};
    ExpectParseError(kTrailing, ErrorKind::TRAILING_DATA);
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
