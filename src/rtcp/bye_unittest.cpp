#include "rtpcodec/rtcp/bye.hpp"
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

constexpr uint32_t kSenderSsrc = 0x12345678;
constexpr uint32_t kCsrc1 = 0x22232425;
constexpr uint32_t kCsrc2 = 0x33343536;

Bye ParseBye(ArrayView<const uint8_t> data) {
    BitReader reader(data);
    RtcpPacket packet = ParsePacket(reader);
    EXPECT_EQ(0u, reader.RemainingByteCount());
    return std::get<Bye>(std::move(packet));
}

} // namespace

MY_TEST(RtcpByeTest, CreateAndParseWithoutReason) {
    Bye bye;
    bye.set_sender_ssrc(kSenderSsrc);

    BinaryBuffer raw = BuildPacket(bye);
    EXPECT_THAT(raw, ElementsAre(0x81, 203, 0x00, 0x01, 0x12, 0x34, 0x56, 0x78));
    Bye parsed = ParseBye(raw);

    EXPECT_EQ(kSenderSsrc, parsed.sender_ssrc());
    EXPECT_TRUE(parsed.csrcs().empty());
    EXPECT_TRUE(parsed.reason().empty());
}

MY_TEST(RtcpByeTest, CreateAndParseWithCsrcs) {
    Bye bye;
    bye.set_sender_ssrc(kSenderSsrc);
    EXPECT_TRUE(bye.set_csrcs({kCsrc1, kCsrc2}));
    EXPECT_TRUE(bye.reason().empty());

    BinaryBuffer raw = BuildPacket(bye);
    EXPECT_EQ(0x83, raw[0]);
    Bye parsed = ParseBye(raw);

    EXPECT_EQ(kSenderSsrc, parsed.sender_ssrc());
    EXPECT_THAT(parsed.csrcs(), ElementsAre(kCsrc1, kCsrc2));
    EXPECT_THAT(parsed.ssrcs(), ElementsAre(kSenderSsrc, kCsrc1, kCsrc2));
    EXPECT_TRUE(parsed.reason().empty());
}

MY_TEST(RtcpByeTest, CreateAndParseWithCsrcsAndAReason) {
    Bye bye;
    const std::string kReason = "Some Reason";

    bye.set_sender_ssrc(kSenderSsrc);
    EXPECT_TRUE(bye.set_csrcs({kCsrc1, kCsrc2}));
    EXPECT_TRUE(bye.set_reason(kReason));

    BinaryBuffer raw = BuildPacket(bye);
    Bye parsed = ParseBye(raw);

    EXPECT_EQ(kSenderSsrc, parsed.sender_ssrc());
    EXPECT_THAT(parsed.csrcs(), ElementsAre(kCsrc1, kCsrc2));
    EXPECT_EQ(kReason, parsed.reason());
    EXPECT_EQ(bye, parsed);
}

MY_TEST(RtcpByeTest, CreateWithTooManyCsrcs) {
    Bye bye;
    bye.set_sender_ssrc(kSenderSsrc);
    const size_t kMaxCsrcs = Bye::kMaxNumberOfSsrcs - 1;
    EXPECT_TRUE(bye.set_csrcs(std::vector<uint32_t>(kMaxCsrcs, kCsrc1)));
    EXPECT_FALSE(bye.set_csrcs(std::vector<uint32_t>(kMaxCsrcs + 1, kCsrc1)));
    EXPECT_EQ(Bye::kMaxNumberOfSsrcs, bye.ssrcs().size());
    EXPECT_FALSE(bye.set_ssrcs(std::vector<uint32_t>(Bye::kMaxNumberOfSsrcs + 1, kCsrc1)));
}

MY_TEST(RtcpByeTest, CreateAndParseWithAReason) {
    Bye bye;
    const std::string kReason = "Some Random Reason";

    bye.set_sender_ssrc(kSenderSsrc);
    EXPECT_TRUE(bye.set_reason(kReason));

    BinaryBuffer raw = BuildPacket(bye);
    Bye parsed = ParseBye(raw);

    EXPECT_EQ(kSenderSsrc, parsed.sender_ssrc());
    EXPECT_TRUE(parsed.csrcs().empty());
    EXPECT_EQ(kReason, parsed.reason());
}

MY_TEST(RtcpByeTest, CreateAndParseWithReasons) {
    // Test that packet creation/parsing behave with reasons of different length
    // both when it require padding and when it does not.
    for (size_t reminder = 0; reminder < 4; ++reminder) {
        const std::string kReason(4 + reminder, 'a' + reminder);
        Bye bye;
        bye.set_sender_ssrc(kSenderSsrc);
        EXPECT_TRUE(bye.set_reason(kReason));

        BinaryBuffer raw = BuildPacket(bye);
        EXPECT_EQ(0u, raw.size() % 4);
        Bye parsed = ParseBye(raw);

        EXPECT_EQ(kReason, parsed.reason());
    }
}

MY_TEST(RtcpByeTest, ReasonIsPaddedWithZeros) {
    Bye bye;
    bye.set_sender_ssrc(kSenderSsrc);
    EXPECT_TRUE(bye.set_reason("ab"));
    EXPECT_THAT(BuildPacket(bye), ElementsAre(0x81, 203, 0x00, 0x02, 
                                             0x12, 0x34, 0x56, 0x78,
                                             0x02, 'a', 'b', 0x00));
}

MY_TEST(RtcpByeTest, RebuildKeepsReasonPaddingBytes) {
    const uint8_t kPacket[] = {0x81, 203, 0x00, 0x02, 
                               0x12, 0x34, 0x56, 0x78,
                               0x02, 'a', 'b', 0x7E};
    Bye bye = ParseBye(kPacket);
    EXPECT_EQ("ab", bye.reason());
    EXPECT_THAT(BuildPacket(bye), ElementsAreArray(kPacket));

    // A new reason gets zero padding again.
    EXPECT_TRUE(bye.set_reason("cd"));
    EXPECT_THAT(BuildPacket(bye), ElementsAre(0x81, 203, 0x00, 0x02, 
                                             0x12, 0x34, 0x56, 0x78,
                                             0x02, 'c', 'd', 0x00));
}

MY_TEST(RtcpByeTest, RebuildKeepsEmptyReason) {
    const uint8_t kPacket[] = {0x81, 203, 0x00, 0x02, 
                               0x12, 0x34, 0x56, 0x78,
                               0x00, 0x00, 0x00, 0x00};
    Bye bye = ParseBye(kPacket);
    EXPECT_TRUE(bye.reason().empty());
    EXPECT_THAT(BuildPacket(bye), ElementsAreArray(kPacket));

    Bye without_reason;
    without_reason.set_sender_ssrc(kSenderSsrc);
    EXPECT_NE(without_reason, bye);
}

MY_TEST(RtcpByeTest, RebuildWithPadding) {
    const uint8_t kPacket[] = {0xA1, 203, 0x00, 0x02, 
                               0x12, 0x34, 0x56, 0x78,
                               0x00, 0x00, 0x00, 0x04};
    Bye bye = ParseBye(kPacket);
    EXPECT_EQ(kSenderSsrc, bye.sender_ssrc());
    EXPECT_TRUE(bye.reason().empty());
    EXPECT_EQ(4, bye.padding_size());
    EXPECT_THAT(BuildPacket(bye), ElementsAreArray(kPacket));
}

MY_TEST(RtcpByeTest, ParseEmptyPacket) {
    const uint8_t kEmptyPacket[] = {0x80, 203, 0, 0};
    Bye parsed = ParseBye(kEmptyPacket);
    EXPECT_EQ(0u, parsed.sender_ssrc());
    EXPECT_TRUE(parsed.csrcs().empty());
    EXPECT_TRUE(parsed.reason().empty());
}

MY_TEST(RtcpByeTest, ParseFailOnInvalidSrcCount) {
    Bye bye;
    bye.set_sender_ssrc(kSenderSsrc);

    BinaryBuffer raw = BuildPacket(bye);
    raw[0]++;  // Damage the packet: increase ssrc count by one.

    BitReader reader(raw);
    try {
        ParsePacket(reader);
        FAIL() << "Parsed 2 SSRCs out of 1";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

MY_TEST(RtcpByeTest, ParseFailOnInvalidReasonLength) {
    Bye bye;
    bye.set_sender_ssrc(kSenderSsrc);
    EXPECT_TRUE(bye.set_reason("18 characters long"));

    BinaryBuffer raw = BuildPacket(bye);
    // Damage the packet: decrease payload size by 4 bytes.
    raw[3]--;
    raw.resize(raw.size() - 4);

    BitReader reader(raw);
    try {
        ParsePacket(reader);
        FAIL() << "Parsed a truncated reason";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

MY_TEST(RtcpByeTest, ReasonTooLong) {
    Bye bye;
    EXPECT_FALSE(bye.set_reason(std::string(Bye::kMaxReasonLength + 1, 'a')));
    EXPECT_TRUE(bye.set_reason(std::string(Bye::kMaxReasonLength, 'a')));
    EXPECT_EQ(Bye::kMaxReasonLength, bye.reason().size());
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
