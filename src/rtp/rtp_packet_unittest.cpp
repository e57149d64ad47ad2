#include "rtpcodec/rtp/rtp_packet.hpp"
#include "rtpcodec/rtp/rtp_header_extensions.hpp"
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
namespace rtp {
namespace test {
namespace {

constexpr uint8_t kAudioLevelId = 1;
constexpr uint8_t kTransportSequenceNumberId = 3;

// Opus packet with an audio level extension and no payload.
constexpr uint8_t kPacketWithAudioLevel[] = {
    0x90, 0xef, 0x16, 0xad, 
    0x65, 0xf3, 0xe1, 0x4e, 
    0x32, 0x0f, 0x22, 0x3a, 
    0xbe, 0xde, 0x00, 0x01, 
    0x10, 0xff, 0x00, 0x00};

constexpr uint8_t kPacketWithCsrcsAndPadding[] = {
    0xA2, 0x60, 0x00, 0x01,
    0x00, 0x00, 0x00, 0x02,
    0x11, 0x22, 0x33, 0x44,
    0x01, 0x01, 0x01, 0x01,
    0x02, 0x02, 0x02, 0x02,
    'p',  'a',  'y',  0x00,
    0x00, 0x03};

} // namespace

MY_TEST(RtpPacketTest, ParseMinimalPacket) {
    const uint8_t kMinimalPacket[] = {0x80, 0x60, 0x12, 0x34,
                                      0x00, 0x00, 0x10, 0x00,
                                      0xAB, 0xCD, 0xEF, 0x01,
                                      0x01, 0x02, 0x03, 0x04,
                                      0x05, 0x06, 0x07, 0x08};
    RtpPacket packet = RtpPacket::Parse(kMinimalPacket);
    EXPECT_FALSE(packet.has_extension());
    EXPECT_FALSE(packet.extensions().has_value());
    EXPECT_TRUE(packet.csrcs().empty());
    EXPECT_EQ(96, packet.payload_type());
    EXPECT_EQ(0x1234, packet.sequence_number());
    EXPECT_EQ(0x1000u, packet.timestamp());
    EXPECT_EQ(0xABCDEF01u, packet.ssrc());
    EXPECT_EQ(kFixedHeaderSize, packet.header_size());
    EXPECT_THAT(packet.payload(), ElementsAre(1, 2, 3, 4, 5, 6, 7, 8));
    EXPECT_THAT(packet.Build(), ElementsAreArray(kMinimalPacket));
}

MY_TEST(RtpPacketTest, ParseAudioPacketWithExtension) {
    RtpPacket packet = RtpPacket::Parse(kPacketWithAudioLevel, sizeof(kPacketWithAudioLevel));
    EXPECT_TRUE(packet.marker());
    EXPECT_EQ(111, packet.payload_type());
    EXPECT_EQ(5805, packet.sequence_number());
    EXPECT_EQ(1710481742u, packet.timestamp());
    EXPECT_EQ(839852602u, packet.ssrc());
    EXPECT_TRUE(packet.csrcs().empty());
    EXPECT_FALSE(packet.has_padding());
    EXPECT_EQ(0u, packet.payload_size());
    ASSERT_TRUE(packet.has_extension());
    EXPECT_THAT(packet.extensions()->Find(kAudioLevelId), ElementsAre(0xFF));

    auto audio_level = packet.GetExtension<AudioLevel>(kAudioLevelId);
    ASSERT_TRUE(audio_level.has_value());
    EXPECT_TRUE(audio_level->voice_activity());
    EXPECT_EQ(AudioLevel::kMutedLevel, audio_level->audio_level());
    EXPECT_FALSE(packet.GetExtension<TransportSequenceNumber>(kAudioLevelId).has_value());
    EXPECT_FALSE(packet.GetExtension<AudioLevel>(2).has_value());

    EXPECT_EQ(sizeof(kPacketWithAudioLevel), packet.size());
    EXPECT_THAT(packet.Build(), ElementsAreArray(kPacketWithAudioLevel));
}

MY_TEST(RtpPacketTest, ParseCsrcsAndPadding) {
    RtpPacket packet = RtpPacket::Parse(kPacketWithCsrcsAndPadding, sizeof(kPacketWithCsrcsAndPadding));
    EXPECT_FALSE(packet.marker());
    EXPECT_EQ(0x60, packet.payload_type());
    EXPECT_EQ(1, packet.sequence_number());
    EXPECT_EQ(2u, packet.timestamp());
    EXPECT_EQ(0x11223344u, packet.ssrc());
    EXPECT_THAT(packet.csrcs(), ElementsAre(0x01010101u, 0x02020202u));
    EXPECT_FALSE(packet.has_extension());
    EXPECT_EQ(3u, packet.padding_size());
    EXPECT_THAT(packet.payload(), ElementsAre('p', 'a', 'y'));

    ByteRange range = packet.payload_range();
    EXPECT_EQ(20u, range.offset);
    EXPECT_EQ(3u, range.size);
    EXPECT_THAT(packet.Build(), ElementsAreArray(kPacketWithCsrcsAndPadding));
}

MY_TEST(RtpPacketTest, RebuildKeepsPaddingContent) {
    BinaryBuffer bytes(kPacketWithCsrcsAndPadding, kPacketWithCsrcsAndPadding + sizeof(kPacketWithCsrcsAndPadding));
    bytes[bytes.size() - 3] = 0xAB;
    bytes[bytes.size() - 2] = 0xCD;
    RtpPacket packet = RtpPacket::Parse(bytes);
    EXPECT_EQ(3u, packet.padding_size());
    EXPECT_THAT(packet.padding(), ElementsAre(0xAB, 0xCD, 0x03));
    EXPECT_THAT(packet.Build(), ElementsAreArray(bytes));
    EXPECT_NE(RtpPacket::Parse(kPacketWithCsrcsAndPadding), packet);
}

MY_TEST(RtpPacketTest, RebuildKeepsExtensionPadding) {
    const uint8_t kPacket[] = {0x90, 0x60, 0x00, 0x01,
                               0x00, 0x00, 0x00, 0x02,
                               0x11, 0x22, 0x33, 0x44,
                               0xBE, 0xDE, 0x00, 0x02,
                               0x10, 0xAA, 0x00, 0x00,
                               0x20, 0xBB, 0x00, 0x00,
                               0x01, 0x02};
    RtpPacket packet = RtpPacket::Parse(kPacket);
    ASSERT_TRUE(packet.has_extension());
    EXPECT_THAT(packet.extensions()->Find(1), ElementsAre(0xAA));
    EXPECT_THAT(packet.extensions()->Find(2), ElementsAre(0xBB));
    EXPECT_EQ(24u, packet.header_size());
    EXPECT_THAT(packet.payload(), ElementsAre(0x01, 0x02));
    EXPECT_THAT(packet.Build(), ElementsAreArray(kPacket));

    // Changing an element packs the block anew.
    EXPECT_TRUE(packet.mutable_extensions().Set(3, BinaryBuffer{0xCC}));
    BinaryBuffer rebuilt = packet.Build();
    EXPECT_THAT(BinaryBuffer(rebuilt.begin() + 12, rebuilt.begin() + 24), 
                ElementsAre(0xBE, 0xDE, 0x00, 0x02, 
                            0x10, 0xAA, 0x20, 0xBB, 
                            0x30, 0xCC, 0x00, 0x00));
    EXPECT_EQ(packet, RtpPacket::Parse(rebuilt));
}

MY_TEST(RtpPacketTest, BuildAndParseBack) {
    RtpPacket packet;
    packet.set_marker(true);
    EXPECT_TRUE(packet.set_payload_type(96));
    packet.set_sequence_number(0xFFFF);
    packet.set_timestamp(0x12345678);
    packet.set_ssrc(0xCAFEBABE);
    EXPECT_TRUE(packet.set_csrcs({1, 2, 3}));
    EXPECT_TRUE(packet.SetExtension<TransportSequenceNumber>(kTransportSequenceNumberId, uint16_t(0x1234)));
    EXPECT_TRUE(packet.SetExtension<AudioLevel>(kAudioLevelId, true, uint8_t(30)));
    const uint8_t kPayload[] = {0x01, 0x02, 0x03, 0x04, 0x05};
    packet.SetPayload(kPayload);
    packet.set_padding_size(7);

    // 12 + 3 CSRCs + 4 preamble + 3 + 2 elements + 3 pad
    EXPECT_EQ(36u, packet.header_size());
    EXPECT_EQ(36u + 5 + 7, packet.size());

    BinaryBuffer bytes = packet.Build();
    ASSERT_EQ(packet.size(), bytes.size());
    EXPECT_EQ(0xB3, bytes[0]);
    EXPECT_EQ(0xE0, bytes[1]);
    EXPECT_EQ(7, bytes.back());

    RtpPacket parsed = RtpPacket::Parse(bytes);
    EXPECT_EQ(packet, parsed);
    auto transport_sequence_number = parsed.GetExtension<TransportSequenceNumber>(kTransportSequenceNumberId);
    ASSERT_TRUE(transport_sequence_number.has_value());
    EXPECT_EQ(0x1234, transport_sequence_number->transport_sequence_number());
    auto audio_level = parsed.GetExtension<AudioLevel>(kAudioLevelId);
    ASSERT_TRUE(audio_level.has_value());
    EXPECT_TRUE(audio_level->voice_activity());
    EXPECT_EQ(30, audio_level->audio_level());
}

MY_TEST(RtpPacketTest, RejectInvalidFields) {
    RtpPacket packet;
    EXPECT_FALSE(packet.set_payload_type(128));
    EXPECT_EQ(0, packet.payload_type());
    EXPECT_FALSE(packet.set_csrcs(std::vector<uint32_t>(16, 1)));
    EXPECT_TRUE(packet.csrcs().empty());
    EXPECT_FALSE(packet.SetExtension<AudioLevel>(kAudioLevelId, false, uint8_t(128)));
    EXPECT_FALSE(packet.set_extension_profile_preference(ExtensionProfile::OPAQUE));
}

MY_TEST(RtpPacketTest, PreferredProfileForNewExtensions) {
    RtpPacket packet;
    EXPECT_TRUE(packet.set_extension_profile_preference(ExtensionProfile::TWO_BYTE));
    EXPECT_TRUE(packet.SetExtension<TransportSequenceNumber>(1, uint16_t(1)));
    ASSERT_TRUE(packet.extensions().has_value());
    EXPECT_EQ(kTwoByteExtensionProfileId, packet.extensions()->profile_id());

    BinaryBuffer bytes = packet.Build();
    ASSERT_EQ(20u, bytes.size());
    EXPECT_THAT(BinaryBuffer(bytes.begin() + 12, bytes.end()), 
                ElementsAre(0x10, 0x00, 0x00, 0x01, 0x01, 0x02, 0x00, 0x01));
}

MY_TEST(RtpPacketTest, OpaqueExtensionIsKept) {
    const uint8_t kPacket[] = {
        0x90, 0x00, 0x00, 0x01,
        0x00, 0x00, 0x00, 0x02,
        0x00, 0x00, 0x00, 0x03,
        0x12, 0x34, 0x00, 0x01,
        0xAA, 0xBB, 0xCC, 0xDD,
        0xFE};
    RtpPacket packet = RtpPacket::Parse(kPacket, sizeof(kPacket));
    ASSERT_TRUE(packet.has_extension());
    EXPECT_TRUE(packet.extensions()->is_opaque());
    EXPECT_EQ(0x1234u, packet.extensions()->profile_id());
    EXPECT_THAT(packet.payload(), ElementsAre(0xFE));
    EXPECT_THAT(packet.Build(), ElementsAreArray(kPacket));
}

MY_TEST(RtpPacketTest, ParseTooShort) {
    try {
        RtpPacket::Parse(kPacketWithAudioLevel, 11);
        FAIL() << "Parsed a truncated fixed header";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::OUT_OF_BOUNDS, e.kind());
        EXPECT_THAT(std::string(e.what()), HasSubstr("rtp packet"));
    }
}

MY_TEST(RtpPacketTest, ParseInvalidVersion) {
    BinaryBuffer bytes(kPacketWithAudioLevel, kPacketWithAudioLevel + sizeof(kPacketWithAudioLevel));
    bytes[0] = 0x50;
    try {
        RtpPacket::Parse(bytes);
        FAIL() << "Parsed version 1";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

MY_TEST(RtpPacketTest, ParseCsrcsBeyondThePacket) {
    const uint8_t kPacket[] = {
        0x82, 0x00, 0x00, 0x01,
        0x00, 0x00, 0x00, 0x02,
        0x00, 0x00, 0x00, 0x03,
        0x00, 0x00, 0x00, 0x04};
    try {
        RtpPacket::Parse(kPacket, sizeof(kPacket));
        FAIL() << "Parsed 2 CSRCs out of 4 bytes";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
}

MY_TEST(RtpPacketTest, ParseInvalidPadding) {
    BinaryBuffer bytes(kPacketWithCsrcsAndPadding, kPacketWithCsrcsAndPadding + sizeof(kPacketWithCsrcsAndPadding));
    bytes.back() = 0;
    EXPECT_THROW(RtpPacket::Parse(bytes), CodecError);
    // More padding than the payload after the header.
    bytes.back() = 7;
    EXPECT_THROW(RtpPacket::Parse(bytes), CodecError);
}

MY_TEST(RtpPacketTest, ClearExtensions) {
    RtpPacket packet = RtpPacket::Parse(kPacketWithAudioLevel, sizeof(kPacketWithAudioLevel));
    packet.ClearExtensions();
    EXPECT_FALSE(packet.has_extension());
    EXPECT_EQ(kFixedHeaderSize, packet.header_size());
    BinaryBuffer bytes = packet.Build();
    ASSERT_EQ(kFixedHeaderSize, bytes.size());
    EXPECT_EQ(0x80, bytes[0]);
}

} // namespace test
} // namespace rtp
} // namespace rtpcodec
