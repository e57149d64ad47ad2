#include "rtpcodec/rtcp/sdes.hpp"
#include "rtpcodec/rtcp/rtcp_packet.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAreArray;
using ::testing::HasSubstr;

namespace rtpcodec {
namespace rtcp {
namespace test {
namespace {

constexpr uint32_t kSenderSsrc = 0x12345678;
constexpr uint8_t kNameTag = 2;
constexpr uint8_t kEmailTag = 3;

Sdes ParseSdes(ArrayView<const uint8_t> data) {
    BitReader reader(data);
    RtcpPacket packet = ParsePacket(reader);
    EXPECT_EQ(0u, reader.RemainingByteCount());
    return std::get<Sdes>(std::move(packet));
}

} // namespace

MY_TEST(RtcpSdesTest, CreateAndParseWithoutChunks) {
    Sdes sdes;
    BinaryBuffer raw = BuildPacket(sdes);
    EXPECT_THAT(raw, ElementsAreArray({0x80, 202, 0x00, 0x00}));
    Sdes parsed = ParseSdes(raw);
    EXPECT_TRUE(parsed.chunks().empty());
}

MY_TEST(RtcpSdesTest, CreateWithOneCName) {
    const uint8_t kExpected[] = {0x81, 202,  0x00, 0x03,
                                 0x12, 0x34, 0x56, 0x78,
                                 0x01, 0x05, 'c',  'n',
                                 'a',  'm',  'e',  0x00};
    Sdes sdes;
    EXPECT_TRUE(sdes.AddCName(kSenderSsrc, "cname"));
    EXPECT_THAT(BuildPacket(sdes), ElementsAreArray(kExpected));

    Sdes parsed = ParseSdes(kExpected);
    ASSERT_EQ(1u, parsed.chunks().size());
    EXPECT_EQ(kSenderSsrc, parsed.chunks()[0].ssrc);
    EXPECT_EQ("cname", parsed.chunks()[0].cname());
    EXPECT_EQ(sdes, parsed);
}

MY_TEST(RtcpSdesTest, CreateWithEmptyCName) {
    const uint8_t kExpected[] = {0x81, 202,  0x00, 0x02,
                                 0x12, 0x34, 0x56, 0x78,
                                 0x01, 0x00, 0x00, 0x00};
    Sdes sdes;
    EXPECT_TRUE(sdes.AddCName(kSenderSsrc, ""));
    EXPECT_THAT(BuildPacket(sdes), ElementsAreArray(kExpected));

    Sdes parsed = ParseSdes(kExpected);
    ASSERT_EQ(1u, parsed.chunks().size());
    EXPECT_EQ("", parsed.chunks()[0].cname());
}

MY_TEST(RtcpSdesTest, ChunkWithoutItems) {
    Sdes::Chunk chunk;
    chunk.ssrc = kSenderSsrc;
    Sdes sdes;
    EXPECT_TRUE(sdes.AddChunk(chunk));
    const uint8_t kExpected[] = {0x81, 202,  0x00, 0x02,
                                 0x12, 0x34, 0x56, 0x78,
                                 0x00, 0x00, 0x00, 0x00};
    EXPECT_THAT(BuildPacket(sdes), ElementsAreArray(kExpected));

    Sdes parsed = ParseSdes(kExpected);
    ASSERT_EQ(1u, parsed.chunks().size());
    EXPECT_TRUE(parsed.chunks()[0].items.empty());
    EXPECT_FALSE(parsed.chunks()[0].cname().has_value());
}

MY_TEST(RtcpSdesTest, CreateAndParseWithMultipleChunks) {
    Sdes sdes;
    EXPECT_TRUE(sdes.AddCName(kSenderSsrc + 0, "a"));
    EXPECT_TRUE(sdes.AddCName(kSenderSsrc + 1, "ab"));
    EXPECT_TRUE(sdes.AddCName(kSenderSsrc + 2, "abc"));
    EXPECT_TRUE(sdes.AddCName(kSenderSsrc + 3, "abcd"));
    EXPECT_TRUE(sdes.AddCName(kSenderSsrc + 4, "abcde"));
    EXPECT_TRUE(sdes.AddCName(kSenderSsrc + 5, "abcdef"));

    BinaryBuffer raw = BuildPacket(sdes);
    EXPECT_EQ(0x86, raw[0]);
    EXPECT_EQ(0u, raw.size() % 4);
    Sdes parsed = ParseSdes(raw);
    ASSERT_EQ(6u, parsed.chunks().size());
    EXPECT_EQ(kSenderSsrc + 5, parsed.chunks()[5].ssrc);
    EXPECT_EQ("abcdef", parsed.chunks()[5].cname());
    EXPECT_EQ(sdes, parsed);
}

MY_TEST(RtcpSdesTest, OtherItemTypesAreKept) {
    const uint8_t kPacket[] = {0x81, 202,  0x00, 0x04,
                               0x12, 0x34, 0x56, 0x78,
                               kNameTag, 0x02, 'a', 'b',
                               0x01, 0x03, 'x', 'y', 
                               'z', 0x00, 0x00, 0x00};
    Sdes parsed = ParseSdes(kPacket);
    ASSERT_EQ(1u, parsed.chunks().size());
    const Sdes::Chunk& chunk = parsed.chunks()[0];
    ASSERT_EQ(2u, chunk.items.size());
    EXPECT_EQ(kNameTag, chunk.items[0].type);
    EXPECT_EQ("ab", chunk.items[0].value);
    EXPECT_EQ("xyz", chunk.cname());
    EXPECT_THAT(BuildPacket(parsed), ElementsAreArray(kPacket));
}

MY_TEST(RtcpSdesTest, RebuildKeepsChunkAndPacketPadding) {
    const uint8_t kPacket[] = {0xA1, 202,  0x00, 0x04,
                               0x12, 0x34, 0x56, 0x78,
                               0x01, 0x02, 'a',  'b',
                               0x00, 0x00, 0xFF, 0x00,
                               0x00, 0x00, 0x00, 0x04};
    Sdes sdes = ParseSdes(kPacket);
    ASSERT_EQ(1u, sdes.chunks().size());
    EXPECT_EQ("ab", sdes.chunks()[0].cname().value());
    EXPECT_EQ(4, sdes.padding_size());
    EXPECT_THAT(BuildPacket(sdes), ElementsAreArray(kPacket));

    Sdes created;
    EXPECT_TRUE(created.AddCName(kSenderSsrc, "ab"));
    created.set_padding_size(4);
    EXPECT_NE(created, sdes);
}

MY_TEST(RtcpSdesTest, ItemOverrunsThePacket) {
    const uint8_t kPacket[] = {0x81, 202,  0x00, 0x02,
                               0x12, 0x34, 0x56, 0x78,
                               0x01, 0x0A, 'a', 0x00};
    BitReader reader(kPacket, sizeof(kPacket));
    try {
        ParsePacket(reader);
        FAIL() << "Parsed an item longer than the packet";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
        EXPECT_THAT(std::string(e.what()), HasSubstr("rtcp sdes: chunk 0"));
    }
}

MY_TEST(RtcpSdesTest, MissingTerminator) {
    const uint8_t kPacket[] = {0x81, 202,  0x00, 0x02,
                               0x12, 0x34, 0x56, 0x78,
                               0x01, 0x02, 'a', 'b'};
    BitReader reader(kPacket, sizeof(kPacket));
    EXPECT_THROW(ParsePacket(reader), CodecError);
}

MY_TEST(RtcpSdesTest, FewerChunksThanCounted) {
    const uint8_t kPacket[] = {0x82, 202,  0x00, 0x02,
                               0x12, 0x34, 0x56, 0x78,
                               0x00, 0x00, 0x00, 0x00};
    BitReader reader(kPacket, sizeof(kPacket));
    try {
        ParsePacket(reader);
        FAIL() << "Parsed 2 chunks out of 1";
    } catch (const CodecError& e) {
        EXPECT_THAT(std::string(e.what()), HasSubstr("chunk 1"));
    }
}

MY_TEST(RtcpSdesTest, RejectInvalidChunks) {
    Sdes sdes;
    EXPECT_FALSE(sdes.AddCName(kSenderSsrc, std::string(Sdes::kMaxItemLength + 1, 'a')));
    EXPECT_TRUE(sdes.AddCName(kSenderSsrc, std::string(Sdes::kMaxItemLength, 'a')));

    Sdes::Chunk chunk;
    chunk.ssrc = kSenderSsrc;
    chunk.items.push_back(Sdes::Item{Sdes::kTerminatorTag, "end"});
    EXPECT_FALSE(sdes.AddChunk(chunk));
    chunk.items[0].type = kEmailTag;
    EXPECT_TRUE(sdes.AddChunk(chunk));
    EXPECT_EQ(2u, sdes.chunks().size());
}

MY_TEST(RtcpSdesTest, MaxChunks) {
    Sdes sdes;
    for (size_t i = 0; i < Sdes::kMaxNumberOfChunks; ++i) {
        EXPECT_TRUE(sdes.AddCName(static_cast<uint32_t>(i), "cname"));
    }
    EXPECT_FALSE(sdes.AddCName(kSenderSsrc, "cname"));
    BinaryBuffer raw = BuildPacket(sdes);
    EXPECT_EQ(0x9F, raw[0]);
    EXPECT_EQ(sdes, ParseSdes(raw));
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
