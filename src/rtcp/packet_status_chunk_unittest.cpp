#include "rtpcodec/rtcp/packet_status_chunk.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;

namespace rtpcodec {
namespace rtcp {
namespace test {
namespace {

constexpr PacketStatus kNotReceived = PacketStatus::NOT_RECEIVED;
constexpr PacketStatus kSmall = PacketStatus::RECEIVED_SMALL_DELTA;
constexpr PacketStatus kLarge = PacketStatus::RECEIVED_LARGE_DELTA;

std::vector<uint16_t> RawChunks(const std::vector<PacketStatus>& statuses) {
    std::vector<uint16_t> raw_chunks;
    for (const auto& chunk : StatusEncoder::Encode(statuses)) {
        raw_chunks.push_back(chunk.raw());
    }
    return raw_chunks;
}

std::vector<PacketStatus> Decode(const std::vector<uint16_t>& raw_chunks, size_t status_count) {
    std::vector<PacketStatus> statuses;
    for (uint16_t raw : raw_chunks) {
        PacketStatusChunk::Decode(raw).AppendTo(&statuses, status_count - statuses.size());
    }
    return statuses;
}

} // namespace

MY_TEST(PacketStatusChunkTest, RunLength) {
    PacketStatusChunk chunk = PacketStatusChunk::RunLength(kSmall, 3);
    EXPECT_EQ(PacketStatusChunk::Type::RUN_LENGTH, chunk.type());
    EXPECT_EQ(0x2003, chunk.raw());
    EXPECT_EQ(3u, chunk.symbol_count());
    EXPECT_EQ(0x5FFF, PacketStatusChunk::RunLength(kLarge, PacketStatusChunk::kMaxRunLength).raw());
    EXPECT_THROW(PacketStatusChunk::RunLength(kSmall, PacketStatusChunk::kMaxRunLength + 1), CodecError);
}

MY_TEST(PacketStatusChunkTest, OneBitVector) {
    const PacketStatus kStatuses[] = {kSmall, kNotReceived, kSmall};
    PacketStatusChunk chunk = PacketStatusChunk::OneBitVector(kStatuses, 3);
    EXPECT_EQ(PacketStatusChunk::Type::ONE_BIT_VECTOR, chunk.type());
    EXPECT_EQ(0xA800, chunk.raw());
    EXPECT_EQ(PacketStatusChunk::kOneBitCapacity, chunk.symbol_count());

    const PacketStatus kWithLarge[] = {kSmall, kLarge};
    EXPECT_THROW(PacketStatusChunk::OneBitVector(kWithLarge, 2), CodecError);
}

MY_TEST(PacketStatusChunkTest, TwoBitVector) {
    const PacketStatus kStatuses[] = {kLarge, kSmall, kNotReceived};
    PacketStatusChunk chunk = PacketStatusChunk::TwoBitVector(kStatuses, 3);
    EXPECT_EQ(PacketStatusChunk::Type::TWO_BIT_VECTOR, chunk.type());
    EXPECT_EQ(0xE400, chunk.raw());
    EXPECT_EQ(PacketStatusChunk::kTwoBitCapacity, chunk.symbol_count());

    const PacketStatus kTooMany[8] = {};
    EXPECT_THROW(PacketStatusChunk::TwoBitVector(kTooMany, 8), CodecError);
}

MY_TEST(PacketStatusChunkTest, AppendStopsAtTheStatusCount) {
    std::vector<PacketStatus> statuses;
    PacketStatusChunk::Decode(0xAAAA).AppendTo(&statuses, 3);
    EXPECT_THAT(statuses, ElementsAre(kSmall, kNotReceived, kSmall));
    PacketStatusChunk::Decode(0x4005).AppendTo(&statuses, 2);
    EXPECT_THAT(statuses, ElementsAre(kSmall, kNotReceived, kSmall, kLarge, kLarge));
}

MY_TEST(StatusEncoderTest, EmptyStatuses) {
    EXPECT_TRUE(StatusEncoder::Encode({}).empty());
}

MY_TEST(StatusEncoderTest, SameStatusesUseARunLength) {
    EXPECT_THAT(RawChunks({kSmall, kSmall, kSmall}), ElementsAre(0x2003));

    std::vector<PacketStatus> statuses(PacketStatusChunk::kMaxRunLength + 1, kSmall);
    EXPECT_THAT(RawChunks(statuses), ElementsAre(0x3FFF, 0x2001));
}

MY_TEST(StatusEncoderTest, SmallDeltasUseAOneBitVector) {
    std::vector<PacketStatus> statuses;
    for (int i = 0; i < 7; ++i) {
        statuses.push_back(kSmall);
        statuses.push_back(kNotReceived);
    }
    EXPECT_THAT(RawChunks(statuses), ElementsAre(0xAAAA));

    statuses.push_back(kSmall);
    EXPECT_THAT(RawChunks(statuses), ElementsAre(0xAAAA, 0x2001));
    EXPECT_EQ(statuses, Decode(RawChunks(statuses), statuses.size()));
}

MY_TEST(StatusEncoderTest, LargeDeltasUseATwoBitVector) {
    std::vector<PacketStatus> statuses = {kLarge, kSmall, kSmall, kSmall, kSmall, kSmall, kSmall, kSmall};
    EXPECT_THAT(RawChunks(statuses), ElementsAre(0xE555, 0x2001));
    EXPECT_EQ(statuses, Decode(RawChunks(statuses), statuses.size()));
}

MY_TEST(StatusEncoderTest, MixedStatuses) {
    std::vector<PacketStatus> statuses;
    for (int i = 0; i < 20; ++i) {
        statuses.push_back(kSmall);
    }
    statuses.push_back(kLarge);
    statuses.push_back(kNotReceived);
    for (int i = 0; i < 10; ++i) {
        statuses.push_back(i % 3 == 0 ? kSmall : kNotReceived);
    }
    EXPECT_EQ(statuses, Decode(RawChunks(statuses), statuses.size()));
}

MY_TEST(StatusEncoderTest, CanAdd) {
    StatusEncoder encoder;
    EXPECT_TRUE(encoder.Empty());
    for (size_t i = 0; i < PacketStatusChunk::kTwoBitCapacity; ++i) {
        ASSERT_TRUE(encoder.CanAdd(i % 2 == 0 ? kSmall : kNotReceived));
        encoder.Add(i % 2 == 0 ? kSmall : kNotReceived);
    }
    EXPECT_FALSE(encoder.Empty());
    EXPECT_FALSE(encoder.CanAdd(kLarge));
    EXPECT_TRUE(encoder.CanAdd(kSmall));
    encoder.Clear();
    EXPECT_TRUE(encoder.Empty());
    EXPECT_TRUE(encoder.CanAdd(kLarge));
}

} // namespace test
} // namespace rtcp
} // namespace rtpcodec
