#include "rtpcodec/rtp/rtp_header_extensions.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace rtpcodec {
namespace rtp {
namespace test {

MY_TEST(RtpHeaderExtensionsTest, AudioLevel) {
    AudioLevel audio_level;
    EXPECT_TRUE(audio_level.muted());

    const uint8_t kValue[] = {0x1E};
    ASSERT_TRUE(audio_level.Parse(kValue));
    EXPECT_FALSE(audio_level.voice_activity());
    EXPECT_EQ(30, audio_level.audio_level());

    uint8_t packed[1] = {0};
    EXPECT_TRUE(AudioLevel(true, 5).PackInto(packed, sizeof(packed)));
    EXPECT_EQ(0x85, packed[0]);
    EXPECT_FALSE(AudioLevel(true, 5).PackInto(packed, 2));
}

MY_TEST(RtpHeaderExtensionsTest, AudioLevelOfWrongSize) {
    AudioLevel audio_level;
    const uint8_t kValue[] = {0x80, 0x00};
    EXPECT_FALSE(audio_level.Parse(kValue));
    EXPECT_FALSE(audio_level.Parse(ArrayView<const uint8_t>()));
}

MY_TEST(RtpHeaderExtensionsTest, TransportSequenceNumber) {
    TransportSequenceNumber transport_sequence_number;
    const uint8_t kValue[] = {0xAB, 0xCD};
    ASSERT_TRUE(transport_sequence_number.Parse(kValue));
    EXPECT_EQ(0xABCD, transport_sequence_number.transport_sequence_number());

    uint8_t packed[2] = {0};
    EXPECT_TRUE(TransportSequenceNumber(0x0102).PackInto(packed, sizeof(packed)));
    EXPECT_THAT(packed, ::testing::ElementsAre(0x01, 0x02));

    const uint8_t kWrongSize[] = {0x01};
    EXPECT_FALSE(transport_sequence_number.Parse(kWrongSize));
}

} // namespace test
} // namespace rtp
} // namespace rtpcodec
