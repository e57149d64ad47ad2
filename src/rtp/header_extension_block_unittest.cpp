#include "rtpcodec/rtp/header_extension_block.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

namespace rtpcodec {
namespace rtp {
namespace test {
namespace {

BinaryBuffer Pack(const HeaderExtensionBlock& block) {
    BitWriter writer;
    block.PackInto(writer);
    return writer.Release();
}

HeaderExtensionBlock ParseBlock(ArrayView<const uint8_t> data) {
    BitReader reader(data);
    HeaderExtensionBlock block;
    block.Parse(reader);
    EXPECT_EQ(0u, reader.RemainingByteCount());
    return block;
}

} // namespace

MY_TEST(HeaderExtensionBlockTest, ParseOneByteElements) {
    const uint8_t kBlock[] = {0xBE, 0xDE, 0x00, 0x03,
                              0x10, 0xAA, 0x21, 0xBB,
                              0xCC, 0x00, 0x00, 0x33,
                              0xDD, 0xDD, 0xDD, 0xDD};
    HeaderExtensionBlock block = ParseBlock(kBlock);
    EXPECT_EQ(ExtensionProfile::ONE_BYTE, block.profile());
    EXPECT_EQ(kOneByteExtensionProfileId, block.profile_id());
    ASSERT_EQ(3u, block.extensions().size());
    EXPECT_THAT(block.Find(1), ElementsAre(0xAA));
    EXPECT_THAT(block.Find(2), ElementsAre(0xBB, 0xCC));
    EXPECT_THAT(block.Find(3), ElementsAre(0xDD, 0xDD, 0xDD, 0xDD));
    EXPECT_TRUE(block.Find(4).empty());
    EXPECT_FALSE(block.Has(4));
    EXPECT_EQ(sizeof(kBlock), block.PackedSize());
    EXPECT_THAT(Pack(block), ElementsAreArray(kBlock));
}

MY_TEST(HeaderExtensionBlockTest, OneByteTerminatorStopsParsing) {
    const uint8_t kBlock[] = {0xBE, 0xDE, 0x00, 0x02,
                              0x10, 0xAA, 0xF0, 0x22,
                              0x33, 0x44, 0x55, 0x66};
    HeaderExtensionBlock block = ParseBlock(kBlock);
    ASSERT_EQ(1u, block.extensions().size());
    EXPECT_THAT(block.Find(1), ElementsAre(0xAA));
    EXPECT_THAT(Pack(block), ElementsAreArray(kBlock));
}

MY_TEST(HeaderExtensionBlockTest, PaddingBetweenElementsIsKeptUntilChanged) {
    const uint8_t kBlock[] = {0xBE, 0xDE, 0x00, 0x02,
                              0x10, 0xAA, 0x00, 0x00,
                              0x20, 0xBB, 0x00, 0x00};
    HeaderExtensionBlock block = ParseBlock(kBlock);
    ASSERT_EQ(2u, block.extensions().size());
    EXPECT_EQ(sizeof(kBlock), block.PackedSize());
    EXPECT_THAT(Pack(block), ElementsAreArray(kBlock));

    HeaderExtensionBlock packed_tight(ExtensionProfile::ONE_BYTE);
    packed_tight.Set(1, BinaryBuffer{0xAA});
    packed_tight.Set(2, BinaryBuffer{0xBB});
    EXPECT_NE(packed_tight, block);

    EXPECT_TRUE(block.Set(2, BinaryBuffer{0xBB}));
    EXPECT_EQ(packed_tight, block);
    EXPECT_EQ(8u, block.PackedSize());
    EXPECT_THAT(Pack(block), ElementsAre(0xBE, 0xDE, 0x00, 0x01, 0x10, 0xAA, 0x20, 0xBB));
}

MY_TEST(HeaderExtensionBlockTest, OversizedLengthIsKeptUntilChanged) {
    const uint8_t kBlock[] = {0x10, 0x00, 0x00, 0x02,
                              0x01, 0x01, 0x42, 0x00,
                              0x00, 0x00, 0x00, 0x00};
    HeaderExtensionBlock block = ParseBlock(kBlock);
    ASSERT_EQ(1u, block.extensions().size());
    EXPECT_THAT(Pack(block), ElementsAreArray(kBlock));

    EXPECT_FALSE(block.Remove(2));
    EXPECT_THAT(Pack(block), ElementsAreArray(kBlock));
    EXPECT_TRUE(block.Remove(1));
    EXPECT_THAT(Pack(block), ElementsAre(0x10, 0x00, 0x00, 0x00));
}

MY_TEST(HeaderExtensionBlockTest, ParseTwoByteElements) {
    const uint8_t kBlock[] = {0x10, 0x00, 0x00, 0x03,
                              0x07, 0x04, 0xDE, 0xAD,
                              0xBE, 0xEF, 0x04, 0x01,
                              0x42, 0x00, 0x00, 0x00};
    HeaderExtensionBlock block = ParseBlock(kBlock);
    EXPECT_EQ(ExtensionProfile::TWO_BYTE, block.profile());
    ASSERT_EQ(2u, block.extensions().size());
    EXPECT_THAT(block.Find(7), ElementsAre(0xDE, 0xAD, 0xBE, 0xEF));
    EXPECT_THAT(block.Find(4), ElementsAre(0x42));
    EXPECT_EQ(sizeof(kBlock), block.PackedSize());
    EXPECT_THAT(Pack(block), ElementsAreArray(kBlock));
}

MY_TEST(HeaderExtensionBlockTest, TwoByteAppBitsArePreserved) {
    const uint8_t kBlock[] = {0x10, 0x05, 0x00, 0x01,
                              0x01, 0x00, 0x00, 0x00};
    HeaderExtensionBlock block = ParseBlock(kBlock);
    EXPECT_EQ(0x1005u, block.profile_id());
    ASSERT_EQ(1u, block.extensions().size());
    EXPECT_TRUE(block.Has(1));
    EXPECT_TRUE(block.Find(1).empty());
    EXPECT_THAT(Pack(block), ElementsAreArray(kBlock));
}

MY_TEST(HeaderExtensionBlockTest, UnknownProfileIsKeptOpaque) {
    const uint8_t kBlock[] = {0xAB, 0xCD, 0x00, 0x01,
                              0x01, 0x02, 0x03, 0x04};
    HeaderExtensionBlock block = ParseBlock(kBlock);
    EXPECT_TRUE(block.is_opaque());
    EXPECT_EQ(0xABCDu, block.profile_id());
    EXPECT_THAT(block.opaque_data(), ElementsAre(0x01, 0x02, 0x03, 0x04));
    EXPECT_TRUE(block.extensions().empty());
    EXPECT_FALSE(block.Set(1, BinaryBuffer{0x01}));
    EXPECT_THAT(Pack(block), ElementsAreArray(kBlock));
}

MY_TEST(HeaderExtensionBlockTest, OpaqueDataIsPaddedToAWord) {
    HeaderExtensionBlock block = HeaderExtensionBlock::Opaque(0x0001, {0x0A, 0x0B});
    EXPECT_EQ(8u, block.PackedSize());
    EXPECT_THAT(Pack(block), ElementsAre(0x00, 0x01, 0x00, 0x01, 0x0A, 0x0B, 0x00, 0x00));
}

MY_TEST(HeaderExtensionBlockTest, LengthBeyondThePacket) {
    const uint8_t kBlock[] = {0xBE, 0xDE, 0x00, 0x02,
                              0x10, 0xAA, 0x00, 0x00};
    BitReader reader(kBlock, sizeof(kBlock));
    HeaderExtensionBlock block;
    try {
        block.Parse(reader);
        FAIL() << "Extension block longer than the packet";
    } catch (const CodecError& e) {
        EXPECT_EQ(ErrorKind::MALFORMED_HEADER, e.kind());
    }
    EXPECT_TRUE(block.empty());
}

MY_TEST(HeaderExtensionBlockTest, ElementOverrunsTheBlock) {
    const uint8_t kOneByte[] = {0xBE, 0xDE, 0x00, 0x01,
                                0x00, 0x00, 0x13, 0xAA};
    BitReader one_byte_reader(kOneByte, sizeof(kOneByte));
    HeaderExtensionBlock block;
    EXPECT_THROW(block.Parse(one_byte_reader), CodecError);

    const uint8_t kTwoByte[] = {0x10, 0x00, 0x00, 0x01,
                                0x01, 0x03, 0xAA, 0xBB};
    BitReader two_byte_reader(kTwoByte, sizeof(kTwoByte));
    EXPECT_THROW(block.Parse(two_byte_reader), CodecError);
}

MY_TEST(HeaderExtensionBlockTest, AutoProfilePacksOneByteWhenPossible) {
    HeaderExtensionBlock block;
    EXPECT_TRUE(block.Set(1, BinaryBuffer{0xFF}));
    EXPECT_TRUE(block.Set(14, BinaryBuffer{0x01, 0x02}));
    EXPECT_EQ(kOneByteExtensionProfileId, block.profile_id());
    EXPECT_THAT(Pack(block), ElementsAre(0xBE, 0xDE, 0x00, 0x02,
                                         0x10, 0xFF, 0xE1, 0x01,
                                         0x02, 0x00, 0x00, 0x00));
}

MY_TEST(HeaderExtensionBlockTest, AutoProfilePacksTwoByteForLargeIds) {
    HeaderExtensionBlock block;
    EXPECT_TRUE(block.Set(1, BinaryBuffer{0xFF}));
    EXPECT_TRUE(block.Set(15, BinaryBuffer{0x01}));
    EXPECT_EQ(kTwoByteExtensionProfileId, block.profile_id());
    EXPECT_THAT(Pack(block), ElementsAre(0x10, 0x00, 0x00, 0x02,
                                         0x01, 0x01, 0xFF, 0x0F,
                                         0x01, 0x01, 0x00, 0x00));
}

MY_TEST(HeaderExtensionBlockTest, OneByteIsPromotedForEmptyValues) {
    HeaderExtensionBlock block(ExtensionProfile::ONE_BYTE);
    EXPECT_TRUE(block.Set(2, BinaryBuffer{0x01}));
    EXPECT_EQ(ExtensionProfile::ONE_BYTE, block.profile());
    EXPECT_TRUE(block.Set(3, BinaryBuffer{}));
    EXPECT_EQ(ExtensionProfile::TWO_BYTE, block.profile());
}

MY_TEST(HeaderExtensionBlockTest, SetReplacesAndRemoves) {
    HeaderExtensionBlock block;
    EXPECT_FALSE(block.Set(0, BinaryBuffer{0x01}));
    EXPECT_FALSE(block.Set(1, BinaryBuffer(256, 0x00)));
    EXPECT_TRUE(block.Set(5, BinaryBuffer{0x01}));
    EXPECT_TRUE(block.Set(5, BinaryBuffer{0x02, 0x03}));
    ASSERT_EQ(1u, block.extensions().size());
    EXPECT_THAT(block.Find(5), ElementsAre(0x02, 0x03));
    EXPECT_TRUE(block.Remove(5));
    EXPECT_FALSE(block.Remove(5));
    EXPECT_TRUE(block.empty());
    // An empty block still has its preamble.
    EXPECT_EQ(kExtensionPreambleSize, block.PackedSize());
}

} // namespace test
} // namespace rtp
} // namespace rtpcodec
