#include "rtpcodec/base/codec_error.hpp"

#include <gtest/gtest.h>

#include <sstream>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace rtpcodec {
namespace test {

MY_TEST(CodecErrorTest, KindNames) {
    EXPECT_STREQ("OutOfBounds", ToString(ErrorKind::OUT_OF_BOUNDS));
    EXPECT_STREQ("MalformedHeader", ToString(ErrorKind::MALFORMED_HEADER));
    EXPECT_STREQ("TrailingData", ToString(ErrorKind::TRAILING_DATA));
    EXPECT_STREQ("UnsupportedExtensionProfile", ToString(ErrorKind::UNSUPPORTED_EXTENSION_PROFILE));
    EXPECT_STREQ("AmbiguousPacketType", ToString(ErrorKind::AMBIGUOUS_PACKET_TYPE));

    std::ostringstream oss;
    oss << ErrorKind::TRAILING_DATA;
    EXPECT_EQ("TrailingData", oss.str());
}

MY_TEST(CodecErrorTest, ContextIsPrepended) {
    CodecError error(ErrorKind::MALFORMED_HEADER, "Invalid version 1.");
    CodecError wrapped = error.WithContext("rtcp rr").WithContext("sub packet 2");
    EXPECT_EQ(ErrorKind::MALFORMED_HEADER, wrapped.kind());
    EXPECT_STREQ("sub packet 2: rtcp rr: Invalid version 1.", wrapped.what());
    EXPECT_STREQ("Invalid version 1.", error.what());
}

MY_TEST(CodecErrorTest, CatchAsRuntimeError) {
    try {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, "Out of bounds");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ("Out of bounds", e.what());
    }
}

} // namespace test
} // namespace rtpcodec
