#ifndef _RTPCODEC_RTP_RTP_DEFINES_H_
#define _RTPCODEC_RTP_RTP_DEFINES_H_

#include "rtpcodec/base/defines.hpp"

namespace rtpcodec {
namespace rtp {

constexpr uint8_t kRtpVersion = 2;
constexpr size_t kFixedHeaderSize = 12;
constexpr size_t kMaxCsrcs = 15;
constexpr uint8_t kMaxPayloadType = 0x7F;

// RFC 8285
constexpr uint16_t kOneByteExtensionProfileId = 0xBEDE;
constexpr uint16_t kTwoByteExtensionProfileId = 0x1000;
// The low 4 bits of a two-byte profile are "appbits".
constexpr uint16_t kTwoByteExtensionProfileMask = 0xFFF0;
constexpr size_t kExtensionPreambleSize = 4;

constexpr uint8_t kOneByteExtensionMinId = 1;
constexpr uint8_t kOneByteExtensionMaxId = 14;
// Id 15 terminates the one-byte element list.
constexpr uint8_t kOneByteExtensionTerminatorId = 15;
constexpr size_t kOneByteExtensionMaxValueSize = 16;
constexpr uint8_t kTwoByteExtensionMaxId = 255;
constexpr size_t kTwoByteExtensionMaxValueSize = 255;

enum class ExtensionProfile {
    // Decided when packing: one-byte if every element fits, two-byte otherwise.
    AUTO,
    ONE_BYTE,
    TWO_BYTE,
    // Unknown profile, kept as raw block bytes.
    OPAQUE
};

} // namespace rtp
} // namespace rtpcodec

#endif
