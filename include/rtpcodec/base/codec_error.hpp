#ifndef _RTPCODEC_BASE_CODEC_ERROR_H_
#define _RTPCODEC_BASE_CODEC_ERROR_H_

#include "rtpcodec/base/defines.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

namespace rtpcodec {

enum class ErrorKind {
    // A read or seek crossed the buffer limits, or a fixed-capacity
    // output ran out of room.
    OUT_OF_BOUNDS,
    // A header invariant does not hold (version, counts, length field, padding).
    MALFORMED_HEADER,
    // Bytes left over after a packet body that are not valid padding.
    TRAILING_DATA,
    // Extension block with an unknown profile. Never raised by parsing,
    // the block is kept opaque instead.
    UNSUPPORTED_EXTENSION_PROFILE,
    // The demuxer can not tell RTP from RTCP.
    AMBIGUOUS_PACKET_TYPE
};

RTPCODEC_CPP_EXPORT const char* ToString(ErrorKind kind);
RTPCODEC_CPP_EXPORT std::ostream& operator<<(std::ostream& out, ErrorKind kind);

class RTPCODEC_CPP_EXPORT CodecError : public std::runtime_error {
public:
    CodecError(ErrorKind kind, const std::string& message);
    ~CodecError() override;

    ErrorKind kind() const { return kind_; }

    // Returns a copy with `context` prepended to the message,
    // e.g. "sub packet 2: rtcp rr: report block 0: ...".
    CodecError WithContext(const std::string& context) const;

private:
    ErrorKind kind_;
};

} // namespace rtpcodec

#endif
