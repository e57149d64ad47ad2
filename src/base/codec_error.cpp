#include "rtpcodec/base/codec_error.hpp"

namespace rtpcodec {

const char* ToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::OUT_OF_BOUNDS:
        return "OutOfBounds";
    case ErrorKind::MALFORMED_HEADER:
        return "MalformedHeader";
    case ErrorKind::TRAILING_DATA:
        return "TrailingData";
    case ErrorKind::UNSUPPORTED_EXTENSION_PROFILE:
        return "UnsupportedExtensionProfile";
    case ErrorKind::AMBIGUOUS_PACKET_TYPE:
        return "AmbiguousPacketType";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, ErrorKind kind) {
    return out << ToString(kind);
}

CodecError::CodecError(ErrorKind kind, const std::string& message) 
    : std::runtime_error(message),
      kind_(kind) {}

CodecError::~CodecError() = default;

CodecError CodecError::WithContext(const std::string& context) const {
    return CodecError(kind_, context + ": " + what());
}

} // namespace rtpcodec
