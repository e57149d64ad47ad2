#ifndef _RTPCODEC_RTCP_COMMON_HEADER_H_
#define _RTPCODEC_RTCP_COMMON_HEADER_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/memory/bit_reader.hpp"
#include "rtpcodec/memory/bit_writer.hpp"

namespace rtpcodec {
namespace rtcp {

// The 4-byte header every RTCP packet starts with (RFC 3550 section 6.4).
class RTPCODEC_CPP_EXPORT CommonHeader {
public:
    static constexpr size_t kFixedHeaderSize = 4;
    static constexpr uint8_t kVersion = 2;
    static constexpr uint8_t kMaxCountOrFormat = 0x1F;
    static constexpr size_t kMaxLengthField = 0xFFFF;

    CommonHeader();
    CommonHeader(uint8_t packet_type, 
                 uint8_t count_or_format, 
                 uint16_t length_field, 
                 uint8_t padding_size);
    ~CommonHeader();

    uint8_t type() const { return packet_type_; }
    // Depending on the packet type, the 5 bits after the padding flag
    // hold a count of items or a feedback message type.
    uint8_t count() const { return count_or_format_; }
    uint8_t feedback_message_type() const { return count_or_format_; }
    bool has_padding() const { return padding_size_ > 0; }
    uint8_t padding_size() const { return padding_size_; }
    uint16_t length_field() const { return length_field_; }

    // Whole packet, header and padding included.
    size_t packet_size() const { return (static_cast<size_t>(length_field_) + 1) * 4; }
    size_t payload_size() const { return packet_size() - kFixedHeaderSize; }
    // Payload without the trailing padding.
    size_t content_size() const { return payload_size() - padding_size_; }

    // Reads the header at the position of `reader` and validates the
    // length field and the padding against the bytes that follow it.
    // Only the 4 header bytes are consumed.
    static CommonHeader Parse(BitReader& reader);

    void PackInto(BitWriter& writer) const;

private:
    uint8_t packet_type_;
    uint8_t count_or_format_;
    uint16_t length_field_;
    uint8_t padding_size_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
