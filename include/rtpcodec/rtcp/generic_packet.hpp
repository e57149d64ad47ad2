#ifndef _RTPCODEC_RTCP_GENERIC_PACKET_H_
#define _RTPCODEC_RTCP_GENERIC_PACKET_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/common/array_view.hpp"
#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/rtcp/packet_sync.hpp"

namespace rtpcodec {
namespace rtcp {

// Any RTCP packet without a dedicated codec (APP, XR, unknown feedback
// messages...). The payload is kept raw, so the packet is sent on
// unchanged.
class RTPCODEC_CPP_EXPORT GenericPacket : public PacketPadding {
public:
    GenericPacket();
    GenericPacket(uint8_t packet_type, uint8_t count_or_format);
    GenericPacket(const GenericPacket&);
    GenericPacket(GenericPacket&&);
    GenericPacket& operator=(const GenericPacket&);
    GenericPacket& operator=(GenericPacket&&);
    ~GenericPacket();

    uint8_t packet_type() const { return packet_type_; }
    uint8_t count_or_format() const { return count_or_format_; }
    const BinaryBuffer& payload() const { return payload_; }

    void set_packet_type(uint8_t packet_type) { packet_type_ = packet_type; }
    // Rejects values over 5 bits.
    bool set_count_or_format(uint8_t count_or_format);
    // The payload has to be a whole number of words with the padding.
    void set_payload(ArrayView<const uint8_t> payload) { payload_.assign(payload.begin(), payload.end()); }

    // The type and RC/FMT are the ones of this packet rather than of a kind.
    HeaderTemplate header_template() const { return HeaderTemplate{packet_type_, count_or_format_}; }
    SerializedBody Serialize() const;
    void Parse(const CommonHeader& header, BitReader& payload);

    bool operator==(const GenericPacket& other) const;
    bool operator!=(const GenericPacket& other) const { return !(*this == other); }

private:
    uint8_t packet_type_;
    uint8_t count_or_format_;
    BinaryBuffer payload_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
