#ifndef _RTPCODEC_RTCP_PACKET_SYNC_H_
#define _RTPCODEC_RTCP_PACKET_SYNC_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/memory/bit_writer.hpp"
#include "rtpcodec/rtcp/common_header.hpp"

#include <optional>

namespace rtpcodec {
namespace rtcp {

// Header fields fixed by the kind of packet, known before its body.
struct RTPCODEC_CPP_EXPORT HeaderTemplate {
    uint8_t packet_type = 0;
    // Set for feedback messages, the FMT takes the place of the item count.
    // A generic packet sets it to whatever its RC/FMT field held.
    std::optional<uint8_t> feedback_message_type;
};

// A packet body as serialized, header excluded.
struct RTPCODEC_CPP_EXPORT SerializedBody {
    BinaryBuffer bytes;
    // Items counted by the RC/SC field, ignored for feedback messages.
    size_t item_count = 0;
    // Signaled padding following the body, its last byte holds its size.
    BinaryBuffer padding;
};

// The signaled padding (P bit) of an RTCP packet. A parsed packet keeps
// the padding bytes as found on the wire and packs them back unchanged.
class RTPCODEC_CPP_EXPORT PacketPadding {
public:
    PacketPadding();
    PacketPadding(const PacketPadding&);
    PacketPadding(PacketPadding&&);
    PacketPadding& operator=(const PacketPadding&);
    PacketPadding& operator=(PacketPadding&&);
    ~PacketPadding();

    uint8_t padding_size() const { return static_cast<uint8_t>(padding_.size()); }
    const BinaryBuffer& padding() const { return padding_; }

    // Zeros ending with `padding_size`, 0 removes the padding. The body
    // and the padding together have to fill whole words.
    void set_padding_size(uint8_t padding_size);
    // Throws CodecError(MALFORMED_HEADER) unless the last byte of
    // `padding` holds its size.
    void set_padding(BinaryBuffer padding);

protected:
    bool PaddingEquals(const PacketPadding& other) const { return padding_ == other.padding_; }

private:
    BinaryBuffer padding_;
};

// Computes the dynamic header fields (count, length, padding flag)
// from a finished body. Throws CodecError(MALFORMED_HEADER) when the
// body and its padding do not fill whole words, the count does not fit
// 5 bits or the padding does not end with its size, and
// CodecError(OUT_OF_BOUNDS) when the packet is too long for the length
// field.
RTPCODEC_CPP_EXPORT CommonHeader Finalize(const HeaderTemplate& partial, const SerializedBody& body);

// Serializes `packet` with its synchronized header into `writer`.
// `Packet` provides header_template() and Serialize().
template <typename Packet>
void PackPacket(const Packet& packet, BitWriter& writer) {
    const SerializedBody body = packet.Serialize();
    const CommonHeader header = Finalize(packet.header_template(), body);
    header.PackInto(writer);
    writer.WriteBytes(body.bytes);
    writer.WriteBytes(body.padding);
}

template <typename Packet>
BinaryBuffer BuildPacket(const Packet& packet) {
    BitWriter writer;
    PackPacket(packet, writer);
    return writer.Release();
}

} // namespace rtcp
} // namespace rtpcodec

#endif
