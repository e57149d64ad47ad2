#include "rtpcodec/rtcp/rtcp_packet.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <string>
#include <utility>

namespace rtpcodec {
namespace rtcp {
namespace {

// From RFC 3550, RTCP header format.
//   0                   1                   2                   3
//   0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |V=2|P| RC/FMT  |      PT       |             length            |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// PT: payload type, RFC3550 Section-12.1
/*
* abbrev   name                                 value
*
* SR       sender report                        200     [RFC3551]   supported
* RR       receiver report                      201     [RFC3551]   supported
* SDES     source description                   202     [RFC3551]   supported
* BYE      goodbye                              203     [RFC3551]   supported
* APP      application-defined                  204     [RFC3551]   generic
* RTPFB    Transport layer FB message           205     [RFC4585]   supported
* PSFB     Payload-specific FB message          206     [RFC4585]   supported
* XR       extended report                      207     [RFC3611]   generic
*/

/* 205       RFC 4585, RFC 5104
* FMT 1      NACK       supported
* FMT 15     TCC        supported
* others                generic
*/

/* 206       RFC 4585, RFC 5104
* FMT 1:     Picture Loss Indication (PLI)                      supported
* FMT 4:     Full Intra Request (FIR) Command                   supported
* others                                                        generic
*/

template <typename Packet>
RtcpPacket ParseAs(const CommonHeader& header, BitReader& payload) {
    Packet packet;
    packet.Parse(header, payload);
    return RtcpPacket(std::move(packet));
}

RtcpPacket ParseByType(const CommonHeader& header, BitReader& payload) {
    switch (header.type()) {
    case SenderReport::kPacketType:
        return ParseAs<SenderReport>(header, payload);
    case ReceiverReport::kPacketType:
        return ParseAs<ReceiverReport>(header, payload);
    case Sdes::kPacketType:
        return ParseAs<Sdes>(header, payload);
    case Bye::kPacketType:
        return ParseAs<Bye>(header, payload);
    case Rtpfb::kPacketType:
        switch (header.feedback_message_type()) {
        case Nack::kFeedbackMessageType:
            return ParseAs<Nack>(header, payload);
        case TransportFeedback::kFeedbackMessageType:
            return ParseAs<TransportFeedback>(header, payload);
        default:
            return ParseAs<GenericPacket>(header, payload);
        }
    case Psfb::kPacketType:
        switch (header.feedback_message_type()) {
        case Pli::kFeedbackMessageType:
            return ParseAs<Pli>(header, payload);
        case Fir::kFeedbackMessageType:
            return ParseAs<Fir>(header, payload);
        default:
            return ParseAs<GenericPacket>(header, payload);
        }
    default:
        return ParseAs<GenericPacket>(header, payload);
    }
}

std::string PacketName(const CommonHeader& header) {
    switch (header.type()) {
    case SenderReport::kPacketType:
        return "rtcp sr";
    case ReceiverReport::kPacketType:
        return "rtcp rr";
    case Sdes::kPacketType:
        return "rtcp sdes";
    case Bye::kPacketType:
        return "rtcp bye";
    case Rtpfb::kPacketType:
        if (header.feedback_message_type() == Nack::kFeedbackMessageType) {
            return "rtcp nack";
        } else if (header.feedback_message_type() == TransportFeedback::kFeedbackMessageType) {
            return "rtcp transport feedback";
        }
        break;
    case Psfb::kPacketType:
        if (header.feedback_message_type() == Pli::kFeedbackMessageType) {
            return "rtcp pli";
        } else if (header.feedback_message_type() == Fir::kFeedbackMessageType) {
            return "rtcp fir";
        }
        break;
    default:
        break;
    }
    return "rtcp type " + std::to_string(header.type());
}

} // namespace

RtcpPacket ParsePacket(BitReader& reader) {
    const CommonHeader header = CommonHeader::Parse(reader);
    BitReader payload = reader.Slice(header.payload_size());
    BitReader content = payload.Slice(header.content_size());
    try {
        RtcpPacket packet = ParseByType(header, content);
        if (content.RemainingByteCount() > 0) {
            throw CodecError(ErrorKind::TRAILING_DATA, 
                             std::to_string(content.RemainingByteCount()) + 
                             " bytes left over after the packet body.");
        }
        BinaryBuffer padding = payload.ReadBytes(header.padding_size());
        std::visit([&padding](auto& p) { p.set_padding(std::move(padding)); }, packet);
        return packet;
    } catch (const CodecError& e) {
        throw e.WithContext(PacketName(header));
    }
}

void PackInto(const RtcpPacket& packet, BitWriter& writer) {
    std::visit([&writer](const auto& p) { PackPacket(p, writer); }, packet);
}

BinaryBuffer Build(const RtcpPacket& packet) {
    BitWriter writer;
    PackInto(packet, writer);
    return writer.Release();
}

uint8_t PacketTypeOf(const RtcpPacket& packet) {
    return std::visit([](const auto& p) { return p.header_template().packet_type; }, packet);
}

} // namespace rtcp
} // namespace rtpcodec
