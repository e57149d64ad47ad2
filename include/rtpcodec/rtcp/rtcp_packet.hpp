#ifndef _RTPCODEC_RTCP_RTCP_PACKET_H_
#define _RTPCODEC_RTCP_RTCP_PACKET_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/memory/bit_reader.hpp"
#include "rtpcodec/memory/bit_writer.hpp"
#include "rtpcodec/rtcp/bye.hpp"
#include "rtpcodec/rtcp/fir.hpp"
#include "rtpcodec/rtcp/generic_packet.hpp"
#include "rtpcodec/rtcp/nack.hpp"
#include "rtpcodec/rtcp/pli.hpp"
#include "rtpcodec/rtcp/receiver_report.hpp"
#include "rtpcodec/rtcp/sdes.hpp"
#include "rtpcodec/rtcp/sender_report.hpp"
#include "rtpcodec/rtcp/transport_feedback.hpp"

#include <variant>

namespace rtpcodec {
namespace rtcp {

using RtcpPacket = std::variant<SenderReport,
                                ReceiverReport,
                                Sdes,
                                Bye,
                                Pli,
                                Fir,
                                Nack,
                                TransportFeedback,
                                GenericPacket>;

// Parses the packet at the position of `reader` and moves past it,
// padding included. Throws CodecError, prefixed with the packet kind.
RTPCODEC_CPP_EXPORT RtcpPacket ParsePacket(BitReader& reader);

// Writes `packet` with a header computed from its body.
RTPCODEC_CPP_EXPORT void PackInto(const RtcpPacket& packet, BitWriter& writer);
RTPCODEC_CPP_EXPORT BinaryBuffer Build(const RtcpPacket& packet);

RTPCODEC_CPP_EXPORT uint8_t PacketTypeOf(const RtcpPacket& packet);

} // namespace rtcp
} // namespace rtpcodec

#endif
