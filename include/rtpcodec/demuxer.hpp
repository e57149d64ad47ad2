#ifndef _RTPCODEC_DEMUXER_H_
#define _RTPCODEC_DEMUXER_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/common/array_view.hpp"
#include "rtpcodec/rtcp/compound_packet.hpp"
#include "rtpcodec/rtp/rtp_packet.hpp"

#include <ostream>
#include <variant>

namespace rtpcodec {

struct RTPCODEC_CPP_EXPORT DemuxerConfig {
    // Inclusive range of second byte values taken as an RTCP packet type (RFC 5761 section 4).
    uint8_t rtcp_packet_type_min = 192;
    uint8_t rtcp_packet_type_max = 223;
    // Rejects RTCP-looking datagrams that do not carry version 2.
    bool strict = false;
};

enum class PacketKind {
    RTP,
    RTCP
};

RTPCODEC_CPP_EXPORT std::ostream& operator<<(std::ostream& out, PacketKind kind);

// Tells RTP from RTCP on a multiplexed transport.
class RTPCODEC_CPP_EXPORT Demuxer {
public:
    using Demuxed = std::variant<rtp::RtpPacket, rtcp::CompoundPacket>;

    Demuxer();
    explicit Demuxer(DemuxerConfig config);
    ~Demuxer();

    const DemuxerConfig& config() const { return config_; }

    // Throws CodecError(AMBIGUOUS_PACKET_TYPE) for datagrams shorter than
    // 4 bytes and, in strict mode, for RTCP packet types without version 2.
    PacketKind Classify(ArrayView<const uint8_t> datagram) const;
    // Classifies and parses the datagram.
    Demuxed Demux(ArrayView<const uint8_t> datagram) const;

private:
    const DemuxerConfig config_;
};

} // namespace rtpcodec

#endif
