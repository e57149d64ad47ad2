#include "rtpcodec/demuxer.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <plog/Log.h>

#include <string>

namespace rtpcodec {
namespace {

constexpr size_t kMinDemuxSize = 4;
constexpr uint8_t kVersion = 2;

} // namespace

std::ostream& operator<<(std::ostream& out, PacketKind kind) {
    return out << (kind == PacketKind::RTP ? "rtp" : "rtcp");
}

Demuxer::Demuxer() 
    : Demuxer(DemuxerConfig()) {}

Demuxer::Demuxer(DemuxerConfig config) 
    : config_(config) {}

Demuxer::~Demuxer() = default;

PacketKind Demuxer::Classify(ArrayView<const uint8_t> datagram) const {
    if (datagram.size() < kMinDemuxSize) {
        PLOG_WARNING << "Can not demux a datagram of " << datagram.size() << " bytes.";
        throw CodecError(ErrorKind::AMBIGUOUS_PACKET_TYPE, 
                         "Datagram of " + std::to_string(datagram.size()) + " bytes is too short to classify.");
    }
    // For RTP the second byte holds the marker and payload type, for
    // RTCP the packet type.
    const uint8_t packet_type = datagram[1];
    if (packet_type < config_.rtcp_packet_type_min || packet_type > config_.rtcp_packet_type_max) {
        PLOG_VERBOSE << "Datagram of " << datagram.size() << " bytes demuxed as RTP, second byte " << int(packet_type);
        return PacketKind::RTP;
    }
    const uint8_t version = datagram[0] >> 6;
    if (config_.strict && version != kVersion) {
        PLOG_WARNING << "RTCP packet type " << int(packet_type) << " with version " << int(version);
        throw CodecError(ErrorKind::AMBIGUOUS_PACKET_TYPE, 
                         "Packet type " + std::to_string(packet_type) + " with version " + 
                         std::to_string(version) + " is neither RTP nor RTCP.");
    }
    PLOG_VERBOSE << "Datagram of " << datagram.size() << " bytes demuxed as RTCP, packet type " << int(packet_type);
    return PacketKind::RTCP;
}

Demuxer::Demuxed Demuxer::Demux(ArrayView<const uint8_t> datagram) const {
    if (Classify(datagram) == PacketKind::RTCP) {
        return rtcp::CompoundPacket::Parse(datagram);
    }
    return rtp::RtpPacket::Parse(datagram);
}

} // namespace rtpcodec
