#ifndef _RTPCODEC_RTCP_COMPOUND_PACKET_H_
#define _RTPCODEC_RTCP_COMPOUND_PACKET_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/common/array_view.hpp"
#include "rtpcodec/memory/bit_writer.hpp"
#include "rtpcodec/rtcp/rtcp_packet.hpp"

#include <vector>

namespace rtpcodec {
namespace rtcp {

// RTCP packets sent back to back in one datagram, in order.
class RTPCODEC_CPP_EXPORT CompoundPacket {
public:
    CompoundPacket();
    CompoundPacket(const CompoundPacket&);
    CompoundPacket(CompoundPacket&&);
    CompoundPacket& operator=(const CompoundPacket&);
    CompoundPacket& operator=(CompoundPacket&&);
    ~CompoundPacket();

    // Parses a whole datagram, throws CodecError naming the failing sub packet.
    static CompoundPacket Parse(ArrayView<const uint8_t> data);
    static CompoundPacket Parse(const uint8_t* data, size_t size);

    const std::vector<RtcpPacket>& packets() const { return packets_; }
    size_t packet_count() const { return packets_.size(); }
    bool empty() const { return packets_.empty(); }

    void Append(RtcpPacket packet);

    BinaryBuffer Build() const;
    void PackInto(BitWriter& writer) const;

    bool operator==(const CompoundPacket& other) const { return packets_ == other.packets_; }
    bool operator!=(const CompoundPacket& other) const { return !(*this == other); }

private:
    std::vector<RtcpPacket> packets_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
