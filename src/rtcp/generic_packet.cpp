#include "rtpcodec/rtcp/generic_packet.hpp"

#include <plog/Log.h>

namespace rtpcodec {
namespace rtcp {

GenericPacket::GenericPacket() 
    : GenericPacket(0, 0) {}

GenericPacket::GenericPacket(uint8_t packet_type, uint8_t count_or_format) 
    : packet_type_(packet_type),
      count_or_format_(count_or_format & CommonHeader::kMaxCountOrFormat) {}

GenericPacket::GenericPacket(const GenericPacket&) = default;
GenericPacket::GenericPacket(GenericPacket&&) = default;
GenericPacket& GenericPacket::operator=(const GenericPacket&) = default;
GenericPacket& GenericPacket::operator=(GenericPacket&&) = default;
GenericPacket::~GenericPacket() = default;

bool GenericPacket::set_count_or_format(uint8_t count_or_format) {
    if (count_or_format > CommonHeader::kMaxCountOrFormat) {
        PLOG_WARNING << "Count or format " << int(count_or_format) << " does not fit in 5 bits.";
        return false;
    }
    count_or_format_ = count_or_format;
    return true;
}

SerializedBody GenericPacket::Serialize() const {
    return SerializedBody{payload_, 0, padding()};
}

void GenericPacket::Parse(const CommonHeader& header, BitReader& payload) {
    packet_type_ = header.type();
    count_or_format_ = header.count();
    payload_ = payload.ReadBytes(payload.RemainingByteCount());
}

bool GenericPacket::operator==(const GenericPacket& other) const {
    return packet_type_ == other.packet_type_ &&
           count_or_format_ == other.count_or_format_ &&
           payload_ == other.payload_ &&
           PaddingEquals(other);
}

} // namespace rtcp
} // namespace rtpcodec
