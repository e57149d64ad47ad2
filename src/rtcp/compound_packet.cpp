#include "rtpcodec/rtcp/compound_packet.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <plog/Log.h>

#include <string>

namespace rtpcodec {
namespace rtcp {

CompoundPacket::CompoundPacket() = default;
CompoundPacket::CompoundPacket(const CompoundPacket&) = default;
CompoundPacket::CompoundPacket(CompoundPacket&&) = default;
CompoundPacket& CompoundPacket::operator=(const CompoundPacket&) = default;
CompoundPacket& CompoundPacket::operator=(CompoundPacket&&) = default;
CompoundPacket::~CompoundPacket() = default;

CompoundPacket CompoundPacket::Parse(const uint8_t* data, size_t size) {
    return Parse(ArrayView<const uint8_t>(data, size));
}

CompoundPacket CompoundPacket::Parse(ArrayView<const uint8_t> data) {
    CompoundPacket compound;
    if (data.empty()) {
        PLOG_WARNING << "Failed to parse RTCP datagram: no data.";
        throw CodecError(ErrorKind::MALFORMED_HEADER, "Empty RTCP datagram.");
    }
    BitReader reader(data);
    while (reader.RemainingByteCount() > 0) {
        try {
            compound.packets_.push_back(ParsePacket(reader));
        } catch (const CodecError& e) {
            PLOG_WARNING << "Failed to parse RTCP datagram of " << data.size() 
                         << " bytes at sub packet " << compound.packets_.size() 
                         << ": " << e.what();
            throw e.WithContext("sub packet " + std::to_string(compound.packets_.size()));
        }
    }
    return compound;
}

void CompoundPacket::Append(RtcpPacket packet) {
    packets_.push_back(std::move(packet));
}

BinaryBuffer CompoundPacket::Build() const {
    BitWriter writer;
    PackInto(writer);
    return writer.Release();
}

void CompoundPacket::PackInto(BitWriter& writer) const {
    for (const auto& packet : packets_) {
        rtcp::PackInto(packet, writer);
    }
}

} // namespace rtcp
} // namespace rtpcodec
