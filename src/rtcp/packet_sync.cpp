#include "rtpcodec/rtcp/packet_sync.hpp"
#include "rtpcodec/base/codec_error.hpp"
#include "rtpcodec/memory/padding.hpp"

#include <string>

namespace rtpcodec {
namespace rtcp {

PacketPadding::PacketPadding() = default;
PacketPadding::PacketPadding(const PacketPadding&) = default;
PacketPadding::PacketPadding(PacketPadding&&) = default;
PacketPadding& PacketPadding::operator=(const PacketPadding&) = default;
PacketPadding& PacketPadding::operator=(PacketPadding&&) = default;
PacketPadding::~PacketPadding() = default;

void PacketPadding::set_padding_size(uint8_t padding_size) {
    padding_ = padding::MakeSignaledPadding(padding_size);
}

void PacketPadding::set_padding(BinaryBuffer padding) {
    if (!padding::IsSignaledPadding(padding)) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "The last of " + std::to_string(padding.size()) + 
                         " padding bytes does not hold the padding size.");
    }
    padding_ = std::move(padding);
}

CommonHeader Finalize(const HeaderTemplate& partial, const SerializedBody& body) {
    const size_t packet_body_size = body.bytes.size() + body.padding.size();
    if (packet_body_size % padding::kAlignment != 0) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Body of " + std::to_string(body.bytes.size()) + " bytes with " + 
                         std::to_string(body.padding.size()) + " padding bytes is not 32-bit aligned.");
    }
    const size_t count = partial.feedback_message_type ? *partial.feedback_message_type 
                                                       : body.item_count;
    if (count > CommonHeader::kMaxCountOrFormat) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Count or format " + std::to_string(count) + " does not fit in 5 bits.");
    }
    const size_t length_field = (CommonHeader::kFixedHeaderSize + packet_body_size) / 4 - 1;
    if (length_field > CommonHeader::kMaxLengthField) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, 
                         "Body of " + std::to_string(packet_body_size) + " bytes is too long for an RTCP packet.");
    }
    if (!padding::IsSignaledPadding(body.padding)) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, "Padding does not end with the padding size.");
    }
    return CommonHeader(partial.packet_type, 
                        static_cast<uint8_t>(count), 
                        static_cast<uint16_t>(length_field), 
                        static_cast<uint8_t>(body.padding.size()));
}

} // namespace rtcp
} // namespace rtpcodec
