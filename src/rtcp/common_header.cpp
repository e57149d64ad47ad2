#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/base/codec_error.hpp"
#include "rtpcodec/memory/padding.hpp"

#include <string>

namespace rtpcodec {
namespace rtcp {

//    0                   1           1       2                   3
//    0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//   |V=2|P| C/F     |  Packet Type  |    length in 32bits - 1       |
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//   |                     payload and padding                       |
//   |                             ....                              |
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// If the padding bit is set, the last byte of the packet holds the
// number of padding bytes, itself included.

CommonHeader::CommonHeader() 
    : packet_type_(0),
      count_or_format_(0),
      length_field_(0),
      padding_size_(0) {}

CommonHeader::CommonHeader(uint8_t packet_type, 
                           uint8_t count_or_format, 
                           uint16_t length_field, 
                           uint8_t padding_size) 
    : packet_type_(packet_type),
      count_or_format_(count_or_format),
      length_field_(length_field),
      padding_size_(padding_size) {}

CommonHeader::~CommonHeader() = default;

CommonHeader CommonHeader::Parse(BitReader& reader) {
    if (reader.RemainingByteCount() < kFixedHeaderSize) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, 
                         "Too little data (" + std::to_string(reader.RemainingByteCount()) + 
                         " bytes) for an RTCP common header.");
    }
    const size_t header_begin = reader.BitPosition() / 8;
    const uint8_t version = reader.ReadBits<uint8_t>(2);
    if (version != kVersion) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Invalid RTCP header: version " + std::to_string(version) + 
                         ", expected " + std::to_string(kVersion));
    }
    const bool has_padding = reader.ReadFlag();
    CommonHeader header;
    header.count_or_format_ = reader.ReadBits<uint8_t>(5);
    header.packet_type_ = reader.Read<uint8_t>();
    header.length_field_ = reader.Read<uint16_t>();

    const size_t payload_size = header.payload_size();
    if (payload_size > reader.RemainingByteCount()) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Length field declares " + std::to_string(header.packet_size()) + 
                         " bytes but only " + std::to_string(reader.RemainingByteCount() + kFixedHeaderSize) + 
                         " remain.");
    }

    if (has_padding) {
        ArrayView<const uint8_t> packet = reader.data().subview(header_begin, header.packet_size());
        header.padding_size_ = padding::ReadSignaledPaddingSize(packet, payload_size);
    }
    return header;
}

void CommonHeader::PackInto(BitWriter& writer) const {
    writer.WriteBits(kVersion, 2);
    writer.WriteFlag(has_padding());
    writer.WriteBits(count_or_format_, 5);
    writer.Write<uint8_t>(packet_type_);
    writer.Write<uint16_t>(length_field_);
}

} // namespace rtcp
} // namespace rtpcodec
