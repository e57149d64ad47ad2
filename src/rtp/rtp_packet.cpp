#include "rtpcodec/rtp/rtp_packet.hpp"
#include "rtpcodec/base/codec_error.hpp"
#include "rtpcodec/memory/padding.hpp"

#include <plog/Log.h>

#include <string>

namespace rtpcodec {
namespace rtp {

//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |V=2|P|X|  CC   |M|     PT      |       sequence number         |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                           timestamp                           |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |           synchronization source (SSRC) identifier            |
// +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
// |            Contributing source (CSRC) identifiers             |
// |                             ....                              |
// +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
// |  header eXtension profile id  |       length in 32bits        |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                          Extensions                           |
// |                             ....                              |
// +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
// |                           Payload                             |
// |             ....              :  padding...                   |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |               padding         | Padding size  |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+

RtpPacket::RtpPacket() 
    : marker_(false),
      payload_type_(0),
      sequence_num_(0),
      timestamp_(0),
      ssrc_(0),
      extension_profile_preference_(ExtensionProfile::AUTO) {}

RtpPacket::RtpPacket(const RtpPacket&) = default;
RtpPacket::RtpPacket(RtpPacket&&) = default;
RtpPacket& RtpPacket::operator=(const RtpPacket&) = default;
RtpPacket& RtpPacket::operator=(RtpPacket&&) = default;
RtpPacket::~RtpPacket() = default;

RtpPacket RtpPacket::Parse(const uint8_t* data, size_t size) {
    return Parse(ArrayView<const uint8_t>(data, size));
}

RtpPacket RtpPacket::Parse(ArrayView<const uint8_t> data) {
    RtpPacket packet;
    try {
        packet.ParseInternal(data);
    } catch (const CodecError& e) {
        PLOG_WARNING << "Failed to parse RTP packet of " << data.size() << " bytes: " << e.what();
        throw e.WithContext("rtp packet");
    }
    return packet;
}

bool RtpPacket::set_payload_type(uint8_t payload_type) {
    if (payload_type > kMaxPayloadType) {
        PLOG_WARNING << "Payload type " << int(payload_type) << " does not fit in 7 bits.";
        return false;
    }
    payload_type_ = payload_type;
    return true;
}

bool RtpPacket::set_csrcs(std::vector<uint32_t> csrcs) {
    if (csrcs.size() > kMaxCsrcs) {
        PLOG_WARNING << "Too many CSRCs (" << csrcs.size() << "), at most " << kMaxCsrcs << " allowed.";
        return false;
    }
    csrcs_ = std::move(csrcs);
    return true;
}

void RtpPacket::set_padding_size(uint8_t padding_size) {
    padding_ = padding::MakeSignaledPadding(padding_size);
}

HeaderExtensionBlock& RtpPacket::mutable_extensions() {
    if (!extensions_) {
        extensions_.emplace(extension_profile_preference_);
    }
    return *extensions_;
}

bool RtpPacket::set_extension_profile_preference(ExtensionProfile profile) {
    if (profile == ExtensionProfile::OPAQUE) {
        PLOG_WARNING << "An opaque block can not be preferred for new extensions.";
        return false;
    }
    extension_profile_preference_ = profile;
    return true;
}

void RtpPacket::SetPayload(ArrayView<const uint8_t> payload) {
    payload_.assign(payload.begin(), payload.end());
}

size_t RtpPacket::header_size() const {
    return kFixedHeaderSize + csrcs_.size() * 4 + (extensions_ ? extensions_->PackedSize() : 0);
}

BinaryBuffer RtpPacket::Build() const {
    BitWriter writer;
    PackInto(writer);
    return writer.Release();
}

void RtpPacket::PackInto(BitWriter& writer) const {
    writer.WriteBits(kRtpVersion, 2);
    writer.WriteFlag(!padding_.empty());
    writer.WriteFlag(extensions_.has_value());
    writer.WriteBits(csrcs_.size(), 4);
    writer.WriteFlag(marker_);
    writer.WriteBits(payload_type_, 7);
    writer.Write<uint16_t>(sequence_num_);
    writer.Write<uint32_t>(timestamp_);
    writer.Write<uint32_t>(ssrc_);
    for (uint32_t csrc : csrcs_) {
        writer.Write<uint32_t>(csrc);
    }
    if (extensions_) {
        extensions_->PackInto(writer);
    }
    writer.WriteBytes(payload_);
    writer.WriteBytes(padding_);
}

bool RtpPacket::operator==(const RtpPacket& other) const {
    return marker_ == other.marker_ &&
           payload_type_ == other.payload_type_ &&
           padding_ == other.padding_ &&
           sequence_num_ == other.sequence_num_ &&
           timestamp_ == other.timestamp_ &&
           ssrc_ == other.ssrc_ &&
           csrcs_ == other.csrcs_ &&
           extensions_ == other.extensions_ &&
           payload_ == other.payload_;
}

// Private methods
void RtpPacket::ParseInternal(ArrayView<const uint8_t> data) {
    if (data.size() < kFixedHeaderSize) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, 
                         "Need " + std::to_string(kFixedHeaderSize) + " bytes for the fixed header, got " + 
                         std::to_string(data.size()));
    }
    BitReader reader(data);
    const uint8_t version = reader.ReadBits<uint8_t>(2);
    if (version != kRtpVersion) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, "Invalid RTP version " + std::to_string(version));
    }
    const bool has_padding = reader.ReadFlag();
    const bool has_extension = reader.ReadFlag();
    const size_t csrc_count = reader.ReadBits<uint8_t>(4);
    marker_ = reader.ReadFlag();
    payload_type_ = reader.ReadBits<uint8_t>(7);
    sequence_num_ = reader.Read<uint16_t>();
    timestamp_ = reader.Read<uint32_t>();
    ssrc_ = reader.Read<uint32_t>();

    if (csrc_count * 4 > reader.RemainingByteCount()) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "CSRC count " + std::to_string(csrc_count) + " exceeds the " + 
                         std::to_string(reader.RemainingByteCount()) + " bytes after the fixed header.");
    }
    csrcs_.resize(csrc_count);
    for (auto& csrc : csrcs_) {
        csrc = reader.Read<uint32_t>();
    }

    if (has_extension) {
        HeaderExtensionBlock extensions;
        extensions.Parse(reader);
        extensions_ = std::move(extensions);
    }

    size_t payload_size = reader.RemainingByteCount();
    size_t padding_size = 0;
    if (has_padding) {
        padding_size = padding::ReadSignaledPaddingSize(data, payload_size);
        payload_size -= padding_size;
    }
    payload_ = reader.ReadBytes(payload_size);
    padding_ = reader.ReadBytes(padding_size);
}

} // namespace rtp
} // namespace rtpcodec
