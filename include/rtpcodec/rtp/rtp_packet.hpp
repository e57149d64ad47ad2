#ifndef _RTPCODEC_RTP_RTP_PACKET_H_
#define _RTPCODEC_RTP_RTP_PACKET_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/common/array_view.hpp"
#include "rtpcodec/memory/bit_reader.hpp"
#include "rtpcodec/memory/bit_writer.hpp"
#include "rtpcodec/rtp/rtp_defines.hpp"
#include "rtpcodec/rtp/header_extension_block.hpp"

#include <optional>
#include <vector>

namespace rtpcodec {
namespace rtp {

// Offsets into the built packet, e.g. the region an SRTP layer encrypts.
struct RTPCODEC_CPP_EXPORT ByteRange {
    size_t offset = 0;
    size_t size = 0;
};

// An RTP packet owning copies of its payload and extension values.
// The P, X and CC header bits are derived from the padding, the
// extension block and the CSRC list, so they can not disagree with the
// body when packed. Padding is kept byte for byte as parsed.
class RTPCODEC_CPP_EXPORT RtpPacket {
public:
    RtpPacket();
    RtpPacket(const RtpPacket&);
    RtpPacket(RtpPacket&&);
    RtpPacket& operator=(const RtpPacket&);
    RtpPacket& operator=(RtpPacket&&);
    ~RtpPacket();

    // Parses a whole datagram, throws CodecError on malformed input.
    static RtpPacket Parse(ArrayView<const uint8_t> data);
    static RtpPacket Parse(const uint8_t* data, size_t size);

    // Header
    bool marker() const { return marker_; }
    uint8_t payload_type() const { return payload_type_; }
    uint16_t sequence_number() const { return sequence_num_; }
    uint32_t timestamp() const { return timestamp_; }
    uint32_t ssrc() const { return ssrc_; }
    const std::vector<uint32_t>& csrcs() const { return csrcs_; }
    bool has_padding() const { return !padding_.empty(); }
    uint8_t padding_size() const { return static_cast<uint8_t>(padding_.size()); }
    const BinaryBuffer& padding() const { return padding_; }
    bool has_extension() const { return extensions_.has_value(); }

    void set_marker(bool marker) { marker_ = marker; }
    bool set_payload_type(uint8_t payload_type);
    void set_sequence_number(uint16_t sequence_num) { sequence_num_ = sequence_num; }
    void set_timestamp(uint32_t timestamp) { timestamp_ = timestamp; }
    void set_ssrc(uint32_t ssrc) { ssrc_ = ssrc; }
    bool set_csrcs(std::vector<uint32_t> csrcs);
    // Zeros with the last byte carrying `padding_size`, 0 removes the padding.
    void set_padding_size(uint8_t padding_size);

    // Header extensions
    const std::optional<HeaderExtensionBlock>& extensions() const { return extensions_; }
    // Creates an empty block of the preferred profile when there is none.
    HeaderExtensionBlock& mutable_extensions();
    ExtensionProfile extension_profile_preference() const { return extension_profile_preference_; }
    // Profile of the blocks created by mutable_extensions(), AUTO by default.
    // OPAQUE is rejected.
    bool set_extension_profile_preference(ExtensionProfile profile);
    void set_extensions(HeaderExtensionBlock extensions) { extensions_ = std::move(extensions); }
    void ClearExtensions() { extensions_.reset(); }

    template <typename Extension>
    std::optional<Extension> GetExtension(uint8_t id) const;

    template <typename Extension, typename... Values>
    bool SetExtension(uint8_t id, const Values&... values);

    // Payload
    ArrayView<const uint8_t> payload() const { return ArrayView<const uint8_t>(payload_); }
    size_t payload_size() const { return payload_.size(); }
    void SetPayload(ArrayView<const uint8_t> payload);

    // Sizes of the packet as packed.
    size_t header_size() const;
    size_t size() const { return header_size() + payload_.size() + padding_.size(); }
    ByteRange payload_range() const { return ByteRange{header_size(), payload_.size()}; }

    BinaryBuffer Build() const;
    void PackInto(BitWriter& writer) const;

    bool operator==(const RtpPacket& other) const;
    bool operator!=(const RtpPacket& other) const { return !(*this == other); }

private:
    void ParseInternal(ArrayView<const uint8_t> data);

private:
    bool marker_;
    uint8_t payload_type_;
    uint16_t sequence_num_;
    uint32_t timestamp_;
    uint32_t ssrc_;
    std::vector<uint32_t> csrcs_;
    std::optional<HeaderExtensionBlock> extensions_;
    ExtensionProfile extension_profile_preference_;
    BinaryBuffer payload_;
    BinaryBuffer padding_;
};

template <typename Extension>
std::optional<Extension> RtpPacket::GetExtension(uint8_t id) const {
    if (!extensions_ || !extensions_->Has(id)) {
        return std::nullopt;
    }
    Extension extension;
    if (!extension.Parse(extensions_->Find(id))) {
        return std::nullopt;
    }
    return extension;
}

template <typename Extension, typename... Values>
bool RtpPacket::SetExtension(uint8_t id, const Values&... values) {
    const Extension extension(values...);
    BinaryBuffer value(extension.data_size());
    if (!extension.PackInto(value.data(), value.size())) {
        return false;
    }
    return mutable_extensions().Set(id, value);
}

} // namespace rtp
} // namespace rtpcodec

#endif
