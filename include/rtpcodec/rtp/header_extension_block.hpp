#ifndef _RTPCODEC_RTP_HEADER_EXTENSION_BLOCK_H_
#define _RTPCODEC_RTP_HEADER_EXTENSION_BLOCK_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/common/array_view.hpp"
#include "rtpcodec/memory/bit_reader.hpp"
#include "rtpcodec/memory/bit_writer.hpp"
#include "rtpcodec/rtp/rtp_defines.hpp"

#include <vector>

namespace rtpcodec {
namespace rtp {

struct RTPCODEC_CPP_EXPORT HeaderExtension {
    uint8_t id = 0;
    BinaryBuffer value;

    bool operator==(const HeaderExtension& other) const {
        return id == other.id && value == other.value;
    }
};

// The extension region of an RTP header (RFC 3550 section 5.3.1, RFC 8285).
//
//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |      defined by profile       |           length              |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                        header extension                       |
// |                             ....                              |
//
// Profile 0xBEDE carries one-byte elements, profile 0x100X two-byte
// elements. A block with any other profile is kept as opaque bytes and
// packed back unchanged. A parsed block also packs back to the bytes it
// was parsed from, padding between elements included, until Set() or
// Remove() changes it.
class RTPCODEC_CPP_EXPORT HeaderExtensionBlock {
public:
    HeaderExtensionBlock();
    explicit HeaderExtensionBlock(ExtensionProfile profile);
    HeaderExtensionBlock(const HeaderExtensionBlock&);
    HeaderExtensionBlock(HeaderExtensionBlock&&);
    HeaderExtensionBlock& operator=(const HeaderExtensionBlock&);
    HeaderExtensionBlock& operator=(HeaderExtensionBlock&&);
    ~HeaderExtensionBlock();

    // A block of an unknown profile. `data` is padded with zeros to a
    // whole word when packed.
    static HeaderExtensionBlock Opaque(uint16_t profile_id, BinaryBuffer data);

    ExtensionProfile profile() const { return profile_; }
    // The profile id as found on the wire, or the one the block packs with.
    uint16_t profile_id() const;
    bool is_opaque() const { return profile_ == ExtensionProfile::OPAQUE; }
    bool empty() const;

    const std::vector<HeaderExtension>& extensions() const { return extensions_; }
    const BinaryBuffer& opaque_data() const { return opaque_data_; }

    // Returns an empty view if there is no element with `id`.
    ArrayView<const uint8_t> Find(uint8_t id) const;
    bool Has(uint8_t id) const;

    // Adds or replaces the element with `id`. A one-byte block is
    // promoted to two-byte if the element does not fit the one-byte form.
    // Returns false for id 0, values over 255 bytes, or an opaque block.
    bool Set(uint8_t id, ArrayView<const uint8_t> value);
    bool Remove(uint8_t id);

    // Bytes this block takes on the wire, preamble included.
    size_t PackedSize() const;

    // Parses the preamble and the elements at the position of `reader`.
    // Throws CodecError, the block is left unchanged on failure.
    void Parse(BitReader& reader);
    void PackInto(BitWriter& writer) const;

    bool operator==(const HeaderExtensionBlock& other) const;
    bool operator!=(const HeaderExtensionBlock& other) const { return !(*this == other); }

private:
    ExtensionProfile ResolvedProfile() const;
    static bool FitsOneByte(const HeaderExtension& extension);
    size_t BodySize(ExtensionProfile profile) const;

    // Elements followed by zero padding to a whole word.
    void PackElementsInto(BitWriter& writer, ExtensionProfile profile) const;
    void ParseOneByteElements(BitReader& body);
    void ParseTwoByteElements(BitReader& body);

private:
    ExtensionProfile profile_;
    // The low 4 "appbits" of a two-byte profile id.
    uint8_t app_bits_;
    uint16_t opaque_profile_id_;
    std::vector<HeaderExtension> extensions_;
    BinaryBuffer opaque_data_;
    // Body as parsed when packing the elements would not give it back.
    BinaryBuffer wire_body_;
};

} // namespace rtp
} // namespace rtpcodec

#endif
