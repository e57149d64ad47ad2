#include "rtpcodec/rtp/header_extension_block.hpp"
#include "rtpcodec/base/codec_error.hpp"
#include "rtpcodec/memory/padding.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <string>

namespace rtpcodec {
namespace rtp {

// One-byte header (RFC 8285 section 4.2)
//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |       0xBE    |    0xDE       |           length=3            |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |  ID   | L=0   |     data      |  ID   |  L=1  |   data...
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//       ...data   |    0 (pad)    |    0 (pad)    |  ID   | L=3   |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                          data                                 |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// Two-byte header (RFC 8285 section 4.3)
//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |       0x10    |    0x00       |           length=3            |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |      ID       |     L=0       |     ID        |     L=1       |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |       data    |    0 (pad)    |       ID      |      L=4      |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                          data                                 |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+

HeaderExtensionBlock::HeaderExtensionBlock() 
    : HeaderExtensionBlock(ExtensionProfile::AUTO) {}

HeaderExtensionBlock::HeaderExtensionBlock(ExtensionProfile profile) 
    : profile_(profile),
      app_bits_(0),
      opaque_profile_id_(0) {}

HeaderExtensionBlock::HeaderExtensionBlock(const HeaderExtensionBlock&) = default;
HeaderExtensionBlock::HeaderExtensionBlock(HeaderExtensionBlock&&) = default;
HeaderExtensionBlock& HeaderExtensionBlock::operator=(const HeaderExtensionBlock&) = default;
HeaderExtensionBlock& HeaderExtensionBlock::operator=(HeaderExtensionBlock&&) = default;
HeaderExtensionBlock::~HeaderExtensionBlock() = default;

HeaderExtensionBlock HeaderExtensionBlock::Opaque(uint16_t profile_id, BinaryBuffer data) {
    HeaderExtensionBlock block(ExtensionProfile::OPAQUE);
    block.opaque_profile_id_ = profile_id;
    block.opaque_data_ = std::move(data);
    return block;
}

uint16_t HeaderExtensionBlock::profile_id() const {
    switch (ResolvedProfile()) {
    case ExtensionProfile::TWO_BYTE:
        return kTwoByteExtensionProfileId | app_bits_;
    case ExtensionProfile::OPAQUE:
        return opaque_profile_id_;
    default:
        return kOneByteExtensionProfileId;
    }
}

bool HeaderExtensionBlock::empty() const {
    return is_opaque() ? opaque_data_.empty() : extensions_.empty();
}

ArrayView<const uint8_t> HeaderExtensionBlock::Find(uint8_t id) const {
    for (const auto& extension : extensions_) {
        if (extension.id == id) {
            return ArrayView<const uint8_t>(extension.value);
        }
    }
    return ArrayView<const uint8_t>();
}

bool HeaderExtensionBlock::Has(uint8_t id) const {
    return std::any_of(extensions_.begin(), extensions_.end(), 
                       [id](const HeaderExtension& extension) { return extension.id == id; });
}

bool HeaderExtensionBlock::Set(uint8_t id, ArrayView<const uint8_t> value) {
    if (is_opaque()) {
        PLOG_WARNING << "Can not set element " << int(id) << " on an opaque extension block.";
        return false;
    }
    if (id == 0 || value.size() > kTwoByteExtensionMaxValueSize) {
        PLOG_WARNING << "Invalid header extension: id=" << int(id) << ", size=" << value.size();
        return false;
    }
    wire_body_.clear();
    HeaderExtension extension{id, BinaryBuffer(value.begin(), value.end())};
    if (profile_ == ExtensionProfile::ONE_BYTE && !FitsOneByte(extension)) {
        PLOG_DEBUG << "Promote to two-byte header extension for element " << int(id) 
                   << " with " << value.size() << " bytes.";
        profile_ = ExtensionProfile::TWO_BYTE;
    }
    for (auto& existing : extensions_) {
        if (existing.id == id) {
            existing.value = std::move(extension.value);
            return true;
        }
    }
    extensions_.push_back(std::move(extension));
    return true;
}

bool HeaderExtensionBlock::Remove(uint8_t id) {
    auto it = std::find_if(extensions_.begin(), extensions_.end(), 
                           [id](const HeaderExtension& extension) { return extension.id == id; });
    if (it == extensions_.end()) {
        return false;
    }
    extensions_.erase(it);
    wire_body_.clear();
    return true;
}

size_t HeaderExtensionBlock::PackedSize() const {
    if (!wire_body_.empty()) {
        return kExtensionPreambleSize + wire_body_.size();
    }
    const size_t body_size = BodySize(ResolvedProfile());
    return kExtensionPreambleSize + body_size + padding::AlignmentPaddingFor(body_size);
}

void HeaderExtensionBlock::Parse(BitReader& reader) {
    const uint16_t profile_id = reader.Read<uint16_t>();
    const uint16_t length_in_words = reader.Read<uint16_t>();
    const size_t body_size = static_cast<size_t>(length_in_words) * 4;
    if (body_size > reader.RemainingByteCount()) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Extension length of " + std::to_string(body_size) + " bytes exceeds the " + 
                         std::to_string(reader.RemainingByteCount()) + " bytes left in the packet.");
    }
    BinaryBuffer raw_body = reader.ReadBytes(body_size);
    BitReader body(raw_body.data(), raw_body.size());

    HeaderExtensionBlock parsed;
    if (profile_id == kOneByteExtensionProfileId) {
        parsed.profile_ = ExtensionProfile::ONE_BYTE;
        parsed.ParseOneByteElements(body);
    } else if ((profile_id & kTwoByteExtensionProfileMask) == kTwoByteExtensionProfileId) {
        parsed.profile_ = ExtensionProfile::TWO_BYTE;
        parsed.app_bits_ = static_cast<uint8_t>(profile_id & ~kTwoByteExtensionProfileMask);
        parsed.ParseTwoByteElements(body);
    } else {
        PLOG_DEBUG << "Unsupported header extension profile " << profile_id 
                   << ", keeping " << body_size << " bytes opaque.";
        parsed.profile_ = ExtensionProfile::OPAQUE;
        parsed.opaque_profile_id_ = profile_id;
        parsed.opaque_data_ = std::move(raw_body);
        *this = std::move(parsed);
        return;
    }
    BitWriter packed;
    parsed.PackElementsInto(packed, parsed.profile_);
    if (packed.Release() != raw_body) {
        PLOG_VERBOSE << "Keeping the " << body_size << " bytes of an extension block with padding.";
        parsed.wire_body_ = std::move(raw_body);
    }
    *this = std::move(parsed);
}

void HeaderExtensionBlock::PackInto(BitWriter& writer) const {
    const ExtensionProfile profile = ResolvedProfile();
    const size_t body_size = wire_body_.empty() ? BodySize(profile) : wire_body_.size();
    const size_t length_in_words = (body_size + padding::AlignmentPaddingFor(body_size)) / 4;
    if (length_in_words > 0xFFFF) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Header extensions of " + std::to_string(body_size) + " bytes do not fit the length field.");
    }
    writer.Write<uint16_t>(profile_id());
    writer.Write<uint16_t>(static_cast<uint16_t>(length_in_words));
    if (!wire_body_.empty()) {
        writer.WriteBytes(wire_body_);
    } else {
        PackElementsInto(writer, profile);
    }
}

bool HeaderExtensionBlock::operator==(const HeaderExtensionBlock& other) const {
    return ResolvedProfile() == other.ResolvedProfile() &&
           profile_id() == other.profile_id() &&
           extensions_ == other.extensions_ &&
           opaque_data_ == other.opaque_data_ &&
           wire_body_ == other.wire_body_;
}

// Private methods
void HeaderExtensionBlock::PackElementsInto(BitWriter& writer, ExtensionProfile profile) const {
    const size_t mark = writer.BitPosition();
    if (profile == ExtensionProfile::OPAQUE) {
        writer.WriteBytes(opaque_data_);
    } else if (profile == ExtensionProfile::ONE_BYTE) {
        for (const auto& extension : extensions_) {
            writer.WriteBits(extension.id, 4);
            writer.WriteBits(extension.value.size() - 1, 4);
            writer.WriteBytes(extension.value);
        }
    } else {
        for (const auto& extension : extensions_) {
            writer.Write<uint8_t>(extension.id);
            writer.Write<uint8_t>(static_cast<uint8_t>(extension.value.size()));
            writer.WriteBytes(extension.value);
        }
    }
    padding::WriteAlignmentPadding(writer, mark);
}

ExtensionProfile HeaderExtensionBlock::ResolvedProfile() const {
    if (profile_ != ExtensionProfile::AUTO) {
        return profile_;
    }
    return std::all_of(extensions_.begin(), extensions_.end(), FitsOneByte) 
               ? ExtensionProfile::ONE_BYTE 
               : ExtensionProfile::TWO_BYTE;
}

bool HeaderExtensionBlock::FitsOneByte(const HeaderExtension& extension) {
    return extension.id >= kOneByteExtensionMinId && 
           extension.id <= kOneByteExtensionMaxId &&
           !extension.value.empty() &&
           extension.value.size() <= kOneByteExtensionMaxValueSize;
}

size_t HeaderExtensionBlock::BodySize(ExtensionProfile profile) const {
    if (profile == ExtensionProfile::OPAQUE) {
        return opaque_data_.size();
    }
    const size_t element_header_size = profile == ExtensionProfile::ONE_BYTE ? 1 : 2;
    size_t body_size = 0;
    for (const auto& extension : extensions_) {
        body_size += element_header_size + extension.value.size();
    }
    return body_size;
}

void HeaderExtensionBlock::ParseOneByteElements(BitReader& body) {
    while (body.RemainingByteCount() > 0) {
        const uint8_t id = body.ReadBits<uint8_t>(4);
        const size_t value_size = body.ReadBits<uint8_t>(4) + 1;
        if (id == 0) {
            // Padding byte
            continue;
        }
        if (id == kOneByteExtensionTerminatorId) {
            // The rest of the block is padding.
            break;
        }
        if (value_size > body.RemainingByteCount()) {
            throw CodecError(ErrorKind::MALFORMED_HEADER, 
                             "One-byte extension element " + std::to_string(id) + " of " + 
                             std::to_string(value_size) + " bytes overruns the extension block.");
        }
        extensions_.push_back(HeaderExtension{id, body.ReadBytes(value_size)});
    }
}

void HeaderExtensionBlock::ParseTwoByteElements(BitReader& body) {
    while (body.RemainingByteCount() > 0) {
        const uint8_t id = body.Read<uint8_t>();
        if (id == 0) {
            // Padding byte
            continue;
        }
        if (body.RemainingByteCount() == 0) {
            throw CodecError(ErrorKind::MALFORMED_HEADER, 
                             "Two-byte extension element " + std::to_string(id) + " has no length.");
        }
        const size_t value_size = body.Read<uint8_t>();
        if (value_size > body.RemainingByteCount()) {
            throw CodecError(ErrorKind::MALFORMED_HEADER, 
                             "Two-byte extension element " + std::to_string(id) + " of " + 
                             std::to_string(value_size) + " bytes overruns the extension block.");
        }
        extensions_.push_back(HeaderExtension{id, body.ReadBytes(value_size)});
    }
}

} // namespace rtp
} // namespace rtpcodec
