#include "rtpcodec/rtcp/sdes.hpp"
#include "rtpcodec/base/codec_error.hpp"
#include "rtpcodec/memory/padding.hpp"

#include <plog/Log.h>

#include <string>

namespace rtpcodec {
namespace rtcp {

// Source Description (SDES) (RFC 3550).
//
//         0                   1                   2                   3
//         0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//        +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// header |V=2|P|    SC   |  PT=SDES=202  |             length            |
//        +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
// chunk  |                          SSRC/CSRC_1                          |
//   1    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//        |                           SDES items                          |
//        |                              ...                              |
//        +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
// chunk  |                          SSRC/CSRC_2                          |
//   2    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//        |                           SDES items                          |
//        |                              ...                              |
//        +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
//
// Canonical End-Point Identifier SDES Item (CNAME)
//
//    0                   1                   2                   3
//    0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//   |    CNAME=1    |     length    | user and domain name        ...
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// The item list of a chunk ends with a null octet, then zeros up to
// the next 32-bit boundary. A parsed chunk keeps the bytes it has there.

std::optional<std::string> Sdes::Chunk::cname() const {
    for (const auto& item : items) {
        if (item.type == kCnameTag) {
            return item.value;
        }
    }
    return std::nullopt;
}

Sdes::Sdes() = default;
Sdes::Sdes(const Sdes&) = default;
Sdes::Sdes(Sdes&&) = default;
Sdes& Sdes::operator=(const Sdes&) = default;
Sdes& Sdes::operator=(Sdes&&) = default;
Sdes::~Sdes() = default;

bool Sdes::AddCName(uint32_t ssrc, std::string cname) {
    Chunk chunk;
    chunk.ssrc = ssrc;
    chunk.items.push_back(Item{kCnameTag, std::move(cname)});
    return AddChunk(std::move(chunk));
}

bool Sdes::AddChunk(Chunk chunk) {
    if (chunks_.size() >= kMaxNumberOfChunks) {
        PLOG_WARNING << "Max SDES chunks reached.";
        return false;
    }
    for (const auto& item : chunk.items) {
        if (item.type == kTerminatorTag) {
            PLOG_WARNING << "SDES item type 0 is reserved for the end of the item list.";
            return false;
        }
        if (item.value.size() > kMaxItemLength) {
            PLOG_WARNING << "SDES item of " << item.value.size() << " bytes is too long.";
            return false;
        }
    }
    chunks_.push_back(std::move(chunk));
    chunk_paddings_.emplace_back();
    return true;
}

SerializedBody Sdes::Serialize() const {
    BitWriter writer;
    for (size_t i = 0; i < chunks_.size(); ++i) {
        const Chunk& chunk = chunks_[i];
        const size_t chunk_begin = writer.BitPosition();
        writer.Write<uint32_t>(chunk.ssrc);
        for (const auto& item : chunk.items) {
            writer.Write<uint8_t>(item.type);
            writer.Write<uint8_t>(static_cast<uint8_t>(item.value.size()));
            writer.WriteBytes(reinterpret_cast<const uint8_t*>(item.value.data()), item.value.size());
        }
        writer.Write<uint8_t>(kTerminatorTag);
        padding::WriteAlignmentPadding(writer, chunk_begin, chunk_paddings_[i]);
    }
    return SerializedBody{writer.Release(), chunks_.size(), padding()};
}

void Sdes::Parse(const CommonHeader& header, BitReader& payload) {
    std::vector<Chunk> chunks;
    std::vector<BinaryBuffer> chunk_paddings(header.count());
    chunks.reserve(header.count());
    for (size_t i = 0; i < header.count(); ++i) {
        try {
            chunks.push_back(ParseChunk(payload, &chunk_paddings[i]));
        } catch (const CodecError& e) {
            throw e.WithContext("chunk " + std::to_string(i));
        }
    }
    chunks_ = std::move(chunks);
    chunk_paddings_ = std::move(chunk_paddings);
}

bool Sdes::operator==(const Sdes& other) const {
    return chunks_ == other.chunks_ && 
           chunk_paddings_ == other.chunk_paddings_ &&
           PaddingEquals(other);
}

// Private methods
Sdes::Chunk Sdes::ParseChunk(BitReader& payload, BinaryBuffer* kept_padding) {
    const size_t chunk_begin = payload.BitPosition();
    Chunk chunk;
    chunk.ssrc = payload.Read<uint32_t>();
    uint8_t item_type = payload.Read<uint8_t>();
    while (item_type != kTerminatorTag) {
        const uint8_t item_length = payload.Read<uint8_t>();
        if (item_length > payload.RemainingByteCount()) {
            throw CodecError(ErrorKind::MALFORMED_HEADER, 
                             "Item length " + std::to_string(item_length) + " exceeds the " + 
                             std::to_string(payload.RemainingByteCount()) + " bytes left.");
        }
        BinaryBuffer value = payload.ReadBytes(item_length);
        chunk.items.push_back(Item{item_type, std::string(value.begin(), value.end())});
        item_type = payload.Read<uint8_t>();
    }
    *kept_padding = padding::ReadAlignmentPadding(payload, chunk_begin);
    return chunk;
}

} // namespace rtcp
} // namespace rtpcodec
