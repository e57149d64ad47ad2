#include "rtpcodec/rtcp/packet_status_chunk.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <algorithm>
#include <string>

namespace rtpcodec {
namespace rtcp {

std::ostream& operator<<(std::ostream& out, PacketStatus status) {
    switch (status) {
    case PacketStatus::NOT_RECEIVED:
        return out << "not_received";
    case PacketStatus::RECEIVED_SMALL_DELTA:
        return out << "received_small_delta";
    case PacketStatus::RECEIVED_LARGE_DELTA:
        return out << "received_large_delta";
    case PacketStatus::RESERVED:
        return out << "reserved";
    }
    return out << "unknown";
}

//  Run Length Status Vector Chunk
//
//  0                   1
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |T| S |       Run Length        |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
//  T = 0
//  S = symbol
//  Run Length = Unsigned integer denoting the run length of the symbol
PacketStatusChunk PacketStatusChunk::RunLength(PacketStatus status, size_t run_length) {
    if (run_length > kMaxRunLength) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Run length " + std::to_string(run_length) + " does not fit in 13 bits.");
    }
    return PacketStatusChunk(static_cast<uint16_t>((static_cast<uint16_t>(status) << 13) | run_length));
}

//  One Bit Status Vector Chunk
//
//  0                   1
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |T|S|       symbol list         |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
//  T = 1
//  S = 0
//  Symbol list = 14 entries where 0 = not received, 1 = received 1-byte delta.
PacketStatusChunk PacketStatusChunk::OneBitVector(const PacketStatus* statuses, size_t count) {
    if (count > kOneBitCapacity) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         std::to_string(count) + " symbols do not fit a one bit vector.");
    }
    uint16_t chunk = 0x8000;
    for (size_t i = 0; i < count; ++i) {
        if (statuses[i] != PacketStatus::NOT_RECEIVED && statuses[i] != PacketStatus::RECEIVED_SMALL_DELTA) {
            throw CodecError(ErrorKind::MALFORMED_HEADER, "A one bit vector only carries small deltas.");
        }
        chunk |= static_cast<uint16_t>(statuses[i]) << (kOneBitCapacity - 1 - i);
    }
    return PacketStatusChunk(chunk);
}

//  Two Bit Status Vector Chunk
//
//  0                   1
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |T|S|       symbol list         |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
//  T = 1
//  S = 1
//  symbol list = 7 entries of two bits each.
PacketStatusChunk PacketStatusChunk::TwoBitVector(const PacketStatus* statuses, size_t count) {
    if (count > kTwoBitCapacity) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         std::to_string(count) + " symbols do not fit a two bit vector.");
    }
    uint16_t chunk = 0xC000;
    for (size_t i = 0; i < count; ++i) {
        chunk |= static_cast<uint16_t>(statuses[i]) << 2 * (kTwoBitCapacity - 1 - i);
    }
    return PacketStatusChunk(chunk);
}

PacketStatusChunk::Type PacketStatusChunk::type() const {
    if ((raw_ & 0x8000) == 0) {
        return Type::RUN_LENGTH;
    }
    return (raw_ & 0x4000) == 0 ? Type::ONE_BIT_VECTOR : Type::TWO_BIT_VECTOR;
}

size_t PacketStatusChunk::symbol_count() const {
    switch (type()) {
    case Type::RUN_LENGTH:
        return raw_ & kMaxRunLength;
    case Type::ONE_BIT_VECTOR:
        return kOneBitCapacity;
    case Type::TWO_BIT_VECTOR:
        return kTwoBitCapacity;
    }
    return 0;
}

void PacketStatusChunk::AppendTo(std::vector<PacketStatus>* statuses, size_t max_count) const {
    const size_t count = std::min(symbol_count(), max_count);
    switch (type()) {
    case Type::RUN_LENGTH:
        statuses->insert(statuses->end(), count, static_cast<PacketStatus>((raw_ >> 13) & 0x03));
        break;
    case Type::ONE_BIT_VECTOR:
        for (size_t i = 0; i < count; ++i) {
            statuses->push_back(static_cast<PacketStatus>((raw_ >> (kOneBitCapacity - 1 - i)) & 0x01));
        }
        break;
    case Type::TWO_BIT_VECTOR:
        for (size_t i = 0; i < count; ++i) {
            statuses->push_back(static_cast<PacketStatus>((raw_ >> 2 * (kTwoBitCapacity - 1 - i)) & 0x03));
        }
        break;
    }
}

// StatusEncoder
StatusEncoder::StatusEncoder() {
    Clear();
}

void StatusEncoder::Clear() {
    size_ = 0;
    all_same_ = true;
    has_large_delta_ = false;
}

bool StatusEncoder::CanAdd(PacketStatus status) const {
    if (size_ < PacketStatusChunk::kTwoBitCapacity) {
        return true;
    }
    if (size_ < PacketStatusChunk::kOneBitCapacity && !has_large_delta_ && 
        status != PacketStatus::RECEIVED_LARGE_DELTA && status != PacketStatus::RESERVED) {
        return true;
    }
    if (size_ < PacketStatusChunk::kMaxRunLength && all_same_ && statuses_[0] == status) {
        return true;
    }
    return false;
}

void StatusEncoder::Add(PacketStatus status) {
    if (size_ < kMaxVectorCapacity) {
        statuses_[size_] = status;
    }
    size_++;
    all_same_ = all_same_ && status == statuses_[0];
    has_large_delta_ = has_large_delta_ || 
                       status == PacketStatus::RECEIVED_LARGE_DELTA || 
                       status == PacketStatus::RESERVED;
}

PacketStatusChunk StatusEncoder::Emit() {
    if (all_same_) {
        PacketStatusChunk chunk = PacketStatusChunk::RunLength(statuses_[0], size_);
        Clear();
        return chunk;
    }
    if (size_ == PacketStatusChunk::kOneBitCapacity) {
        PacketStatusChunk chunk = PacketStatusChunk::OneBitVector(statuses_, size_);
        Clear();
        return chunk;
    }
    constexpr size_t kTwoBitCapacity = PacketStatusChunk::kTwoBitCapacity;
    PacketStatusChunk chunk = PacketStatusChunk::TwoBitVector(statuses_, kTwoBitCapacity);
    // Shift the remaining statuses to the front and recalculate the flags.
    size_ -= kTwoBitCapacity;
    all_same_ = true;
    has_large_delta_ = false;
    for (size_t i = 0; i < size_; ++i) {
        PacketStatus status = statuses_[kTwoBitCapacity + i];
        statuses_[i] = status;
        all_same_ = all_same_ && status == statuses_[0];
        has_large_delta_ = has_large_delta_ || 
                           status == PacketStatus::RECEIVED_LARGE_DELTA || 
                           status == PacketStatus::RESERVED;
    }
    return chunk;
}

PacketStatusChunk StatusEncoder::EncodeLast() const {
    if (all_same_) {
        return PacketStatusChunk::RunLength(statuses_[0], size_);
    }
    if (size_ <= PacketStatusChunk::kTwoBitCapacity) {
        return PacketStatusChunk::TwoBitVector(statuses_, size_);
    }
    return PacketStatusChunk::OneBitVector(statuses_, size_);
}

std::vector<PacketStatusChunk> StatusEncoder::Encode(const std::vector<PacketStatus>& statuses) {
    std::vector<PacketStatusChunk> chunks;
    StatusEncoder encoder;
    for (PacketStatus status : statuses) {
        if (!encoder.CanAdd(status)) {
            chunks.push_back(encoder.Emit());
        }
        encoder.Add(status);
    }
    if (!encoder.Empty()) {
        chunks.push_back(encoder.EncodeLast());
    }
    return chunks;
}

} // namespace rtcp
} // namespace rtpcodec
