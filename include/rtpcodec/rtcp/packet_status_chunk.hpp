#ifndef _RTPCODEC_RTCP_PACKET_STATUS_CHUNK_H_
#define _RTPCODEC_RTCP_PACKET_STATUS_CHUNK_H_

#include "rtpcodec/base/defines.hpp"

#include <ostream>
#include <vector>

namespace rtpcodec {
namespace rtcp {

// Packet status symbols of transport-wide feedback. The value is the
// size in bytes of the receive delta that follows the chunks.
enum class PacketStatus : uint8_t {
    NOT_RECEIVED = 0,
    RECEIVED_SMALL_DELTA = 1,
    RECEIVED_LARGE_DELTA = 2,
    RESERVED = 3
};

RTPCODEC_CPP_EXPORT std::ostream& operator<<(std::ostream& out, PacketStatus status);

// A 16-bit packet status chunk.
class RTPCODEC_CPP_EXPORT PacketStatusChunk {
public:
    enum class Type {
        RUN_LENGTH,
        ONE_BIT_VECTOR,
        TWO_BIT_VECTOR
    };

    static constexpr size_t kMaxRunLength = 0x1FFF;
    static constexpr size_t kOneBitCapacity = 14;
    static constexpr size_t kTwoBitCapacity = 7;

    // The factories throw CodecError(MALFORMED_HEADER) for symbols the
    // chunk can not carry.
    static PacketStatusChunk RunLength(PacketStatus status, size_t run_length);
    // Up to 14 symbols, NOT_RECEIVED and RECEIVED_SMALL_DELTA only.
    static PacketStatusChunk OneBitVector(const PacketStatus* statuses, size_t count);
    // Up to 7 symbols.
    static PacketStatusChunk TwoBitVector(const PacketStatus* statuses, size_t count);
    static PacketStatusChunk Decode(uint16_t raw) { return PacketStatusChunk(raw); }

    Type type() const;
    uint16_t raw() const { return raw_; }
    // Symbols the chunk describes, unused vector slots included.
    size_t symbol_count() const;

    // Appends at most `max_count` symbols, the ones beyond describe no packet.
    void AppendTo(std::vector<PacketStatus>* statuses, size_t max_count) const;

    bool operator==(const PacketStatusChunk& other) const { return raw_ == other.raw_; }
    bool operator!=(const PacketStatusChunk& other) const { return raw_ != other.raw_; }

private:
    explicit PacketStatusChunk(uint16_t raw) : raw_(raw) {}

    uint16_t raw_;
};

// Greedy chunk encoder. Statuses are added one at a time, a chunk is
// emitted once the pending statuses can not take another one.
class RTPCODEC_CPP_EXPORT StatusEncoder {
public:
    StatusEncoder();

    bool Empty() const { return size_ == 0; }
    void Clear();
    // Whether the pending statuses still fit a single chunk with `status` added.
    bool CanAdd(PacketStatus status) const;
    // Requires CanAdd(status).
    void Add(PacketStatus status);

    // Encodes the largest possible chunk from the front of the pending
    // statuses and removes them. Requires a status that CanAdd() rejects.
    PacketStatusChunk Emit();
    // Encodes all pending statuses into a single chunk.
    PacketStatusChunk EncodeLast() const;

    // Encodes `statuses` as a whole.
    static std::vector<PacketStatusChunk> Encode(const std::vector<PacketStatus>& statuses);

private:
    static constexpr size_t kMaxVectorCapacity = PacketStatusChunk::kOneBitCapacity;

    PacketStatus statuses_[kMaxVectorCapacity];
    size_t size_;
    bool all_same_;
    bool has_large_delta_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
