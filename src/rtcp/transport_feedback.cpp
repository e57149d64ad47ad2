#include "rtpcodec/rtcp/transport_feedback.hpp"
#include "rtpcodec/base/codec_error.hpp"
#include "rtpcodec/memory/padding.hpp"

#include <plog/Log.h>

#include <string>

namespace rtpcodec {
namespace rtcp {
namespace {

// Whether `seq` comes after `prev` in the wrapping 16-bit sequence space.
bool AheadOf(uint16_t seq, uint16_t prev) {
    return seq != prev && static_cast<uint16_t>(seq - prev) < 0x8000;
}

} // namespace

//    Message format
//
//     0                   1                   2                   3
//     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |V=2|P|  FMT=15 |    PT=205     |           length              |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  0 |                     SSRC of packet sender                     |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  4 |                      SSRC of media source                     |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  8 |      base sequence number     |      packet status count      |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// 12 |                 reference time                | fb pkt. count |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// 16 |          packet chunk         |         packet chunk          |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    .                                                               .
//    .                                                               .
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |         packet chunk          |  recv delta   |  recv delta   |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    .                                                               .
//    .                                                               .
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |           recv delta          |  recv delta   | zero padding  |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+

TransportFeedback::TransportFeedback() 
    : base_seq_num_(0),
      reference_time_(0),
      feedback_seq_(0) {}

TransportFeedback::TransportFeedback(const TransportFeedback&) = default;
TransportFeedback::TransportFeedback(TransportFeedback&&) = default;
TransportFeedback& TransportFeedback::operator=(const TransportFeedback&) = default;
TransportFeedback& TransportFeedback::operator=(TransportFeedback&&) = default;
TransportFeedback::~TransportFeedback() = default;

void TransportFeedback::SetBase(uint16_t base_sequence, int32_t reference_time) {
    base_seq_num_ = base_sequence;
    // Keeps the low 24 bits, sign extended.
    reference_time_ = static_cast<int32_t>(static_cast<uint32_t>(reference_time) << 8) >> 8;
    statuses_.clear();
    received_packets_.clear();
    chunks_.clear();
    bare_padding_.clear();
}

bool TransportFeedback::AddReceivedPacket(uint16_t sequence_number, int16_t delta_ticks) {
    if (!FillGapUpTo(sequence_number)) {
        return false;
    }
    const PacketStatus status = (delta_ticks >= 0 && delta_ticks <= 0xFF) 
                                ? PacketStatus::RECEIVED_SMALL_DELTA 
                                : PacketStatus::RECEIVED_LARGE_DELTA;
    statuses_.push_back(status);
    received_packets_.emplace_back(sequence_number, delta_ticks);
    return true;
}

bool TransportFeedback::AddNotReceivedPacket(uint16_t sequence_number) {
    if (!FillGapUpTo(sequence_number)) {
        return false;
    }
    statuses_.push_back(PacketStatus::NOT_RECEIVED);
    return true;
}

SerializedBody TransportFeedback::Serialize() const {
    if (statuses_.empty()) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, "Empty feedback messages not allowed.");
    }
    BitWriter writer;
    PackCommonFeedbackInto(writer);
    writer.Write<uint16_t>(base_seq_num_);
    writer.Write<uint16_t>(static_cast<uint16_t>(statuses_.size()));
    writer.Write<int32_t, 3>(reference_time_);
    writer.Write<uint8_t>(feedback_seq_);

    const std::vector<PacketStatusChunk> chunks = chunks_.empty() ? StatusEncoder::Encode(statuses_) 
                                                                  : chunks_;
    for (const auto& chunk : chunks) {
        writer.Write<uint16_t>(chunk.raw());
    }

    // The status decides the size of a delta.
    auto packet = received_packets_.begin();
    for (PacketStatus status : statuses_) {
        if (status == PacketStatus::RECEIVED_SMALL_DELTA) {
            writer.Write<uint8_t>(static_cast<uint8_t>((packet++)->delta_ticks()));
        } else if (status == PacketStatus::RECEIVED_LARGE_DELTA) {
            writer.Write<int16_t>((packet++)->delta_ticks());
        }
    }

    const size_t bare_padding_size = padding::AlignmentPaddingFor(writer.size() + padding_size());
    padding::WritePaddingBytes(writer, bare_padding_size, bare_padding_);
    return SerializedBody{writer.Release(), 0, padding()};
}

void TransportFeedback::Parse(const CommonHeader& /*header*/, BitReader& payload) {
    ParseCommonFeedback(payload);
    if (payload.RemainingByteCount() < kFeedbackHeaderSize) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Payload of " + std::to_string(payload.RemainingByteCount() + kCommonFeedbackSize) + 
                         " bytes is too small for a transport feedback.");
    }
    base_seq_num_ = payload.Read<uint16_t>();
    const uint16_t status_count = payload.Read<uint16_t>();
    reference_time_ = payload.Read<int32_t, 3>();
    feedback_seq_ = payload.Read<uint8_t>();
    if (status_count == 0) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, "Empty feedback messages not allowed.");
    }

    std::vector<PacketStatus> statuses;
    std::vector<PacketStatusChunk> chunks;
    statuses.reserve(status_count);
    while (statuses.size() < status_count) {
        chunks.push_back(PacketStatusChunk::Decode(payload.Read<uint16_t>()));
        chunks.back().AppendTo(&statuses, status_count - statuses.size());
    }
    statuses_ = std::move(statuses);
    ParseDeltas(payload);

    if (chunks == StatusEncoder::Encode(statuses_)) {
        chunks.clear();
    }
    chunks_ = std::move(chunks);

    // Zero padding up to the signaled one, which is already cut off.
    // More than a word is left for the caller to reject.
    bare_padding_.clear();
    if (payload.RemainingByteCount() < padding::kAlignment) {
        bare_padding_ = padding::ReadPaddingBytes(payload, payload.RemainingByteCount());
    }
}

bool TransportFeedback::operator==(const TransportFeedback& other) const {
    return CommonFeedbackEquals(other) &&
           base_seq_num_ == other.base_seq_num_ &&
           reference_time_ == other.reference_time_ &&
           feedback_seq_ == other.feedback_seq_ &&
           statuses_ == other.statuses_ &&
           received_packets_ == other.received_packets_ &&
           chunks_ == other.chunks_ &&
           bare_padding_ == other.bare_padding_;
}

// Private methods
bool TransportFeedback::FillGapUpTo(uint16_t sequence_number) {
    uint16_t next_seq_num = static_cast<uint16_t>(base_seq_num_ + statuses_.size());
    if (!statuses_.empty() && sequence_number != next_seq_num) {
        const uint16_t last_seq_num = next_seq_num - 1;
        if (!AheadOf(sequence_number, last_seq_num)) {
            PLOG_WARNING << "Sequence number " << sequence_number 
                         << " is not ahead of the last reported " << last_seq_num;
            return false;
        }
    } else if (statuses_.empty() && sequence_number != base_seq_num_ && 
               !AheadOf(sequence_number, base_seq_num_)) {
        PLOG_WARNING << "Sequence number " << sequence_number 
                     << " is before the base sequence number " << base_seq_num_;
        return false;
    }
    const size_t gap = static_cast<uint16_t>(sequence_number - next_seq_num);
    if (statuses_.size() + gap + 1 > kMaxReportedPackets) {
        PLOG_WARNING << "Too many packets for a transport feedback.";
        return false;
    }
    statuses_.insert(statuses_.end(), gap, PacketStatus::NOT_RECEIVED);
    chunks_.clear();
    bare_padding_.clear();
    return true;
}

void TransportFeedback::ParseDeltas(BitReader& payload) {
    std::vector<ReceivedPacket> received_packets;
    uint16_t seq_num = base_seq_num_;
    for (PacketStatus status : statuses_) {
        switch (status) {
        case PacketStatus::NOT_RECEIVED:
            break;
        case PacketStatus::RECEIVED_SMALL_DELTA:
            received_packets.emplace_back(seq_num, payload.Read<uint8_t>());
            break;
        case PacketStatus::RECEIVED_LARGE_DELTA:
            received_packets.emplace_back(seq_num, payload.Read<int16_t>());
            break;
        case PacketStatus::RESERVED:
            throw CodecError(ErrorKind::MALFORMED_HEADER, 
                             "Invalid delta size for sequence number " + std::to_string(seq_num));
        }
        ++seq_num;
    }
    received_packets_ = std::move(received_packets);
}

} // namespace rtcp
} // namespace rtpcodec
