#ifndef _RTPCODEC_RTCP_TRANSPORT_FEEDBACK_H_
#define _RTPCODEC_RTCP_TRANSPORT_FEEDBACK_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/rtcp/common_feedback.hpp"
#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/rtcp/packet_status_chunk.hpp"
#include "rtpcodec/rtcp/packet_sync.hpp"

#include <vector>

namespace rtpcodec {
namespace rtcp {

// Transport-wide congestion control feedback
// (draft-holmer-rmcat-transport-wide-cc-extensions-01).
class RTPCODEC_CPP_EXPORT TransportFeedback : public Rtpfb {
public:
    class ReceivedPacket {
    public:
        ReceivedPacket(uint16_t sequence_number, int16_t delta_ticks)
            : sequence_number_(sequence_number),
              delta_ticks_(delta_ticks) {}

        uint16_t sequence_number() const { return sequence_number_; }
        int16_t delta_ticks() const { return delta_ticks_; }
        int32_t delta_us() const { return delta_ticks_ * kDeltaScaleFactor; }

        bool operator==(const ReceivedPacket& other) const {
            return sequence_number_ == other.sequence_number_ && delta_ticks_ == other.delta_ticks_;
        }

    private:
        uint16_t sequence_number_;
        int16_t delta_ticks_;
    };

    static constexpr uint8_t kFeedbackMessageType = 15;
    // Receive deltas are in multiples of 250 us.
    static constexpr int kDeltaScaleFactor = 250;
    // The reference time is in multiples of 64 ms.
    static constexpr int64_t kBaseScaleFactorUs = 64000;
    // Maximum number of packets (including missing) TransportFeedback can report.
    static constexpr size_t kMaxReportedPackets = 0xFFFF;

    TransportFeedback();
    TransportFeedback(const TransportFeedback&);
    TransportFeedback(TransportFeedback&&);
    TransportFeedback& operator=(const TransportFeedback&);
    TransportFeedback& operator=(TransportFeedback&&);
    ~TransportFeedback();

    // Starts a new status list. `reference_time` is a signed 24-bit value
    // in 64 ms units.
    void SetBase(uint16_t base_sequence, int32_t reference_time);
    void set_feedback_sequence_number(uint8_t feedback_sequence) { feedback_seq_ = feedback_sequence; }

    // Both require increasing sequence numbers (modulo wrap around) and
    // mark the packets skipped since the last one as not received.
    bool AddReceivedPacket(uint16_t sequence_number, int16_t delta_ticks);
    bool AddNotReceivedPacket(uint16_t sequence_number);

    uint16_t base_sequence_number() const { return base_seq_num_; }
    int32_t reference_time() const { return reference_time_; }
    int64_t base_time_us() const { return reference_time_ * kBaseScaleFactorUs; }
    uint8_t feedback_sequence_number() const { return feedback_seq_; }
    // Number of packets (including missing) this feedback describes.
    size_t packet_status_count() const { return statuses_.size(); }
    const std::vector<PacketStatus>& packet_statuses() const { return statuses_; }
    const std::vector<ReceivedPacket>& received_packets() const { return received_packets_; }

    HeaderTemplate header_template() const { return HeaderTemplate{kPacketType, kFeedbackMessageType}; }
    // The body ends with zero padding to a word, unless a signaled
    // padding completes it. Throws CodecError(MALFORMED_HEADER) for an
    // empty status list.
    SerializedBody Serialize() const;
    void Parse(const CommonHeader& header, BitReader& payload);

    bool operator==(const TransportFeedback& other) const;
    bool operator!=(const TransportFeedback& other) const { return !(*this == other); }

private:
    static constexpr size_t kFeedbackHeaderSize = 8;

    // Marks the packets up to, not including, `sequence_number` as not received.
    bool FillGapUpTo(uint16_t sequence_number);
    void ParseDeltas(BitReader& payload);

private:
    uint16_t base_seq_num_;
    int32_t reference_time_;
    uint8_t feedback_seq_;
    std::vector<PacketStatus> statuses_;
    std::vector<ReceivedPacket> received_packets_;
    // Parsed chunks the encoder would not produce from `statuses_`, and
    // non-zero bytes found in place of the zero padding. Both are
    // dropped once the statuses change.
    std::vector<PacketStatusChunk> chunks_;
    BinaryBuffer bare_padding_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
