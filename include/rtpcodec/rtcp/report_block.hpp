#ifndef _RTPCODEC_RTCP_REPORT_BLOCK_H_
#define _RTPCODEC_RTCP_REPORT_BLOCK_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/memory/bit_reader.hpp"
#include "rtpcodec/memory/bit_writer.hpp"

namespace rtpcodec {
namespace rtcp {

// A reception report block of SR and RR packets (RFC 3550 section 6.4.1).
class RTPCODEC_CPP_EXPORT ReportBlock {
public:
    static constexpr size_t kFixedReportBlockSize = 24;

    ReportBlock();
    ~ReportBlock();

    uint32_t source_ssrc() const { return source_ssrc_; }
    uint8_t fraction_lost() const { return fraction_lost_; }
    int32_t cumulative_packet_lost() const { return cumulative_packet_lost_; }
    uint16_t sequence_num_cycles() const { return static_cast<uint16_t>(extended_highest_seq_num_ >> 16); }
    uint16_t highest_seq_num() const { return static_cast<uint16_t>(extended_highest_seq_num_ & 0xFFFF); }
    uint32_t extended_highest_seq_num() const { return extended_highest_seq_num_; }
    uint32_t jitter() const { return jitter_; }
    uint32_t last_sr_ntp_timestamp() const { return last_sr_ntp_timestamp_; }
    uint32_t delay_since_last_sr() const { return delay_since_last_sr_; }

    void set_source_ssrc(uint32_t ssrc) { source_ssrc_ = ssrc; }
    void set_fraction_lost(uint8_t fraction_lost) { fraction_lost_ = fraction_lost; }
    // Rejects values outside the signed 24-bit range.
    bool set_cumulative_packet_lost(int32_t cumulative_lost);
    void set_extended_highest_seq_num(uint32_t extended_seq_num) { extended_highest_seq_num_ = extended_seq_num; }
    void set_jitter(uint32_t jitter) { jitter_ = jitter; }
    void set_last_sr_ntp_timestamp(uint32_t last_sr_ntp_timestamp) { last_sr_ntp_timestamp_ = last_sr_ntp_timestamp; }
    void set_delay_since_last_sr(uint32_t delay_since_last_sr) { delay_since_last_sr_ = delay_since_last_sr; }

    void Parse(BitReader& reader);
    void PackInto(BitWriter& writer) const;

    bool operator==(const ReportBlock& other) const;
    bool operator!=(const ReportBlock& other) const { return !(*this == other); }

private:
    uint32_t source_ssrc_;
    uint8_t fraction_lost_;
    // Signed 24 bits on the wire.
    int32_t cumulative_packet_lost_;
    uint32_t extended_highest_seq_num_;
    uint32_t jitter_;
    // The middle 32 bits of the NTP timestamp of the last SR received.
    uint32_t last_sr_ntp_timestamp_;
    // In units of 1/65536 seconds.
    uint32_t delay_since_last_sr_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
