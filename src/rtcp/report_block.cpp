#include "rtpcodec/rtcp/report_block.hpp"

#include <plog/Log.h>

namespace rtpcodec {
namespace rtcp {

// RTCP report block (RFC 3550).
// 0                   1                   2                   3
// 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
// |                 SSRC_1 (SSRC of first source)                 |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// | fraction lost |       cumulative number of packets lost       |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |           extended highest sequence number received           |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                      interarrival jitter                      |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                         last SR (LSR)                         |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                   delay since last SR (DLSR)                  |
// +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+

ReportBlock::ReportBlock() 
    : source_ssrc_(0),
      fraction_lost_(0),
      cumulative_packet_lost_(0),
      extended_highest_seq_num_(0),
      jitter_(0),
      last_sr_ntp_timestamp_(0),
      delay_since_last_sr_(0) {}

ReportBlock::~ReportBlock() = default;

bool ReportBlock::set_cumulative_packet_lost(int32_t cumulative_lost) {
    if (cumulative_lost >= (1 << 23) || cumulative_lost < -(1 << 23)) {
        PLOG_WARNING << "Cumulative lost " << cumulative_lost << " does not fit into a report block.";
        return false;
    }
    cumulative_packet_lost_ = cumulative_lost;
    return true;
}

void ReportBlock::Parse(BitReader& reader) {
    source_ssrc_ = reader.Read<uint32_t>();
    fraction_lost_ = reader.Read<uint8_t>();
    cumulative_packet_lost_ = reader.Read<int32_t, 3>();
    extended_highest_seq_num_ = reader.Read<uint32_t>();
    jitter_ = reader.Read<uint32_t>();
    last_sr_ntp_timestamp_ = reader.Read<uint32_t>();
    delay_since_last_sr_ = reader.Read<uint32_t>();
}

void ReportBlock::PackInto(BitWriter& writer) const {
    writer.Write<uint32_t>(source_ssrc_);
    writer.Write<uint8_t>(fraction_lost_);
    writer.Write<int32_t, 3>(cumulative_packet_lost_);
    writer.Write<uint32_t>(extended_highest_seq_num_);
    writer.Write<uint32_t>(jitter_);
    writer.Write<uint32_t>(last_sr_ntp_timestamp_);
    writer.Write<uint32_t>(delay_since_last_sr_);
}

bool ReportBlock::operator==(const ReportBlock& other) const {
    return source_ssrc_ == other.source_ssrc_ &&
           fraction_lost_ == other.fraction_lost_ &&
           cumulative_packet_lost_ == other.cumulative_packet_lost_ &&
           extended_highest_seq_num_ == other.extended_highest_seq_num_ &&
           jitter_ == other.jitter_ &&
           last_sr_ntp_timestamp_ == other.last_sr_ntp_timestamp_ &&
           delay_since_last_sr_ == other.delay_since_last_sr_;
}

} // namespace rtcp
} // namespace rtpcodec
