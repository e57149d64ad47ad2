#include "rtpcodec/rtcp/sender_report.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <plog/Log.h>

#include <string>

namespace rtpcodec {
namespace rtcp {

//    Sender report (SR) (RFC 3550).
//     0                   1                   2                   3
//     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |V=2|P|    RC   |   PT=SR=200   |             length            |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  0 |                         SSRC of sender                        |
//    +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
//  4 |              NTP timestamp, most significant word             |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  8 |             NTP timestamp, least significant word             |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// 12 |                         RTP timestamp                         |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// 16 |                     sender's packet count                     |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// 20 |                      sender's octet count                     |
// 24 +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+

SenderReport::SenderReport() 
    : sender_ssrc_(0),
      ntp_seconds_(0),
      ntp_fractions_(0),
      rtp_timestamp_(0),
      sender_packet_count_(0),
      sender_octet_count_(0) {}

SenderReport::SenderReport(const SenderReport&) = default;
SenderReport::SenderReport(SenderReport&&) = default;
SenderReport& SenderReport::operator=(const SenderReport&) = default;
SenderReport& SenderReport::operator=(SenderReport&&) = default;
SenderReport::~SenderReport() = default;

bool SenderReport::AddReportBlock(const ReportBlock& block) {
    if (report_blocks_.size() >= kMaxNumberOfReportBlocks) {
        PLOG_WARNING << "Max report blocks reached.";
        return false;
    }
    report_blocks_.push_back(block);
    return true;
}

bool SenderReport::SetReportBlocks(std::vector<ReportBlock> blocks) {
    if (blocks.size() > kMaxNumberOfReportBlocks) {
        PLOG_WARNING << "Too many report blocks (" << blocks.size() 
                     << ") for sender report.";
        return false;
    }
    report_blocks_ = std::move(blocks);
    return true;
}

SerializedBody SenderReport::Serialize() const {
    BitWriter writer;
    writer.Write<uint32_t>(sender_ssrc_);
    writer.Write<uint32_t>(ntp_seconds_);
    writer.Write<uint32_t>(ntp_fractions_);
    writer.Write<uint32_t>(rtp_timestamp_);
    writer.Write<uint32_t>(sender_packet_count_);
    writer.Write<uint32_t>(sender_octet_count_);
    for (const auto& block : report_blocks_) {
        block.PackInto(writer);
    }
    return SerializedBody{writer.Release(), report_blocks_.size(), padding()};
}

void SenderReport::Parse(const CommonHeader& header, BitReader& payload) {
    const size_t report_block_count = header.count();
    const size_t expected_size = kSenderReportBaseSize + report_block_count * ReportBlock::kFixedReportBlockSize;
    if (payload.RemainingByteCount() < expected_size) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         std::to_string(report_block_count) + " report blocks need " + 
                         std::to_string(expected_size) + " bytes, got " + 
                         std::to_string(payload.RemainingByteCount()));
    }
    sender_ssrc_ = payload.Read<uint32_t>();
    ntp_seconds_ = payload.Read<uint32_t>();
    ntp_fractions_ = payload.Read<uint32_t>();
    rtp_timestamp_ = payload.Read<uint32_t>();
    sender_packet_count_ = payload.Read<uint32_t>();
    sender_octet_count_ = payload.Read<uint32_t>();
    report_blocks_.resize(report_block_count);
    for (auto& block : report_blocks_) {
        block.Parse(payload);
    }
}

bool SenderReport::operator==(const SenderReport& other) const {
    return sender_ssrc_ == other.sender_ssrc_ &&
           ntp_seconds_ == other.ntp_seconds_ &&
           ntp_fractions_ == other.ntp_fractions_ &&
           rtp_timestamp_ == other.rtp_timestamp_ &&
           sender_packet_count_ == other.sender_packet_count_ &&
           sender_octet_count_ == other.sender_octet_count_ &&
           report_blocks_ == other.report_blocks_ &&
           PaddingEquals(other);
}

} // namespace rtcp
} // namespace rtpcodec
