#include "rtpcodec/rtcp/receiver_report.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <plog/Log.h>

#include <string>

namespace rtpcodec {
namespace rtcp {

// RTCP receiver report (RFC 3550).
//
//   0                   1                   2                   3
//   0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |V=2|P|    RC   |   PT=RR=201   |             length            |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                     SSRC of packet sender                     |
//  +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
//  |                         report block(s)                       |
//  |                            ....                               |

ReceiverReport::ReceiverReport() 
    : sender_ssrc_(0) {}

ReceiverReport::ReceiverReport(const ReceiverReport&) = default;
ReceiverReport::ReceiverReport(ReceiverReport&&) = default;
ReceiverReport& ReceiverReport::operator=(const ReceiverReport&) = default;
ReceiverReport& ReceiverReport::operator=(ReceiverReport&&) = default;
ReceiverReport::~ReceiverReport() = default;

bool ReceiverReport::AddReportBlock(const ReportBlock& block) {
    if (report_blocks_.size() >= kMaxNumberOfReportBlocks) {
        PLOG_WARNING << "Max report blocks reached.";
        return false;
    }
    report_blocks_.push_back(block);
    return true;
}

bool ReceiverReport::SetReportBlocks(std::vector<ReportBlock> blocks) {
    if (blocks.size() > kMaxNumberOfReportBlocks) {
        PLOG_WARNING << "Too many report blocks (" << blocks.size() 
                     << ") for receiver report.";
        return false;
    }
    report_blocks_ = std::move(blocks);
    return true;
}

SerializedBody ReceiverReport::Serialize() const {
    BitWriter writer;
    writer.Write<uint32_t>(sender_ssrc_);
    for (const auto& block : report_blocks_) {
        block.PackInto(writer);
    }
    return SerializedBody{writer.Release(), report_blocks_.size(), padding()};
}

void ReceiverReport::Parse(const CommonHeader& header, BitReader& payload) {
    const size_t report_block_count = header.count();
    const size_t expected_size = kReceiverReportBaseSize + report_block_count * ReportBlock::kFixedReportBlockSize;
    if (payload.RemainingByteCount() < expected_size) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         std::to_string(report_block_count) + " report blocks need " + 
                         std::to_string(expected_size) + " bytes, got " + 
                         std::to_string(payload.RemainingByteCount()));
    }
    sender_ssrc_ = payload.Read<uint32_t>();
    report_blocks_.resize(report_block_count);
    for (auto& block : report_blocks_) {
        block.Parse(payload);
    }
}

bool ReceiverReport::operator==(const ReceiverReport& other) const {
    return sender_ssrc_ == other.sender_ssrc_ && 
           report_blocks_ == other.report_blocks_ &&
           PaddingEquals(other);
}

} // namespace rtcp
} // namespace rtpcodec
