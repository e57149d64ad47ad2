#ifndef _RTPCODEC_RTCP_RECEIVER_REPORT_H_
#define _RTPCODEC_RTCP_RECEIVER_REPORT_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/rtcp/packet_sync.hpp"
#include "rtpcodec/rtcp/report_block.hpp"

#include <vector>

namespace rtpcodec {
namespace rtcp {

// Receiver report (RR) (RFC 3550 section 6.4.2).
class RTPCODEC_CPP_EXPORT ReceiverReport : public PacketPadding {
public:
    static constexpr uint8_t kPacketType = 201;
    static constexpr size_t kMaxNumberOfReportBlocks = 0x1F;

    ReceiverReport();
    ReceiverReport(const ReceiverReport&);
    ReceiverReport(ReceiverReport&&);
    ReceiverReport& operator=(const ReceiverReport&);
    ReceiverReport& operator=(ReceiverReport&&);
    ~ReceiverReport();

    uint32_t sender_ssrc() const { return sender_ssrc_; }
    void set_sender_ssrc(uint32_t ssrc) { sender_ssrc_ = ssrc; }

    const std::vector<ReportBlock>& report_blocks() const { return report_blocks_; }
    bool AddReportBlock(const ReportBlock& block);
    bool SetReportBlocks(std::vector<ReportBlock> blocks);
    void ClearReportBlocks() { report_blocks_.clear(); }

    HeaderTemplate header_template() const { return HeaderTemplate{kPacketType, std::nullopt}; }
    SerializedBody Serialize() const;
    // `payload` covers the packet content after the common header, padding excluded.
    void Parse(const CommonHeader& header, BitReader& payload);

    bool operator==(const ReceiverReport& other) const;
    bool operator!=(const ReceiverReport& other) const { return !(*this == other); }

private:
    static constexpr size_t kReceiverReportBaseSize = 4;

    uint32_t sender_ssrc_;
    std::vector<ReportBlock> report_blocks_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
