#ifndef _RTPCODEC_RTCP_SENDER_REPORT_H_
#define _RTPCODEC_RTCP_SENDER_REPORT_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/rtcp/packet_sync.hpp"
#include "rtpcodec/rtcp/report_block.hpp"

#include <vector>

namespace rtpcodec {
namespace rtcp {

// Sender report (SR) (RFC 3550 section 6.4.1).
class RTPCODEC_CPP_EXPORT SenderReport : public PacketPadding {
public:
    static constexpr uint8_t kPacketType = 200;
    static constexpr size_t kMaxNumberOfReportBlocks = 0x1F;

    SenderReport();
    SenderReport(const SenderReport&);
    SenderReport(SenderReport&&);
    SenderReport& operator=(const SenderReport&);
    SenderReport& operator=(SenderReport&&);
    ~SenderReport();

    uint32_t sender_ssrc() const { return sender_ssrc_; }
    // NTP timestamp, seconds in the most significant word.
    uint32_t ntp_seconds() const { return ntp_seconds_; }
    uint32_t ntp_fractions() const { return ntp_fractions_; }
    uint32_t rtp_timestamp() const { return rtp_timestamp_; }
    uint32_t sender_packet_count() const { return sender_packet_count_; }
    uint32_t sender_octet_count() const { return sender_octet_count_; }

    void set_sender_ssrc(uint32_t ssrc) { sender_ssrc_ = ssrc; }
    void set_ntp(uint32_t seconds, uint32_t fractions) { ntp_seconds_ = seconds; ntp_fractions_ = fractions; }
    void set_rtp_timestamp(uint32_t rtp_timestamp) { rtp_timestamp_ = rtp_timestamp; }
    void set_sender_packet_count(uint32_t packet_count) { sender_packet_count_ = packet_count; }
    void set_sender_octet_count(uint32_t octet_count) { sender_octet_count_ = octet_count; }

    const std::vector<ReportBlock>& report_blocks() const { return report_blocks_; }
    bool AddReportBlock(const ReportBlock& block);
    bool SetReportBlocks(std::vector<ReportBlock> blocks);
    void ClearReportBlocks() { report_blocks_.clear(); }

    HeaderTemplate header_template() const { return HeaderTemplate{kPacketType, std::nullopt}; }
    SerializedBody Serialize() const;
    void Parse(const CommonHeader& header, BitReader& payload);

    bool operator==(const SenderReport& other) const;
    bool operator!=(const SenderReport& other) const { return !(*this == other); }

private:
    // Sender SSRC and sender info.
    static constexpr size_t kSenderReportBaseSize = 24;

    uint32_t sender_ssrc_;
    uint32_t ntp_seconds_;
    uint32_t ntp_fractions_;
    uint32_t rtp_timestamp_;
    uint32_t sender_packet_count_;
    uint32_t sender_octet_count_;
    std::vector<ReportBlock> report_blocks_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
