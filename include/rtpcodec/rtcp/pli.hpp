#ifndef _RTPCODEC_RTCP_PLI_H_
#define _RTPCODEC_RTCP_PLI_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/rtcp/common_feedback.hpp"
#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/rtcp/packet_sync.hpp"

namespace rtpcodec {
namespace rtcp {

// Picture loss indication (PLI) (RFC 4585 section 6.3.1), it has no FCI.
class RTPCODEC_CPP_EXPORT Pli : public Psfb {
public:
    static constexpr uint8_t kFeedbackMessageType = 1;

    Pli();
    ~Pli();

    HeaderTemplate header_template() const { return HeaderTemplate{kPacketType, kFeedbackMessageType}; }
    SerializedBody Serialize() const;
    void Parse(const CommonHeader& header, BitReader& payload);

    bool operator==(const Pli& other) const { return CommonFeedbackEquals(other); }
    bool operator!=(const Pli& other) const { return !(*this == other); }
};

} // namespace rtcp
} // namespace rtpcodec

#endif
