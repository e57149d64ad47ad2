#ifndef _RTPCODEC_RTCP_COMMON_FEEDBACK_H_
#define _RTPCODEC_RTCP_COMMON_FEEDBACK_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/memory/bit_reader.hpp"
#include "rtpcodec/memory/bit_writer.hpp"
#include "rtpcodec/rtcp/packet_sync.hpp"

namespace rtpcodec {
namespace rtcp {

// The two SSRCs heading every feedback message (RFC 4585 section 6.1).
// Padding is shared with the other RTCP packets.
class RTPCODEC_CPP_EXPORT CommonFeedback : public PacketPadding {
public:
    static constexpr size_t kCommonFeedbackSize = 8;

    CommonFeedback();
    ~CommonFeedback();

    uint32_t sender_ssrc() const { return sender_ssrc_; }
    uint32_t media_ssrc() const { return media_ssrc_; }
    void set_sender_ssrc(uint32_t ssrc) { sender_ssrc_ = ssrc; }
    void set_media_ssrc(uint32_t ssrc) { media_ssrc_ = ssrc; }

protected:
    void ParseCommonFeedback(BitReader& payload);
    void PackCommonFeedbackInto(BitWriter& writer) const;

    bool CommonFeedbackEquals(const CommonFeedback& other) const {
        return sender_ssrc_ == other.sender_ssrc_ && 
               media_ssrc_ == other.media_ssrc_ &&
               PaddingEquals(other);
    }

private:
    uint32_t sender_ssrc_;
    uint32_t media_ssrc_;
};

// RTPFB: Transport layer feedback message.
// RFC4585, Section 6.2
class RTPCODEC_CPP_EXPORT Rtpfb : public CommonFeedback {
public:
    static constexpr uint8_t kPacketType = 205;
};

// PSFB: Payload-specific feedback message.
// RFC 4585, Section 6.3.
class RTPCODEC_CPP_EXPORT Psfb : public CommonFeedback {
public:
    static constexpr uint8_t kPacketType = 206;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
