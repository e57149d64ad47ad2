#include "rtpcodec/rtcp/common_feedback.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <string>

namespace rtpcodec {
namespace rtcp {

//    0                   1                   2                   3
//    0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//   |V=2|P|   FMT   |       PT      |          length               |
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// 0 |                  SSRC of packet sender                        |
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// 4 |                  SSRC of media source                         |
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//   :            Feedback Control Information (FCI)                 :
//   :                                                               :

CommonFeedback::CommonFeedback() 
    : sender_ssrc_(0),
      media_ssrc_(0) {}

CommonFeedback::~CommonFeedback() = default;

void CommonFeedback::ParseCommonFeedback(BitReader& payload) {
    if (payload.RemainingByteCount() < kCommonFeedbackSize) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Payload of " + std::to_string(payload.RemainingByteCount()) + 
                         " bytes is too small for a feedback message.");
    }
    sender_ssrc_ = payload.Read<uint32_t>();
    media_ssrc_ = payload.Read<uint32_t>();
}

void CommonFeedback::PackCommonFeedbackInto(BitWriter& writer) const {
    writer.Write<uint32_t>(sender_ssrc_);
    writer.Write<uint32_t>(media_ssrc_);
}

} // namespace rtcp
} // namespace rtpcodec
