#ifndef _RTPCODEC_RTCP_FIR_H_
#define _RTPCODEC_RTCP_FIR_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/rtcp/common_feedback.hpp"
#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/rtcp/packet_sync.hpp"

#include <vector>

namespace rtpcodec {
namespace rtcp {

// Full intra request (FIR) (RFC 5104 section 4.3.1).
// The media source SSRC is not used and stays 0 unless set, the requests
// name their SSRCs.
class RTPCODEC_CPP_EXPORT Fir : public Psfb {
public:
    static constexpr uint8_t kFeedbackMessageType = 4;

    struct Request {
        Request() : ssrc(0), seq_nr(0), reserved(0) {}
        Request(uint32_t ssrc, uint8_t seq_nr) : ssrc(ssrc), seq_nr(seq_nr), reserved(0) {}

        bool operator==(const Request& other) const {
            return ssrc == other.ssrc && seq_nr == other.seq_nr && reserved == other.reserved;
        }

        uint32_t ssrc;
        uint8_t seq_nr;
        // 24 bits sent as 0, kept as received.
        uint32_t reserved;
    };

    Fir();
    Fir(const Fir&);
    ~Fir();

    const std::vector<Request>& requests() const { return requests_; }
    void AddRequest(uint32_t ssrc, uint8_t seq_nr) { requests_.emplace_back(ssrc, seq_nr); }

    HeaderTemplate header_template() const { return HeaderTemplate{kPacketType, kFeedbackMessageType}; }
    // Throws CodecError(MALFORMED_HEADER) without requests.
    SerializedBody Serialize() const;
    void Parse(const CommonHeader& header, BitReader& payload);

    bool operator==(const Fir& other) const;
    bool operator!=(const Fir& other) const { return !(*this == other); }

private:
    static constexpr size_t kFciSize = 8;

    std::vector<Request> requests_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
