#ifndef _RTPCODEC_RTCP_NACK_H_
#define _RTPCODEC_RTCP_NACK_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/rtcp/common_feedback.hpp"
#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/rtcp/packet_sync.hpp"

#include <vector>

namespace rtpcodec {
namespace rtcp {

// Generic negative acknowledgements, RFC 4585, section 6.2.1
class RTPCODEC_CPP_EXPORT Nack : public Rtpfb {
public:
    static constexpr uint8_t kFeedbackMessageType = 1;

    // A lost packet id and a bitmask of losses among the 16 packets after it.
    struct FciItem {
        uint16_t first_pid = 0;
        uint16_t bitmask = 0;

        bool operator==(const FciItem& other) const {
            return first_pid == other.first_pid && bitmask == other.bitmask;
        }
    };

    Nack();
    Nack(const Nack&);
    ~Nack();

    // Lost sequence numbers in the order the items carry them.
    std::vector<uint16_t> packet_ids() const;
    // Packs `nack_list` into as few items as possible, the ids are
    // expected in increasing order (modulo wrap around).
    void set_packet_ids(const std::vector<uint16_t>& nack_list);

    const std::vector<FciItem>& fci_items() const { return fci_items_; }

    HeaderTemplate header_template() const { return HeaderTemplate{kPacketType, kFeedbackMessageType}; }
    // Throws CodecError(MALFORMED_HEADER) without any lost packet.
    SerializedBody Serialize() const;
    void Parse(const CommonHeader& header, BitReader& payload);

    bool operator==(const Nack& other) const;
    bool operator!=(const Nack& other) const { return !(*this == other); }

private:
    static constexpr size_t kFciItemSize = 4;

    std::vector<FciItem> fci_items_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
