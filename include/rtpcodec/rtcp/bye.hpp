#ifndef _RTPCODEC_RTCP_BYE_H_
#define _RTPCODEC_RTCP_BYE_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/rtcp/packet_sync.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rtpcodec {
namespace rtcp {

// Goodbye (BYE) (RFC 3550 section 6.6).
class RTPCODEC_CPP_EXPORT Bye : public PacketPadding {
public:
    static constexpr uint8_t kPacketType = 203;
    static constexpr size_t kMaxNumberOfSsrcs = 0x1F;
    static constexpr size_t kMaxReasonLength = 0xFF;

    Bye();
    Bye(const Bye&);
    Bye(Bye&&);
    Bye& operator=(const Bye&);
    Bye& operator=(Bye&&);
    ~Bye();

    // The first SSRC is the sender's, 0 when the list is empty.
    uint32_t sender_ssrc() const { return ssrcs_.empty() ? 0 : ssrcs_[0]; }
    void set_sender_ssrc(uint32_t ssrc);
    // Sources leaving besides the sender.
    std::vector<uint32_t> csrcs() const;
    bool set_csrcs(std::vector<uint32_t> csrcs);

    const std::vector<uint32_t>& ssrcs() const { return ssrcs_; }
    bool set_ssrcs(std::vector<uint32_t> ssrcs);

    const std::string& reason() const { return reason_; }
    bool set_reason(std::string reason);

    HeaderTemplate header_template() const { return HeaderTemplate{kPacketType, std::nullopt}; }
    SerializedBody Serialize() const;
    void Parse(const CommonHeader& header, BitReader& payload);

    bool operator==(const Bye& other) const;
    bool operator!=(const Bye& other) const { return !(*this == other); }

private:
    std::vector<uint32_t> ssrcs_;
    std::string reason_;
    // Alignment after a parsed reason when zeros would not give it back:
    // bytes other than zero, or the empty buffer of an empty reason.
    std::optional<BinaryBuffer> reason_padding_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
