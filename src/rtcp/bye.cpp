#include "rtpcodec/rtcp/bye.hpp"
#include "rtpcodec/base/codec_error.hpp"
#include "rtpcodec/memory/padding.hpp"

#include <plog/Log.h>

#include <string>

namespace rtpcodec {
namespace rtcp {

// Bye packet (BYE) (RFC 3550).
//
//        0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//       +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//       |V=2|P|    SC   |   PT=BYE=203  |             length            |
//       +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//       |                           SSRC/CSRC                           |
//       +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//       :                              ...                              :
//       +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
// (opt) |     length    |               reason for leaving            ...
//       +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+

Bye::Bye() = default;
Bye::Bye(const Bye&) = default;
Bye::Bye(Bye&&) = default;
Bye& Bye::operator=(const Bye&) = default;
Bye& Bye::operator=(Bye&&) = default;
Bye::~Bye() = default;

void Bye::set_sender_ssrc(uint32_t ssrc) {
    if (ssrcs_.empty()) {
        ssrcs_.push_back(ssrc);
    } else {
        ssrcs_[0] = ssrc;
    }
}

std::vector<uint32_t> Bye::csrcs() const {
    if (ssrcs_.empty()) {
        return {};
    }
    return std::vector<uint32_t>(ssrcs_.begin() + 1, ssrcs_.end());
}

bool Bye::set_csrcs(std::vector<uint32_t> csrcs) {
    // First item is sender SSRC.
    if (csrcs.size() > kMaxNumberOfSsrcs - 1) {
        PLOG_WARNING << "Too many CSRCs for Bye packet.";
        return false;
    }
    const uint32_t sender_ssrc = this->sender_ssrc();
    ssrcs_ = std::move(csrcs);
    ssrcs_.insert(ssrcs_.begin(), sender_ssrc);
    return true;
}

bool Bye::set_ssrcs(std::vector<uint32_t> ssrcs) {
    if (ssrcs.size() > kMaxNumberOfSsrcs) {
        PLOG_WARNING << "Too many SSRCs for Bye packet.";
        return false;
    }
    ssrcs_ = std::move(ssrcs);
    return true;
}

bool Bye::set_reason(std::string reason) {
    if (reason.size() > kMaxReasonLength) {
        PLOG_WARNING << "Reason of " << reason.size() << " bytes is too long for Bye packet.";
        return false;
    }
    reason_ = std::move(reason);
    reason_padding_.reset();
    return true;
}

SerializedBody Bye::Serialize() const {
    BitWriter writer;
    for (uint32_t ssrc : ssrcs_) {
        writer.Write<uint32_t>(ssrc);
    }
    if (!reason_.empty() || reason_padding_) {
        const size_t reason_begin = writer.BitPosition();
        writer.Write<uint8_t>(static_cast<uint8_t>(reason_.size()));
        writer.WriteBytes(reinterpret_cast<const uint8_t*>(reason_.data()), reason_.size());
        padding::WriteAlignmentPadding(writer, reason_begin, 
                                       reason_padding_ ? ArrayView<const uint8_t>(*reason_padding_)
                                                       : ArrayView<const uint8_t>());
    }
    return SerializedBody{writer.Release(), ssrcs_.size(), padding()};
}

void Bye::Parse(const CommonHeader& header, BitReader& payload) {
    const size_t src_count = header.count();
    if (payload.RemainingByteCount() < 4 * src_count) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Packet is too small to contain the " + std::to_string(src_count) + 
                         " SSRCs it promises to have.");
    }
    std::vector<uint32_t> ssrcs(src_count);
    for (auto& ssrc : ssrcs) {
        ssrc = payload.Read<uint32_t>();
    }
    std::string reason;
    std::optional<BinaryBuffer> reason_padding;
    if (payload.RemainingByteCount() > 0) {
        const size_t reason_begin = payload.BitPosition();
        const uint8_t reason_length = payload.Read<uint8_t>();
        if (reason_length > payload.RemainingByteCount()) {
            throw CodecError(ErrorKind::MALFORMED_HEADER, 
                             "Invalid reason length: " + std::to_string(reason_length));
        }
        BinaryBuffer text = payload.ReadBytes(reason_length);
        reason.assign(text.begin(), text.end());
        BinaryBuffer kept = padding::ReadAlignmentPadding(payload, reason_begin);
        if (!kept.empty() || reason.empty()) {
            reason_padding = std::move(kept);
        }
    }
    ssrcs_ = std::move(ssrcs);
    reason_ = std::move(reason);
    reason_padding_ = std::move(reason_padding);
}

bool Bye::operator==(const Bye& other) const {
    return ssrcs_ == other.ssrcs_ && 
           reason_ == other.reason_ && 
           reason_padding_ == other.reason_padding_ &&
           PaddingEquals(other);
}

} // namespace rtcp
} // namespace rtpcodec
