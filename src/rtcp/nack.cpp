#include "rtpcodec/rtcp/nack.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <string>

namespace rtpcodec {
namespace rtcp {

// Generic NACK (RFC 4585).
//
// FCI:
//    0                   1                   2                   3
//    0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//   |            PID                |             BLP               |
//   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+

Nack::Nack() = default;
Nack::Nack(const Nack&) = default;
Nack::~Nack() = default;

std::vector<uint16_t> Nack::packet_ids() const {
    std::vector<uint16_t> packet_ids;
    for (const auto& item : fci_items_) {
        packet_ids.push_back(item.first_pid);
        uint16_t pid = item.first_pid + 1;
        for (uint16_t bitmask = item.bitmask; bitmask != 0; bitmask >>= 1, ++pid) {
            if (bitmask & 1) {
                packet_ids.push_back(pid);
            }
        }
    }
    return packet_ids;
}

void Nack::set_packet_ids(const std::vector<uint16_t>& nack_list) {
    fci_items_.clear();
    auto it = nack_list.begin();
    const auto end = nack_list.end();
    while (it != end) {
        FciItem item;
        item.first_pid = *it++;
        // Bitmap specifies losses in any of the 16 packets following the packet id
        while (it != end) {
            uint16_t shift = static_cast<uint16_t>(*it - item.first_pid - 1);
            if (shift <= 15) {
                item.bitmask |= (1 << shift);
                ++it;
            } else {
                break;
            }
        }
        fci_items_.push_back(item);
    }
}

SerializedBody Nack::Serialize() const {
    if (fci_items_.empty()) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, "NACK without any FCI item.");
    }
    BitWriter writer;
    PackCommonFeedbackInto(writer);
    for (const auto& item : fci_items_) {
        writer.Write<uint16_t>(item.first_pid);
        writer.Write<uint16_t>(item.bitmask);
    }
    return SerializedBody{writer.Release(), 0, padding()};
}

void Nack::Parse(const CommonHeader& /*header*/, BitReader& payload) {
    ParseCommonFeedback(payload);
    const size_t fci_size = payload.RemainingByteCount();
    if (fci_size == 0 || fci_size % kFciItemSize != 0) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Invalid FCI size " + std::to_string(fci_size) + " for a NACK packet.");
    }
    std::vector<FciItem> fci_items(fci_size / kFciItemSize);
    for (auto& item : fci_items) {
        item.first_pid = payload.Read<uint16_t>();
        item.bitmask = payload.Read<uint16_t>();
    }
    fci_items_ = std::move(fci_items);
}

bool Nack::operator==(const Nack& other) const {
    return CommonFeedbackEquals(other) && fci_items_ == other.fci_items_;
}

} // namespace rtcp
} // namespace rtpcodec
