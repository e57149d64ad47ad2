#include "rtpcodec/rtcp/fir.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <plog/Log.h>

#include <string>

namespace rtpcodec {
namespace rtcp {

// RFC 4585: Feedback format.
// Common packet format:
//
//   0                   1                   2                   3
//   0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |V=2|P|   FMT   |       PT      |          length               |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                  SSRC of packet sender                        |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |             SSRC of media source (unused) = 0                 |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  :            Feedback Control Information (FCI)                 :
//  :                                                               :
// Full intra request (FIR) (RFC 5104).
// The Feedback Control Information (FCI) for the Full Intra Request
// consists of one or more FCI entries.
// FCI:
//   0                   1                   2                   3
//   0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                              SSRC                             |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  | Seq nr.       |    Reserved = 0                               |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+

Fir::Fir() = default;

Fir::Fir(const Fir&) = default;

Fir::~Fir() = default;

SerializedBody Fir::Serialize() const {
    if (requests_.empty()) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, "FIR without any request.");
    }
    BitWriter writer;
    PackCommonFeedbackInto(writer);
    for (const auto& request : requests_) {
        writer.Write<uint32_t>(request.ssrc);
        writer.Write<uint8_t>(request.seq_nr);
        writer.Write<uint32_t, 3>(request.reserved);
    }
    return SerializedBody{writer.Release(), 0, padding()};
}

void Fir::Parse(const CommonHeader& /*header*/, BitReader& payload) {
    ParseCommonFeedback(payload);
    const size_t fci_size = payload.RemainingByteCount();
    if (fci_size == 0 || fci_size % kFciSize != 0) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Invalid FCI size " + std::to_string(fci_size) + " for a FIR packet.");
    }
    if (media_ssrc() != 0) {
        PLOG_DEBUG << "FIR carries a non zero media SSRC " << media_ssrc();
    }
    std::vector<Request> requests(fci_size / kFciSize);
    for (auto& request : requests) {
        request.ssrc = payload.Read<uint32_t>();
        request.seq_nr = payload.Read<uint8_t>();
        request.reserved = payload.Read<uint32_t, 3>();
    }
    requests_ = std::move(requests);
}

bool Fir::operator==(const Fir& other) const {
    return CommonFeedbackEquals(other) && requests_ == other.requests_;
}

} // namespace rtcp
} // namespace rtpcodec
