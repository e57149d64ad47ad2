#include "rtpcodec/rtcp/pli.hpp"

namespace rtpcodec {
namespace rtcp {

Pli::Pli() = default;

Pli::~Pli() = default;

SerializedBody Pli::Serialize() const {
    BitWriter writer;
    PackCommonFeedbackInto(writer);
    return SerializedBody{writer.Release(), 0, padding()};
}

void Pli::Parse(const CommonHeader& /*header*/, BitReader& payload) {
    ParseCommonFeedback(payload);
}

} // namespace rtcp
} // namespace rtpcodec
