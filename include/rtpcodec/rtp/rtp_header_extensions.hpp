#ifndef _RTPCODEC_RTP_RTP_HEADER_EXTENSIONS_H_
#define _RTPCODEC_RTP_RTP_HEADER_EXTENSIONS_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/common/array_view.hpp"
#include "rtpcodec/rtp/rtp_defines.hpp"

namespace rtpcodec {
namespace rtp {

// Typed views of header extension element values. Each one parses from
// and packs into the raw value bytes of a single element, the local id
// comes from the session negotiation and is passed in by the caller.

// AudioLevel (RFC 6464)
//
//  0                   1
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |  ID   | len=0 |V| level       |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// V: voice activity flag, level: -dBov in [0,127], 127 is muted.
class RTPCODEC_CPP_EXPORT AudioLevel {
public:
    static constexpr uint8_t kValueSizeBytes = 1;
    static constexpr uint8_t kMutedLevel = 127;
    static constexpr const char kUri[] = "urn:ietf:params:rtp-hdrext:ssrc-audio-level";

public:
    AudioLevel();
    AudioLevel(bool voice_activity, uint8_t audio_level);
    ~AudioLevel();

    size_t data_size() const { return kValueSizeBytes; }
    bool voice_activity() const { return voice_activity_; }
    uint8_t audio_level() const { return audio_level_; }
    bool muted() const { return audio_level_ == kMutedLevel; }

    bool Parse(ArrayView<const uint8_t> data);
    bool PackInto(uint8_t* data, size_t size) const;

private:
    bool voice_activity_;
    uint8_t audio_level_;
};

// TransportSequenceNumber
//
//  0                   1                   2
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |  ID   | L=1   |transport-wide sequence number |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
class RTPCODEC_CPP_EXPORT TransportSequenceNumber {
public:
    static constexpr uint8_t kValueSizeBytes = 2;
    static constexpr const char kUri[] = "http://www.ietf.org/id/draft-holmer-rmcat-transport-wide-cc-extensions-01";

public:
    TransportSequenceNumber();
    explicit TransportSequenceNumber(uint16_t transport_sequence_number);
    ~TransportSequenceNumber();

    size_t data_size() const { return kValueSizeBytes; }
    uint16_t transport_sequence_number() const { return transport_sequence_number_; }

    bool Parse(ArrayView<const uint8_t> data);
    bool PackInto(uint8_t* data, size_t size) const;

private:
    uint16_t transport_sequence_number_;
};

} // namespace rtp
} // namespace rtpcodec

#endif
