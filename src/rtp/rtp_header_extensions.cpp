#include "rtpcodec/rtp/rtp_header_extensions.hpp"
#include "rtpcodec/memory/byte_io_reader.hpp"
#include "rtpcodec/memory/byte_io_writer.hpp"

#include <plog/Log.h>

namespace rtpcodec {
namespace rtp {

constexpr const char AudioLevel::kUri[];
constexpr const char TransportSequenceNumber::kUri[];

// AudioLevel
AudioLevel::AudioLevel() 
    : AudioLevel(false, kMutedLevel) {}

AudioLevel::AudioLevel(bool voice_activity, uint8_t audio_level) 
    : voice_activity_(voice_activity),
      audio_level_(audio_level) {}

AudioLevel::~AudioLevel() = default;

bool AudioLevel::Parse(ArrayView<const uint8_t> data) {
    if (data.size() != kValueSizeBytes) {
        return false;
    }
    voice_activity_ = (data[0] & 0x80) != 0;
    audio_level_ = data[0] & 0x7F;
    return true;
}

bool AudioLevel::PackInto(uint8_t* data, size_t size) const {
    if (size != kValueSizeBytes) {
        return false;
    }
    if (audio_level_ > 0x7F) {
        PLOG_WARNING << "Audio level " << int(audio_level_) << " does not fit in 7 bits.";
        return false;
    }
    data[0] = (voice_activity_ ? 0x80 : 0x00) | audio_level_;
    return true;
}

// TransportSequenceNumber
TransportSequenceNumber::TransportSequenceNumber() 
    : TransportSequenceNumber(0) {}

TransportSequenceNumber::TransportSequenceNumber(uint16_t transport_sequence_number) 
    : transport_sequence_number_(transport_sequence_number) {}

TransportSequenceNumber::~TransportSequenceNumber() = default;

bool TransportSequenceNumber::Parse(ArrayView<const uint8_t> data) {
    if (data.size() != kValueSizeBytes) {
        return false;
    }
    transport_sequence_number_ = ByteReader<uint16_t>::ReadBigEndian(data.data());
    return true;
}

bool TransportSequenceNumber::PackInto(uint8_t* data, size_t size) const {
    if (size != kValueSizeBytes) {
        return false;
    }
    ByteWriter<uint16_t>::WriteBigEndian(data, transport_sequence_number_);
    return true;
}

} // namespace rtp
} // namespace rtpcodec
