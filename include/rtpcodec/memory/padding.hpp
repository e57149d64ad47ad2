#ifndef _RTPCODEC_MEMORY_PADDING_H_
#define _RTPCODEC_MEMORY_PADDING_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/common/array_view.hpp"
#include "rtpcodec/memory/bit_reader.hpp"
#include "rtpcodec/memory/bit_writer.hpp"

namespace rtpcodec {
namespace padding {

// RTP and RTCP pad whole packets to 32-bit words.
constexpr size_t kAlignment = 4;

// Number of bytes needed to take `content_size` to the next word boundary, in [0,3].
constexpr size_t AlignmentPaddingFor(size_t content_size) {
    return (kAlignment - content_size % kAlignment) % kAlignment;
}

// Reads `size` padding bytes. They are returned when one of them is not
// zero, zero padding gives an empty buffer since it is what gets written
// back anyway.
BinaryBuffer ReadPaddingBytes(BitReader& reader, size_t size);

// Writes `kept` when it holds exactly `size` bytes, `size` zeros otherwise.
void WritePaddingBytes(BitWriter& writer, size_t size, ArrayView<const uint8_t> kept);

// Reads the bytes following the content read since `mark` (a bit
// position) until the byte count consumed since `mark` is a multiple
// of 4, see ReadPaddingBytes() for the result.
BinaryBuffer ReadAlignmentPadding(BitReader& reader, size_t mark);

// Pads the content written since `mark` to a multiple of 4 bytes with
// the `kept` bytes of a parsed packet, or zeros.
// Returns the number of padding bytes written.
size_t WriteAlignmentPadding(BitWriter& writer, size_t mark, 
                             ArrayView<const uint8_t> kept = ArrayView<const uint8_t>());

// `padding_size` bytes of padding signaled with the P bit: zeros, the
// last one holding `padding_size`. Empty for 0.
BinaryBuffer MakeSignaledPadding(uint8_t padding_size);

// Whether `padding` is empty or ends with its own size.
bool IsSignaledPadding(ArrayView<const uint8_t> padding);

// Reads the padding length carried by the last byte of `packet` whose
// P bit is set, checking it against the `available` bytes (the packet
// without its fixed header). Zero padding, or more padding than
// available, throws CodecError(MALFORMED_HEADER).
uint8_t ReadSignaledPaddingSize(ArrayView<const uint8_t> packet, size_t available);

} // namespace padding
} // namespace rtpcodec

#endif
