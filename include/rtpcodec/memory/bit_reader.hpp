#ifndef _RTPCODEC_MEMORY_BIT_READER_H_
#define _RTPCODEC_MEMORY_BIT_READER_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/base/codec_error.hpp"
#include "rtpcodec/common/array_view.hpp"
#include "rtpcodec/memory/bit_io.hpp"
#include "rtpcodec/memory/byte_io_reader.hpp"

#include <type_traits>

namespace rtpcodec {

// A read cursor over a borrowed byte region with bit granularity.
// Byte order is big-endian/network.
//
// Positions are absolute bit offsets from the start of the region, so a
// caller can remember one as a mark and later ask how much was consumed
// since, or seek back to it. Every read or seek that would cross the end
// of the region throws CodecError(OUT_OF_BOUNDS) and leaves the position
// unchanged.
//
// The region MUST outlive the reader.
class RTPCODEC_CPP_EXPORT BitReader {
public:
    BitReader(const uint8_t* bytes, size_t byte_count);
    explicit BitReader(ArrayView<const uint8_t> bytes);

    // The whole region, regardless of the read position.
    ArrayView<const uint8_t> data() const { return ArrayView<const uint8_t>(bytes_, byte_count_); }

    size_t BitPosition() const { return byte_offset_ * 8 + bit_offset_; }
    uint64_t RemainingBitCount() const;
    size_t RemainingByteCount() const { return static_cast<size_t>(RemainingBitCount() / 8); }
    bool IsByteAligned() const { return bit_offset_ == 0; }

    size_t BitsConsumedSince(size_t mark) const;
    size_t BytesConsumedSince(size_t mark) const { return BitsConsumedSince(mark) / 8; }

    template <typename T>
    T ReadBits(size_t bit_count);

    template <typename T>
    T PeekBits(size_t bit_count) const;

    bool ReadFlag() { return ReadBits<uint8_t>(1) != 0; }

    // Reads a big-endian integer of B bytes, sign extended when T is signed.
    template <typename T, unsigned int B = sizeof(T)>
    T Read();

    // Copies the next `byte_count` bytes out.
    BinaryBuffer ReadBytes(size_t byte_count);
    void ReadBytes(uint8_t* out, size_t byte_count);

    // Returns a reader limited to the next `byte_count` bytes and moves
    // past them. Requires a byte aligned position.
    BitReader Slice(size_t byte_count);

    void ConsumeBits(size_t bit_count);
    void ConsumeBytes(size_t byte_count) { ConsumeBits(byte_count * 8); }

    void Seek(size_t bit_position);
    // The bit offset is from the given byte, in the range [0,7].
    void Seek(size_t byte_offset, size_t bit_offset);

private:
    void CheckRemaining(size_t bit_count) const;

    const uint8_t* const bytes_;
    const size_t byte_count_;
    size_t byte_offset_;
    size_t bit_offset_;

    DISALLOW_COPY_AND_ASSIGN(BitReader);
};

template <typename T>
T BitReader::ReadBits(size_t bit_count) {
    T val = PeekBits<T>(bit_count);
    ConsumeBits(bit_count);
    return val;
}

template <typename T>
T BitReader::PeekBits(size_t bit_count) const {
    static_assert(std::is_integral<T>::value, "Type must be an integer.");
    if (bit_count > sizeof(T) * 8) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, "Too many bits requested for the value type.");
    }
    CheckRemaining(bit_count);
    if (bit_count == 0) {
        return 0;
    }
    const uint8_t* curr_bytes = bytes_ + byte_offset_;
    size_t remaining_bits_in_curr_byte = 8 - bit_offset_;
    uint64_t bits = RightMostBits(*curr_bytes++, remaining_bits_in_curr_byte);
    if (bit_count < remaining_bits_in_curr_byte) {
        // `bits` keeps zeros in its highest `bit_offset_` bits.
        return static_cast<T>(LeftMostBits(static_cast<uint8_t>(bits), bit_offset_ + bit_count));
    }
    bit_count -= remaining_bits_in_curr_byte;
    while (bit_count >= 8) {
        bits = (bits << 8) | *curr_bytes++;
        bit_count -= 8;
    }
    if (bit_count > 0) {
        bits <<= bit_count;
        bits |= LeftMostBits(*curr_bytes, bit_count);
    }
    return static_cast<T>(bits);
}

template <typename T, unsigned int B>
T BitReader::Read() {
    static_assert(B <= sizeof(T), kSizeErrorMsg);
    uint8_t bytes[B];
    ReadBytes(bytes, B);
    return ByteReader<T, B>::ReadBigEndian(bytes);
}

} // namespace rtpcodec

#endif
