#include "rtpcodec/memory/bit_reader.hpp"

#include <cstring>
#include <string>

namespace rtpcodec {

BitReader::BitReader(const uint8_t* bytes, size_t byte_count) 
    : bytes_(bytes),
      byte_count_(byte_count),
      byte_offset_(0),
      bit_offset_(0) {}

BitReader::BitReader(ArrayView<const uint8_t> bytes) 
    : BitReader(bytes.data(), bytes.size()) {}

uint64_t BitReader::RemainingBitCount() const {
    return (static_cast<uint64_t>(byte_count_) - byte_offset_) * 8 - bit_offset_;
}

size_t BitReader::BitsConsumedSince(size_t mark) const {
    if (mark > BitPosition()) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, 
                         "Mark " + std::to_string(mark) + " is ahead of the read position " + std::to_string(BitPosition()));
    }
    return BitPosition() - mark;
}

void BitReader::ReadBytes(uint8_t* out, size_t byte_count) {
    CheckRemaining(byte_count * 8);
    if (bit_offset_ == 0) {
        if (byte_count > 0) {
            std::memcpy(out, bytes_ + byte_offset_, byte_count);
        }
        byte_offset_ += byte_count;
        return;
    }
    for (size_t i = 0; i < byte_count; ++i) {
        out[i] = ReadBits<uint8_t>(8);
    }
}

BinaryBuffer BitReader::ReadBytes(size_t byte_count) {
    CheckRemaining(byte_count * 8);
    BinaryBuffer bytes(byte_count);
    ReadBytes(bytes.data(), byte_count);
    return bytes;
}

BitReader BitReader::Slice(size_t byte_count) {
    if (bit_offset_ != 0) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, "Can not slice at an unaligned position.");
    }
    CheckRemaining(byte_count * 8);
    const uint8_t* begin = bytes_ + byte_offset_;
    byte_offset_ += byte_count;
    return BitReader(begin, byte_count);
}

void BitReader::ConsumeBits(size_t bit_count) {
    CheckRemaining(bit_count);
    size_t new_bit_offset = bit_offset_ + bit_count;
    byte_offset_ += new_bit_offset / 8;
    // in the range [0,7]
    bit_offset_ = new_bit_offset % 8;
}

void BitReader::Seek(size_t bit_position) {
    Seek(bit_position / 8, bit_position % 8);
}

void BitReader::Seek(size_t byte_offset, size_t bit_offset) {
    if (byte_offset > byte_count_ || 
        bit_offset > 7 ||
        (byte_offset == byte_count_ && bit_offset > 0)) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, 
                         "Seek to " + std::to_string(byte_offset * 8 + bit_offset) + 
                         " bits is beyond a buffer of " + std::to_string(byte_count_) + " bytes.");
    }
    byte_offset_ = byte_offset;
    bit_offset_ = bit_offset;
}

void BitReader::CheckRemaining(size_t bit_count) const {
    if (bit_count > RemainingBitCount()) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, 
                         "Need " + std::to_string(bit_count) + " bits but only " + 
                         std::to_string(RemainingBitCount()) + " remain.");
    }
}

} // namespace rtpcodec
