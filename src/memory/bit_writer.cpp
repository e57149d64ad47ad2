#include "rtpcodec/memory/bit_writer.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <algorithm>
#include <cassert>
#include <cstring>
#include <string>

namespace rtpcodec {

BitWriter::BitWriter() 
    : max_size_(std::nullopt),
      size_(0),
      byte_offset_(0),
      bit_offset_(0) {}

BitWriter::BitWriter(size_t max_size) 
    : max_size_(max_size),
      size_(0),
      byte_offset_(0),
      bit_offset_(0) {
    bytes_.reserve(max_size);
}

BitWriter::~BitWriter() = default;

size_t BitWriter::BytesWrittenSince(size_t mark) const {
    if (mark > BitPosition()) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, 
                         "Mark " + std::to_string(mark) + " is ahead of the write position " + std::to_string(BitPosition()));
    }
    return (BitPosition() - mark + 7) / 8;
}

void BitWriter::WriteBits(uint64_t val, size_t bit_count) {
    if (bit_count > 64) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, "Can not write more than 64 bits at once.");
    }
    if (bit_count == 0) {
        return;
    }
    EnsureCapacity(bit_count);
    size_t total_bits = bit_count;
    // Push the bits we want to write to the highest bits of `val`.
    val <<= (sizeof(uint64_t) * 8 - bit_count);
    uint8_t* bytes = bytes_.data() + byte_offset_;
    // The first byte may be partially written already, and the value may
    // end before this byte does.
    size_t remaining_bits_in_current_byte = 8 - bit_offset_;
    size_t bits_in_first_byte = std::min(bit_count, remaining_bits_in_current_byte);
    *bytes = WritePartialByte(LeftMostByte(val), bits_in_first_byte, *bytes, bit_offset_);
    if (bit_count > remaining_bits_in_current_byte) {
        val <<= bits_in_first_byte;
        bytes++;
        bit_count -= bits_in_first_byte;
        while (bit_count >= 8) {
            *bytes++ = LeftMostByte(val);
            val <<= 8;
            bit_count -= 8;
        }
        // Last byte may be partial as well.
        if (bit_count > 0) {
            *bytes = WritePartialByte(LeftMostByte(val), bit_count, *bytes, 0);
        }
    }
    ConsumeBits(total_bits);
}

void BitWriter::WriteBytes(const uint8_t* data, size_t size) {
    if (size == 0) {
        return;
    }
    if (bit_offset_ != 0) {
        for (size_t i = 0; i < size; ++i) {
            WriteBits(data[i], 8);
        }
        return;
    }
    EnsureCapacity(size * 8);
    std::memcpy(bytes_.data() + byte_offset_, data, size);
    ConsumeBits(size * 8);
}

void BitWriter::WriteZeros(size_t byte_count) {
    for (size_t i = 0; i < byte_count; ++i) {
        WriteBits(0, 8);
    }
}

void BitWriter::Seek(size_t bit_position) {
    if (bit_position > size_ * 8) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, 
                         "Seek to " + std::to_string(bit_position) + 
                         " bits is beyond the " + std::to_string(size_) + " bytes written.");
    }
    byte_offset_ = bit_position / 8;
    bit_offset_ = bit_position % 8;
}

BinaryBuffer BitWriter::Release() {
    bytes_.resize(size_);
    BinaryBuffer released = std::move(bytes_);
    bytes_.clear();
    size_ = 0;
    byte_offset_ = 0;
    bit_offset_ = 0;
    return released;
}

// Private methods
void BitWriter::EnsureCapacity(size_t bit_count) {
    const size_t required_bytes = (BitPosition() + bit_count + 7) / 8;
    if (max_size_ && required_bytes > *max_size_) {
        throw CodecError(ErrorKind::OUT_OF_BOUNDS, 
                         "Writing " + std::to_string(bit_count) + " bits exceeds the capacity of " + 
                         std::to_string(*max_size_) + " bytes.");
    }
    if (required_bytes > bytes_.size()) {
        bytes_.resize(required_bytes, 0);
    }
}

void BitWriter::ConsumeBits(size_t bit_count) {
    size_t new_bit_offset = bit_offset_ + bit_count;
    byte_offset_ += new_bit_offset / 8;
    // in the range [0,7]
    bit_offset_ = new_bit_offset % 8;
    size_ = std::max(size_, (BitPosition() + 7) / 8);
}

// Returns `target` with `source_bit_count` bits taken from the highest
// bits of `source` written at `target_bit_offset` from its highest bit.
uint8_t BitWriter::WritePartialByte(uint8_t source,
                                    size_t source_bit_count,
                                    uint8_t target,
                                    size_t target_bit_offset) {
    assert(target_bit_offset < 8);
    assert(source_bit_count <= (8 - target_bit_offset));
    // The number of bits we want, in the most significant bits,
    // shifted over to the target offset.
    uint8_t mask = static_cast<uint8_t>(static_cast<uint8_t>(0xFF << (8 - source_bit_count)) >> target_bit_offset);
    return static_cast<uint8_t>((target & ~mask) | (source >> target_bit_offset));
}

} // namespace rtpcodec
