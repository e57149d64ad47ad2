#include "rtpcodec/memory/bit_io.hpp"

#include <cassert>

namespace rtpcodec {

uint8_t RightMostBits(uint8_t byte, size_t bit_count) {
    assert(bit_count <= 8);
    return static_cast<uint8_t>(byte & ((1u << bit_count) - 1));
}

uint8_t LeftMostBits(uint8_t byte, size_t bit_count) {
    assert(bit_count <= 8);
    if (bit_count == 0) {
        return 0;
    }
    uint8_t shift = 8 - static_cast<uint8_t>(bit_count);
    uint8_t mask = static_cast<uint8_t>(0xFF << shift);
    return static_cast<uint8_t>((byte & mask) >> shift);
}

uint8_t LeftMostByte(uint64_t val) {
    return static_cast<uint8_t>(val >> 56);
}

} // namespace rtpcodec
