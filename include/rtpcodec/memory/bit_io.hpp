#ifndef _RTPCODEC_MEMORY_BIT_IO_H_
#define _RTPCODEC_MEMORY_BIT_IO_H_

#include "rtpcodec/base/defines.hpp"

namespace rtpcodec {

// Returns the right-most `bit_count` bits in `byte`.
uint8_t RightMostBits(uint8_t byte, size_t bit_count);

// Returns the left-most `bit_count` bits in `byte`, shifted down.
uint8_t LeftMostBits(uint8_t byte, size_t bit_count);

// Returns the left-most byte of `val`.
uint8_t LeftMostByte(uint64_t val);

} // namespace rtpcodec

#endif
