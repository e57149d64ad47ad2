#ifndef _RTPCODEC_MEMORY_BYTE_IO_H_
#define _RTPCODEC_MEMORY_BYTE_IO_H_

#include <cstdint>
#include <limits>

namespace rtpcodec {

// Signed integers are read and written as their two's complement bit pattern.
static_assert((-1 & 0x03) == 0x03, "Only two's complement representation of signed integers supported.");

// Plain const char* won't work for static_assert.
#define kSizeErrorMsg "Byte size must be less than or equal to data type size."

template <typename T>
struct UnsignedOf;

template <>
struct UnsignedOf<int8_t> {
    typedef uint8_t Type;
};

template <>
struct UnsignedOf<int16_t> {
    typedef uint16_t Type;
};

template <>
struct UnsignedOf<int32_t> {
    typedef uint32_t Type;
};

template <>
struct UnsignedOf<int64_t> {
    typedef uint64_t Type;
};

} // namespace rtpcodec

#endif
