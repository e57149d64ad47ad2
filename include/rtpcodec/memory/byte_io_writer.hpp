#ifndef _RTPCODEC_MEMORY_BYTE_IO_WRITER_H_
#define _RTPCODEC_MEMORY_BYTE_IO_WRITER_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/memory/byte_io.hpp"

namespace rtpcodec {

// Writes the B least significant bytes of T in big-endian (network) order.
template <
    typename T,
    unsigned int B = sizeof(T),
    bool is_signed = std::numeric_limits<T>::is_signed>
class ByteWriter;

template <typename T, unsigned int B>
class ByteWriter<T, B, false> {
public:
    static void WriteBigEndian(uint8_t* data, T val) {
        static_assert(B <= sizeof(T), kSizeErrorMsg);
        for (unsigned int i = 0; i < B; ++i) {
            data[i] = static_cast<uint8_t>(val >> ((B - 1 - i) * 8));
        }
    }
};

template <typename T, unsigned int B>
class ByteWriter<T, B, true> {
public:
    typedef typename UnsignedOf<T>::Type U;

    static void WriteBigEndian(uint8_t* data, T val) {
        // Conversion to unsigned keeps the two's complement bit pattern.
        ByteWriter<U, B, false>::WriteBigEndian(data, static_cast<U>(val));
    }
};

} // namespace rtpcodec

#endif
