#ifndef _RTPCODEC_MEMORY_BYTE_IO_READER_H_
#define _RTPCODEC_MEMORY_BYTE_IO_READER_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/memory/byte_io.hpp"

namespace rtpcodec {

// Reads a big-endian (network order) integer of B bytes into T.
// If T is signed and B < sizeof(T) the value is sign extended,
// e.g. the 24-bit cumulative lost of a report block.
template <
    typename T,
    unsigned int B = sizeof(T),
    bool is_signed = std::numeric_limits<T>::is_signed>
class ByteReader;

template <typename T, unsigned int B>
class ByteReader<T, B, false> {
public:
    static T ReadBigEndian(const uint8_t* data) {
        static_assert(B <= sizeof(T), kSizeErrorMsg);
        T val(0);
        for (unsigned int i = 0; i < B; ++i) {
            val |= static_cast<T>(data[i]) << ((B - 1 - i) * 8);
        }
        return val;
    }
};

template <typename T, unsigned int B>
class ByteReader<T, B, true> {
public:
    typedef typename UnsignedOf<T>::Type U;

    static T ReadBigEndian(const uint8_t* data) {
        U unsigned_val = ByteReader<U, B, false>::ReadBigEndian(data);
        if (B < sizeof(T)) {
            unsigned_val = SignExtend(unsigned_val);
        }
        return ReinterpretAsSigned(unsigned_val);
    }

private:
    // Avoids implementation defined behaviour of casting an out of
    // range unsigned value to a signed type.
    static T ReinterpretAsSigned(U unsigned_val) {
        const U kUnsignedHighestBitMask = static_cast<U>(1) << ((sizeof(U) * 8) - 1);
        const T kSignedHighestBitMask = std::numeric_limits<T>::min();
        T val;
        if ((unsigned_val & kUnsignedHighestBitMask) != 0) {
            val = static_cast<T>(unsigned_val & ~kUnsignedHighestBitMask);
            val |= kSignedHighestBitMask;
        } else {
            val = static_cast<T>(unsigned_val);
        }
        return val;
    }

    // Ex: 0x8203EF -> 0xFF8203EF, but 0x7203EF -> 0x007203EF
    static U SignExtend(const U val) {
        const uint8_t kMaskBit = static_cast<uint8_t>(val >> ((B - 1) * 8));
        if ((kMaskBit & 0x80) != 0) {
            // "B % sizeof(T)" keeps the shift defined for B == sizeof(T),
            // which never gets here anyway.
            const U kUsedBitMask = (static_cast<U>(1) << ((B % sizeof(T)) * 8)) - 1;
            return ~kUsedBitMask | val;
        }
        return val;
    }
};

} // namespace rtpcodec

#endif
