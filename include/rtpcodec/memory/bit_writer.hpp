#ifndef _RTPCODEC_MEMORY_BIT_WRITER_H_
#define _RTPCODEC_MEMORY_BIT_WRITER_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/common/array_view.hpp"
#include "rtpcodec/memory/bit_io.hpp"
#include "rtpcodec/memory/byte_io_writer.hpp"

#include <optional>

namespace rtpcodec {

// A write cursor with bit granularity over an owned, growing buffer.
// Byte order is big-endian/network.
//
// The size of the output is the furthest position ever written, so
// seeking back to patch a field does not truncate it. A writer created
// with `max_size` throws CodecError(OUT_OF_BOUNDS) instead of growing
// past that many bytes.
class RTPCODEC_CPP_EXPORT BitWriter {
public:
    BitWriter();
    explicit BitWriter(size_t max_size);
    BitWriter(BitWriter&&) = default;
    BitWriter& operator=(BitWriter&&) = default;
    ~BitWriter();

    size_t BitPosition() const { return byte_offset_ * 8 + bit_offset_; }
    bool IsByteAligned() const { return bit_offset_ == 0; }
    // Bytes written so far.
    size_t size() const { return size_; }
    std::optional<size_t> max_size() const { return max_size_; }

    // Bytes covered between `mark` and the current position,
    // a started byte counts as written.
    size_t BytesWrittenSince(size_t mark) const;

    // Writes the `bit_count` least significant bits of `val`.
    void WriteBits(uint64_t val, size_t bit_count);
    void WriteFlag(bool flag) { WriteBits(flag ? 1 : 0, 1); }

    // Writes the B least significant bytes of `val` in big-endian order.
    template <typename T, unsigned int B = sizeof(T)>
    void Write(T val);

    void WriteBytes(const uint8_t* data, size_t size);
    void WriteBytes(ArrayView<const uint8_t> data) { WriteBytes(data.data(), data.size()); }
    void WriteZeros(size_t byte_count);

    // Only positions inside the written region are valid.
    void Seek(size_t bit_position);

    ArrayView<const uint8_t> data() const { return ArrayView<const uint8_t>(bytes_.data(), size_); }
    // Hands the written bytes off, the writer is empty afterwards.
    BinaryBuffer Release();

private:
    void EnsureCapacity(size_t bit_count);
    void ConsumeBits(size_t bit_count);

    static uint8_t WritePartialByte(uint8_t source, 
                                    size_t source_bit_count,
                                    uint8_t target,
                                    size_t target_bit_offset);

    BinaryBuffer bytes_;
    std::optional<size_t> max_size_;
    size_t size_;
    size_t byte_offset_;
    size_t bit_offset_;

    DISALLOW_COPY_AND_ASSIGN(BitWriter);
};

template <typename T, unsigned int B>
void BitWriter::Write(T val) {
    static_assert(B <= sizeof(T), kSizeErrorMsg);
    uint8_t bytes[B];
    ByteWriter<T, B>::WriteBigEndian(bytes, val);
    WriteBytes(bytes, B);
}

} // namespace rtpcodec

#endif
