#include "rtpcodec/memory/padding.hpp"
#include "rtpcodec/base/codec_error.hpp"

#include <algorithm>
#include <string>

namespace rtpcodec {
namespace padding {

BinaryBuffer ReadPaddingBytes(BitReader& reader, size_t size) {
    BinaryBuffer bytes = reader.ReadBytes(size);
    if (std::all_of(bytes.begin(), bytes.end(), [](uint8_t byte) { return byte == 0; })) {
        bytes.clear();
    }
    return bytes;
}

void WritePaddingBytes(BitWriter& writer, size_t size, ArrayView<const uint8_t> kept) {
    if (kept.size() == size) {
        writer.WriteBytes(kept.data(), kept.size());
    } else {
        writer.WriteZeros(size);
    }
}

BinaryBuffer ReadAlignmentPadding(BitReader& reader, size_t mark) {
    if (!reader.IsByteAligned()) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, "Padding must start at a byte boundary.");
    }
    return ReadPaddingBytes(reader, AlignmentPaddingFor(reader.BytesConsumedSince(mark)));
}

size_t WriteAlignmentPadding(BitWriter& writer, size_t mark, ArrayView<const uint8_t> kept) {
    const size_t padding_size = AlignmentPaddingFor(writer.BytesWrittenSince(mark));
    WritePaddingBytes(writer, padding_size, kept);
    return padding_size;
}

BinaryBuffer MakeSignaledPadding(uint8_t padding_size) {
    BinaryBuffer padding(padding_size, 0);
    if (padding_size > 0) {
        padding.back() = padding_size;
    }
    return padding;
}

bool IsSignaledPadding(ArrayView<const uint8_t> padding) {
    return padding.empty() || padding[padding.size() - 1] == padding.size();
}

uint8_t ReadSignaledPaddingSize(ArrayView<const uint8_t> packet, size_t available) {
    if (packet.empty() || available == 0) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, "Padding bit set but no byte left for the padding size.");
    }
    const uint8_t padding_size = packet[packet.size() - 1];
    if (padding_size == 0) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, "Padding bit set but padding size set to 0.");
    }
    if (padding_size > available) {
        throw CodecError(ErrorKind::MALFORMED_HEADER, 
                         "Too many padding bytes (" + std::to_string(padding_size) + 
                         ") for " + std::to_string(available) + " bytes.");
    }
    return padding_size;
}

} // namespace padding
} // namespace rtpcodec
