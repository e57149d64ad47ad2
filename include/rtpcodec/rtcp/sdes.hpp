#ifndef _RTPCODEC_RTCP_SDES_H_
#define _RTPCODEC_RTCP_SDES_H_

#include "rtpcodec/base/defines.hpp"
#include "rtpcodec/rtcp/common_header.hpp"
#include "rtpcodec/rtcp/packet_sync.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rtpcodec {
namespace rtcp {

// Source description (SDES) (RFC 3550 section 6.5).
class RTPCODEC_CPP_EXPORT Sdes : public PacketPadding {
public:
    static constexpr uint8_t kPacketType = 202;
    static constexpr size_t kMaxNumberOfChunks = 0x1F;
    static constexpr size_t kMaxItemLength = 0xFF;

    static constexpr uint8_t kTerminatorTag = 0;
    static constexpr uint8_t kCnameTag = 1;

    struct Item {
        uint8_t type = 0;
        std::string value;

        bool operator==(const Item& other) const {
            return type == other.type && value == other.value;
        }
    };

    struct Chunk {
        uint32_t ssrc = 0;
        // Items of any type, kept in wire order.
        std::vector<Item> items;

        std::optional<std::string> cname() const;

        bool operator==(const Chunk& other) const {
            return ssrc == other.ssrc && items == other.items;
        }
    };

    Sdes();
    Sdes(const Sdes&);
    Sdes(Sdes&&);
    Sdes& operator=(const Sdes&);
    Sdes& operator=(Sdes&&);
    ~Sdes();

    const std::vector<Chunk>& chunks() const { return chunks_; }

    bool AddCName(uint32_t ssrc, std::string cname);
    // Rejects chunks beyond the 31st, items of type 0 and values over 255 bytes.
    bool AddChunk(Chunk chunk);

    HeaderTemplate header_template() const { return HeaderTemplate{kPacketType, std::nullopt}; }
    SerializedBody Serialize() const;
    void Parse(const CommonHeader& header, BitReader& payload);

    bool operator==(const Sdes& other) const;
    bool operator!=(const Sdes& other) const { return !(*this == other); }

private:
    static Chunk ParseChunk(BitReader& payload, BinaryBuffer* kept_padding);

private:
    std::vector<Chunk> chunks_;
    // Per chunk, the bytes after its terminator as parsed when they are
    // not all zero.
    std::vector<BinaryBuffer> chunk_paddings_;
};

} // namespace rtcp
} // namespace rtpcodec

#endif
