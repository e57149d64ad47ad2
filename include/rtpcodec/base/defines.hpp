#ifndef _RTPCODEC_BASE_DEFINES_H_
#define _RTPCODEC_BASE_DEFINES_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#ifndef RTPCODEC_CPP_EXPORT
#define RTPCODEC_CPP_EXPORT
#endif

#define DISALLOW_COPY_AND_ASSIGN(TypeName)  \
    TypeName(const TypeName&) = delete;     \
    TypeName& operator=(const TypeName&) = delete

using BinaryBuffer = std::vector<uint8_t>;

#endif
