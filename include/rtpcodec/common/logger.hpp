#ifndef _RTPCODEC_COMMON_LOGGER_H_
#define _RTPCODEC_COMMON_LOGGER_H_

#include "rtpcodec/base/defines.hpp"

#include <plog/Log.h>

#include <functional>
#include <string>

namespace rtpcodec {
namespace logging {

enum class Level { // MUST match plog::Severity
    NONE = 0,
    FATAL = 1,
    ERROR = 2,
    WARNING = 3,
    INFO = 4,
    DEBUG = 5,
    VERBOSE = 6
};

// Returns false to let the record fall back to stdout.
using LoggingCallback = std::function<bool(Level level, std::string message)>;

// The codec itself never initializes plog, the embedding application
// calls one of these once. Calling again only changes the severity
// (and the callback).
RTPCODEC_CPP_EXPORT void InitLogger(Level level, LoggingCallback callback = nullptr);
RTPCODEC_CPP_EXPORT void InitLogger(plog::Severity severity, plog::IAppender* appender = nullptr);

} // namespace logging
} // namespace rtpcodec

#endif
