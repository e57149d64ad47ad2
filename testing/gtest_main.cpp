#include "rtpcodec/common/logger.hpp"

#include <gtest/gtest.h>

int main(int argc, char* argv[]) {
    testing::InitGoogleTest(&argc, argv);
    rtpcodec::logging::InitLogger(rtpcodec::logging::Level::ERROR);
    return RUN_ALL_TESTS();
}
