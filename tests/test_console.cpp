#include <gtest/gtest.h>
#include "vidsync/console.hpp"
#include <iostream>
#include <string>

namespace vidsync {

TEST(StdoutDiversionTest, LogLinesMoveToStderr) {
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    {
        StdoutDiversion diversion(true);
        std::cout << "[FrameExtractor] Selected 3 key frames" << std::endl;
        diversion.stdout_stream() << "{\"frames\": []}" << std::endl;
    }
    std::cout << "restored" << std::endl;
    const std::string err = testing::internal::GetCapturedStderr();
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "{\"frames\": []}\nrestored\n");
    EXPECT_NE(err.find("[FrameExtractor] Selected 3 key frames"), std::string::npos);
}

TEST(StdoutDiversionTest, InactiveLeavesStdoutAlone) {
    testing::internal::CaptureStdout();
    {
        StdoutDiversion diversion(false);
        std::cout << "log" << std::endl;
        diversion.stdout_stream() << "json" << std::endl;
    }
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "log\njson\n");
}

} // namespace vidsync
