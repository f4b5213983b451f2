#include <gtest/gtest.h>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include "TestFakes.hpp"
#include "utils/Logging.hpp"

using namespace Pequod;
using namespace Pequod::Testing;

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(parseLogLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("info"), spdlog::level::info);
    EXPECT_EQ(parseLogLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("error"), spdlog::level::err);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("INFO").has_value());
}

TEST(LoggingTest, WritesToFile) {
    TempDir dir;
    std::string path = dir.file("pequod.log");
    ASSERT_TRUE(initLogging(path, spdlog::level::info));

    spdlog::debug("hidden line");
    spdlog::warn("visible line");
    spdlog::default_logger()->flush();

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("visible line"), std::string::npos);
    EXPECT_EQ(contents.find("hidden line"), std::string::npos);
}

TEST(LoggingTest, UnwritableFileDisablesLogging) {
    TempDir dir;
    std::string blocker = dir.file("blocker");
    std::ofstream(blocker) << "not a directory";

    EXPECT_FALSE(initLogging(blocker + "/pequod.log", spdlog::level::info));
    ASSERT_NE(spdlog::default_logger(), nullptr);
    spdlog::error("dropped");
}
