/// @file logging_test.cpp
/// @brief Tests for evalkit logging utilities

#include <gtest/gtest.h>

#include "common/logging.h"

namespace evalkit {
namespace {

TEST(LoggingTest, InitializeLogging) {
    LogConfig config;
    config.name = "test-logger";
    config.level = LogLevel::kDebug;

    EXPECT_NO_THROW(InitLogging(config));
    EXPECT_NE(GetLogger(), nullptr);
}

TEST(LoggingTest, LogLevelChange) {
    InitLogging();

    EXPECT_NO_THROW(SetLogLevel(LogLevel::kWarn));
    EXPECT_EQ(GetLogger()->level(), spdlog::level::warn);

    EXPECT_NO_THROW(SetLogLevel(LogLevel::kDebug));
    EXPECT_EQ(GetLogger()->level(), spdlog::level::debug);
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("trace"), LogLevel::kTrace);
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("off"), LogLevel::kOff);
    EXPECT_EQ(ParseLogLevel("verbose"), LogLevel::kInfo);
    EXPECT_EQ(ParseLogLevel(""), LogLevel::kInfo);
}

TEST(LoggingTest, LoggingMacros) {
    InitLogging();

    EXPECT_NO_THROW({
        EVALKIT_LOG_TRACE("Trace message: {}", 1);
        EVALKIT_LOG_DEBUG("Debug message: {}", 2);
        EVALKIT_LOG_INFO("Info message: {}", 3);
        EVALKIT_LOG_WARN("Warn message: {}", 4);
        EVALKIT_LOG_ERROR("Error message: {}", 5);
    });
}

TEST(LoggingTest, FlushLogs) {
    InitLogging();
    EVALKIT_LOG_INFO("Test message");
    EXPECT_NO_THROW(FlushLogs());
}

}  // namespace
}  // namespace evalkit
