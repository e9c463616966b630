/// @file logging_test.cpp
/// @brief Tests for clintab logging utilities

#include <gtest/gtest.h>

#include "common/config.h"
#include "common/error.h"
#include "common/logging.h"

namespace clintab {
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
    EXPECT_NO_THROW(SetLogLevel(LogLevel::kDebug));
}

TEST(LoggingTest, ParseLogLevel) {
    auto debug = ParseLogLevel("DEBUG");
    ASSERT_TRUE(debug.ok());
    EXPECT_EQ(*debug, LogLevel::kDebug);

    auto warn = ParseLogLevel("warning");
    ASSERT_TRUE(warn.ok());
    EXPECT_EQ(*warn, LogLevel::kWarn);

    EXPECT_FALSE(ParseLogLevel("verbose").ok());
}

TEST(LoggingTest, LogConfigFromSettings) {
    auto settings = Config::LoadFromString(R"(
logging:
  level: debug
  file: /tmp/clintab-test.log
  max_files: 2
)");
    ASSERT_TRUE(settings.ok());

    auto config = LogConfigFromSettings(*settings);
    ASSERT_TRUE(config.ok()) << config.status().message();
    EXPECT_EQ(config->level, LogLevel::kDebug);
    ASSERT_TRUE(config->file_path.has_value());
    EXPECT_EQ(*config->file_path, "/tmp/clintab-test.log");
    EXPECT_EQ(config->max_files, 2);
    EXPECT_EQ(config->max_file_size, 5 * 1024 * 1024);
}

TEST(LoggingTest, LogConfigDefaultsWithoutSection) {
    auto config = LogConfigFromSettings(Config{});
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->level, LogLevel::kInfo);
    EXPECT_FALSE(config->file_path.has_value());
}

TEST(LoggingTest, LogConfigRejectsUnknownLevel) {
    auto settings = Config::LoadFromString("logging:\n  level: chatty\n");
    ASSERT_TRUE(settings.ok());

    auto config = LogConfigFromSettings(*settings);
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(GetErrorCode(config.status()), ErrorCode::kConfigurationError);
}

TEST(LoggingTest, LoggingMacros) {
    InitLogging();

    // These should not throw
    EXPECT_NO_THROW({
        CLINTAB_LOG_TRACE("Trace message: {}", 1);
        CLINTAB_LOG_DEBUG("Debug message: {}", 2);
        CLINTAB_LOG_INFO("Info message: {}", 3);
        CLINTAB_LOG_WARN("Warn message: {}", 4);
        CLINTAB_LOG_ERROR("Error message: {}", 5);
    });
}

TEST(LoggingTest, FlushLogs) {
    InitLogging();
    CLINTAB_LOG_INFO("Test message");
    EXPECT_NO_THROW(FlushLogs());
}

}  // namespace
}  // namespace clintab
