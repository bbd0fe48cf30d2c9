#include "core/logging.hpp"

#include <gtest/gtest.h>

using namespace chord_cutter::logging;

TEST(LoggingTest, LevelFromString) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(logLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("info"), LogLevel::Info);
    EXPECT_EQ(logLevelFromString("warn"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("Warning"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("error"), LogLevel::Error);
    EXPECT_EQ(logLevelFromString("critical"), LogLevel::Critical);
    EXPECT_EQ(logLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(logLevelFromString("verbose"), LogLevel::Info);
}

TEST(LoggingTest, ParseRejectsUnknownNames) {
    EXPECT_EQ(parseLogLevel("Debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_FALSE(parseLogLevel("debgu").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

TEST(LoggingTest, StringRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warning, LogLevel::Error, LogLevel::Critical,
                       LogLevel::Off}) {
        EXPECT_EQ(logLevelFromString(toString(level)), level);
    }
}

TEST(LoggingTest, CreateReturnsSameNamedLogger) {
    auto first = LoggerFactory::create("LoggingTest");
    auto second = LoggerFactory::create("LoggingTest");
    ASSERT_TRUE(first);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->name(), "LoggingTest");
}

TEST(LoggingTest, GlobalLevelAppliesToExistingLoggers) {
    auto logger = LoggerFactory::create("LoggingLevelTest");
    LoggerFactory::setGlobalLevel(LogLevel::Error);
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Error);
    EXPECT_EQ(logger->level(), spdlog::level::err);

    LoggerFactory::setGlobalLevel(LogLevel::Info);
    EXPECT_EQ(logger->level(), spdlog::level::info);
}
