/**
 * @file test_Logger.cpp
 * @brief Unit tests for Logger.h - levels, handlers and deprecation warnings
 */

#include <gtest/gtest.h>
#include "pfl/Core/Logger.h"
#include <string>
#include <vector>

using namespace pfl;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::instance();
        previous_level_ = logger.get_level();
        logger.set_console_output(false);
        handler_id_ = logger.add_handler([this](const LogMessage& msg) {
            messages_.push_back(msg);
        });
    }

    void TearDown() override {
        Logger& logger = Logger::instance();
        logger.remove_handler(handler_id_);
        logger.set_level(previous_level_);
        logger.set_console_output(true);
    }

    std::vector<LogMessage> messages_;
    std::size_t handler_id_ = 0;
    LogLevel previous_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("WARNING", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_FALSE(parse_log_level("nonsense", level));
    EXPECT_EQ(level, LogLevel::WARNING);
}

TEST_F(LoggerTest, MessagesBelowLevelAreDropped) {
    Logger::instance().set_level(LogLevel::WARNING);
    PFL_LOG_INFO("not shown");
    PFL_LOG_WARNING("shown");
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].message, "shown");
    EXPECT_EQ(messages_[0].level, LogLevel::WARNING);
}

TEST_F(LoggerTest, StreamInterface) {
    Logger::instance().set_level(LogLevel::INFO);
    PFL_INFO() << "resolution " << 64;
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].message, "resolution 64");
}

TEST_F(LoggerTest, RemovedHandlerIsNotCalled) {
    Logger::instance().set_level(LogLevel::INFO);
    Logger::instance().remove_handler(handler_id_);
    PFL_LOG_INFO("after removal");
    EXPECT_TRUE(messages_.empty());
}

TEST_F(LoggerTest, DeprecationWarnsOncePerName) {
    Logger::instance().set_level(LogLevel::WARNING);
    std::size_t before = deprecated_names_reported();
    warn_deprecated("test_only_name", "use something_else()");
    warn_deprecated("test_only_name", "use something_else()");
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].level, LogLevel::WARNING);
    EXPECT_NE(messages_[0].message.find("test_only_name"), std::string::npos);
    EXPECT_EQ(deprecated_names_reported(), before + 1);
}

TEST_F(LoggerTest, ScopedTimerLogsOnExit) {
    Logger::instance().set_level(LogLevel::DEBUG);
    {
        ScopedTimer timer("resample", LogLevel::INFO);
    }
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_NE(messages_[0].message.find("Completed: resample"), std::string::npos);
}
