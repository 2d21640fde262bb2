// =============================================================================
// Logger Tests
// =============================================================================

#include <gtest/gtest.h>
#include "hexzset/logging.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace hexzset;

class LoggingTest : public ::testing::Test {
protected:
    std::ostringstream captured;

    void SetUp() override {
        set_log_output(captured);
        set_log_level(LogLevel::INFO);
    }

    void TearDown() override {
        set_log_output(std::cerr);
        set_log_level(LogLevel::INFO);
    }
};

TEST_F(LoggingTest, LineLayout) {
    LOG_WARN("cell ", 42, " skipped");
    const std::string line = captured.str();

    EXPECT_EQ(line.front(), '[');
    EXPECT_NE(line.find("] WARN test_logging.cpp:"), std::string::npos) << line;
    EXPECT_NE(line.find("() - cell 42 skipped\n"), std::string::npos) << line;
    // Directory part of __FILE__ is stripped
    EXPECT_EQ(line.find("tests/gtest/"), std::string::npos) << line;
}

TEST_F(LoggingTest, LevelFiltering) {
    LOG_DEBUG("hidden");
    EXPECT_TRUE(captured.str().empty());

    LOG_INFO("shown");
    LOG_ERROR("also shown");
    const std::string out = captured.str();
    EXPECT_NE(out.find("INFO"), std::string::npos);
    EXPECT_NE(out.find("EROR"), std::string::npos);

    set_log_level(LogLevel::ERROR);
    captured.str("");
    LOG_WARN("filtered");
    EXPECT_TRUE(captured.str().empty());
}

TEST_F(LoggingTest, DisabledLinesDoNotEvaluateArguments) {
    int calls = 0;
    auto expensive = [&calls]() { ++calls; return std::string("value"); };

    LOG_DEBUG("value=", expensive());
    EXPECT_EQ(calls, 0);

    set_log_level(LogLevel::DEBUG);
    LOG_DEBUG("value=", expensive());
    EXPECT_EQ(calls, 1);
    EXPECT_NE(captured.str().find("value=value"), std::string::npos);
}

TEST_F(LoggingTest, FatalDoesNotTerminate) {
    LOG_FATAL("still running");
    EXPECT_NE(captured.str().find("FATL"), std::string::npos);
}

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("fatal"), LogLevel::FATAL);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST(LogLevelTest, SetByName) {
    EXPECT_TRUE(set_log_level(std::string("warn")));
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::WARN);

    EXPECT_FALSE(set_log_level(std::string("loud")));
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::WARN);

    set_log_level(LogLevel::INFO);
}

TEST(LogLevelTest, Tags) {
    EXPECT_STREQ(log_level_tag(LogLevel::DEBUG), "DEBG");
    EXPECT_STREQ(log_level_tag(LogLevel::ERROR), "EROR");
}
