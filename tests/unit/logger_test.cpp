#include "logging/logger.hpp"

#include <gtest/gtest.h>

using namespace squirrel::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = Logger::level(); }
    void TearDown() override { Logger::set_level(saved_); }

    Level saved_ = Level::LVL_INFO;
};

TEST_F(LoggerTest, StringToLevelIsCaseInsensitive) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("INFO"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level("Warn"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("error"), Level::LVL_ERROR);
}

TEST_F(LoggerTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(string_to_level("verbose"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level(""), Level::LVL_INFO);
}

TEST_F(LoggerTest, ThresholdFiltersLowerLevels) {
    Logger::set_level(Level::LVL_WARN);
    EXPECT_FALSE(Logger::enabled(Level::LVL_DEBUG));
    EXPECT_FALSE(Logger::enabled(Level::LVL_INFO));
    EXPECT_TRUE(Logger::enabled(Level::LVL_WARN));
    EXPECT_TRUE(Logger::enabled(Level::LVL_ERROR));
    EXPECT_FALSE(Logger::enabled(Level::LVL_NONE));
}

TEST_F(LoggerTest, MacrosDoNotEvaluateFilteredMessages) {
    Logger::set_level(Level::LVL_ERROR);
    int evaluations = 0;
    auto count = [&evaluations]() { return ++evaluations; };

    LOG_DEBUG("value " << count());
    LOG_INFO("value " << count());
    EXPECT_EQ(evaluations, 0);

    testing::internal::CaptureStderr();
    LOG_ERROR("value " << count());
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(evaluations, 1);
    EXPECT_NE(output.find("[ERROR]"), std::string::npos);
    EXPECT_NE(output.find("value 1"), std::string::npos);
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_STREQ(level_to_string(Level::LVL_DEBUG), "DEBUG");
    EXPECT_STREQ(level_to_string(Level::LVL_WARN), "WARN");
    EXPECT_STREQ(level_to_string(Level::LVL_NONE), "NONE");
}
