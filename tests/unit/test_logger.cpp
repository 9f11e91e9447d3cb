/**
 * @file test_logger.cpp
 * @brief Level handling of the process-wide logger.
 */

#include <gtest/gtest.h>

#include <convo/utils/Logger.hpp>

using convo::utils::Logger;

class LoggerTest : public ::testing::Test
{
protected:
    void SetUp() override { saved_ = Logger::getInstance().level(); }
    void TearDown() override { Logger::getInstance().setLevel(saved_); }

    Logger::Level saved_ = Logger::Level::INFO;
};

TEST_F(LoggerTest, IsASingleton)
{
    EXPECT_EQ(&Logger::getInstance(), &Logger::getInstance());
}

TEST_F(LoggerTest, ParsesLevelNamesCaseInsensitively)
{
    EXPECT_EQ(Logger::parse_level("trace"), Logger::Level::TRACE);
    EXPECT_EQ(Logger::parse_level("DEBUG"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::parse_level("Info"), Logger::Level::INFO);
    EXPECT_EQ(Logger::parse_level("warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::WARN);
    EXPECT_EQ(Logger::parse_level("error"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::parse_level("critical"), Logger::Level::CRITICAL);
    EXPECT_EQ(Logger::parse_level("off"), Logger::Level::OFF);
}

TEST_F(LoggerTest, UnknownLevelFallsBackToInfo)
{
    EXPECT_EQ(Logger::parse_level("verbose"), Logger::Level::INFO);
    EXPECT_EQ(Logger::parse_level(""), Logger::Level::INFO);
}

TEST_F(LoggerTest, SetLevelByName)
{
    auto &logger = Logger::getInstance();

    logger.setLevel("error");
    EXPECT_EQ(logger.level(), Logger::Level::ERROR);

    logger.setLevel(Logger::Level::DEBUG);
    EXPECT_EQ(logger.level(), Logger::Level::DEBUG);
}

TEST_F(LoggerTest, LoggingBelowLevelIsHarmless)
{
    auto &logger = Logger::getInstance();
    logger.setLevel(Logger::Level::OFF);
    logger.log(Logger::Level::INFO, "[Test] {} {}", "suppressed", 1);
    SUCCEED();
}
