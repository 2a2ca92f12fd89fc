#include "simpleshare/logger.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <thread>

using namespace simpleshare;

TEST(Logger, ParsesLevelNamesCaseInsensitively) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parseLevel("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(Logger::parseLevel("Trace", level));
    EXPECT_EQ(level, LogLevel::TRACE);

    EXPECT_FALSE(Logger::parseLevel("loud", level));
    EXPECT_EQ(level, LogLevel::TRACE);
}

TEST(Logger, LevelGatesOutput) {
    LogLevel saved = Logger::level();
    Logger::setLevel(LogLevel::WARN);
    EXPECT_TRUE(Logger::enabled(LogLevel::ERROR));
    EXPECT_TRUE(Logger::enabled(LogLevel::WARN));
    EXPECT_FALSE(Logger::enabled(LogLevel::INFO));
    Logger::setLevel(saved);
}

TEST(Logger, InitFromEnvironment) {
    LogLevel saved = Logger::level();
    ::setenv("SIMPLESHARE_LOG_LEVEL", "error", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::ERROR);

    ::setenv("SIMPLESHARE_LOG_LEVEL", "nonsense", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::INFO);

    ::unsetenv("SIMPLESHARE_LOG_LEVEL");
    Logger::setLevel(saved);
}

TEST(Logger, ThreadNamesArePerThread) {
    setThreadName("Main-Test");
    std::string other;
    std::thread([&] {
        setThreadName(getThreadName(3));
        other = currentThreadName();
    }).join();

    EXPECT_EQ(other, "Worker-3");
    EXPECT_EQ(currentThreadName(), "Main-Test");
}
