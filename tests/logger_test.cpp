/**
 * @file logger_test.cpp
 * @brief Tests for level filtering and output redirection of the logger
 */

#include <gtest/gtest.h>
#include "logger.hpp"
#include <sstream>
#include <string>
#include <thread>
#include <vector>

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setOutput(&sink);
        Logger::setColorEnabled(false);
        Logger::setLevel(LogLevel::INFO);
    }

    void TearDown() override {
        Logger::setOutput(nullptr);
        Logger::setColorEnabled(true);
        Logger::setLevel(LogLevel::INFO);
    }

    std::ostringstream sink;
};

TEST_F(LoggerTest, FiltersByLevel) {
    LOG_INFO("shown ", 1);
    LOG_DEBUG("hidden");
    EXPECT_EQ(sink.str(), "[INFO ] shown 1\n");

    Logger::setLevel(LogLevel::TRACE);
    LOG_TRACE("now ", "visible");
    EXPECT_NE(sink.str().find("[TRACE] now visible"), std::string::npos);
}

TEST_F(LoggerTest, ParsesLevelNames) {
    EXPECT_TRUE(Logger::setLevelFromString("warn"));
    EXPECT_EQ(Logger::getLevel(), LogLevel::WARNING);
    EXPECT_TRUE(Logger::setLevelFromString("Debug"));
    EXPECT_EQ(Logger::getLevel(), LogLevel::DEBUG);
    EXPECT_TRUE(Logger::setLevelFromString("0"));
    EXPECT_EQ(Logger::getLevel(), LogLevel::ERROR);

    EXPECT_FALSE(Logger::setLevelFromString("loud"));
    EXPECT_EQ(Logger::getLevel(), LogLevel::INFO);

    EXPECT_EQ(Logger::levelToString(LogLevel::WARNING), "WARNING");
}

TEST_F(LoggerTest, ColorWrapsTheLabel) {
    Logger::setColorEnabled(true);
    LOG_ERROR("broken");
    EXPECT_EQ(sink.str(), "\033[31m[ERROR] \033[0mbroken\n");
}

TEST_F(LoggerTest, LevelAndColorChangeWhileOtherThreadsLog) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([t]() {
            for (int i = 0; i < 500; ++i) {
                LOG_WARNING("writer ", t, " message ", i);
            }
        });
    }
    for (int i = 0; i < 500; ++i) {
        Logger::setLevel(i % 2 ? LogLevel::ERROR : LogLevel::TRACE);
        Logger::setColorEnabled(false);
    }
    for (auto& writer : writers) {
        writer.join();
    }

    std::istringstream lines(sink.str());
    std::string line;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line.rfind("[WARN ] writer ", 0), 0u) << line;
    }
}
