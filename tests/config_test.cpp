/**
 * @file config_test.cpp
 * @brief Unit tests for INI configuration loading and saving
 */

#include <gtest/gtest.h>
#include "debug_session/config.hpp"
#include "logger.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

class SessionConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setOutput(&logSink);
        config = SessionConfig::getInstance();
        config->resetToDefaults();
        path = "/tmp/debug_session_config_test_" + std::to_string(getpid()) + ".ini";
    }

    void TearDown() override {
        std::remove(path.c_str());
        config->resetToDefaults();
        Logger::setOutput(nullptr);
        Logger::setLevel(LogLevel::INFO);
        Logger::setColorEnabled(true);
    }

    void writeFile(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    std::ostringstream logSink;
    std::shared_ptr<SessionConfig> config;
    std::string path;
};

TEST_F(SessionConfigTest, DefaultsMatchDocumentedValues) {
    EXPECT_EQ(config->session().interpreter, "python3");
    EXPECT_TRUE(config->session().runner.empty());
    EXPECT_EQ(config->session().startTimeoutMs, 30000);
    EXPECT_EQ(config->session().finishTimeoutMs, 30000);
    EXPECT_TRUE(config->session().statusMessages);
    EXPECT_EQ(config->log().level, "INFO");
    EXPECT_EQ(config->log().maxEventLogSize, 1000u);
    EXPECT_EQ(config->console().prompt, "(dbg) ");
    EXPECT_EQ(config->console().maxHistorySize, 1000u);
}

TEST_F(SessionConfigTest, LoadsAllSections) {
    writeFile(
        "# debugger settings\n"
        "[session]\n"
        "interpreter = /usr/bin/python3.11\n"
        "runner = /opt/runner.py\n"
        "startTimeoutMs = 500\n"
        "finishTimeoutMs = 750\n"
        "statusMessages = false\n"
        "\n"
        "[log]\n"
        "level = DEBUG\n"
        "colorOutput = false\n"
        "maxEventLogSize = 42\n"
        "\n"
        "; console\n"
        "[console]\n"
        "prompt = dbg>\n"
        "enableHistory = false\n"
        "enableCompletion = false\n"
        "maxHistorySize = 7\n");

    ASSERT_TRUE(config->loadFromFile(path));

    EXPECT_EQ(config->session().interpreter, "/usr/bin/python3.11");
    EXPECT_EQ(config->session().runner, "/opt/runner.py");
    EXPECT_EQ(config->session().startTimeoutMs, 500);
    EXPECT_EQ(config->session().finishTimeoutMs, 750);
    EXPECT_FALSE(config->session().statusMessages);
    EXPECT_EQ(config->log().level, "DEBUG");
    EXPECT_FALSE(config->log().colorOutput);
    EXPECT_EQ(config->log().maxEventLogSize, 42u);
    EXPECT_EQ(config->console().prompt, "dbg>");
    EXPECT_FALSE(config->console().enableHistory);
    EXPECT_FALSE(config->console().enableCompletion);
    EXPECT_EQ(config->console().maxHistorySize, 7u);
}

TEST_F(SessionConfigTest, UnknownKeysAreWarnedAndSkipped) {
    writeFile("[session]\ncolour = blue\ninterpreter = python3.12\nnot a pair\n");

    ASSERT_TRUE(config->loadFromFile(path));
    EXPECT_EQ(config->session().interpreter, "python3.12");
    EXPECT_NE(logSink.str().find("unknown key 'colour'"), std::string::npos);
    EXPECT_NE(logSink.str().find("without '='"), std::string::npos);
}

TEST_F(SessionConfigTest, MissingFileFails) {
    EXPECT_FALSE(config->loadFromFile("/nonexistent/dir/debug.ini"));
}

TEST_F(SessionConfigTest, BadNumberFailsLoad) {
    writeFile("[session]\nstartTimeoutMs = soon\n");
    EXPECT_FALSE(config->loadFromFile(path));
}

TEST_F(SessionConfigTest, SaveThenLoadPreservesValues) {
    config->session().runner = "/opt/runner.py";
    config->session().finishTimeoutMs = 1234;
    config->log().level = "TRACE";
    config->console().prompt = "debug>";
    ASSERT_TRUE(config->saveToFile(path));

    config->resetToDefaults();
    ASSERT_TRUE(config->loadFromFile(path));

    EXPECT_EQ(config->session().runner, "/opt/runner.py");
    EXPECT_EQ(config->session().finishTimeoutMs, 1234);
    EXPECT_EQ(config->log().level, "TRACE");
    EXPECT_EQ(config->console().prompt, "debug>");
}

TEST_F(SessionConfigTest, ApplyLogOptionsConfiguresLogger) {
    config->log().level = "warning";
    config->applyLogOptions();
    EXPECT_EQ(Logger::getLevel(), LogLevel::WARNING);

    config->log().level = "nonsense";
    config->applyLogOptions();
    EXPECT_EQ(Logger::getLevel(), LogLevel::INFO);
}
