/**
 * @file command_processor_test.cpp
 * @brief Tests for console command parsing and dispatch
 */

#include <gtest/gtest.h>
#include "debug_session/command_processor.hpp"
#include "debug_session/console_ui.hpp"
#include "debug_session/session_controller.hpp"
#include "logger.hpp"
#include "session_fakes.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

class CommandProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setOutput(&logSink);
        SessionConfig::getInstance()->resetToDefaults();

        path = "/tmp/debug_session_commands_" + std::to_string(getpid()) + ".py";
        std::ofstream file(path);
        for (int i = 1; i <= 12; ++i) {
            file << "line_" << i << " = " << i << "\n";
        }
        file.close();

        console = std::make_unique<ConsoleUI>(
            ConsoleUI::PromptOptions("(dbg) ", false, false, 10, false), out, err);
        controller = std::make_unique<SessionController>(*console, *console, backend);
        processor = std::make_unique<CommandProcessor>(*controller, *console);
    }

    void TearDown() override {
        processor.reset();
        controller.reset();
        console.reset();
        std::remove(path.c_str());
        Logger::setOutput(nullptr);
    }

    bool run(const std::string& line) {
        return processor->processCommand(line);
    }

    std::ostringstream logSink;
    std::ostringstream out;
    std::ostringstream err;
    std::string path;
    FakeBackend backend;
    std::unique_ptr<ConsoleUI> console;
    std::unique_ptr<SessionController> controller;
    std::unique_ptr<CommandProcessor> processor;
};

TEST_F(CommandProcessorTest, RegistersCommandsAndShortcuts) {
    for (const char* name : {"help", "h", "file", "f", "start", "r", "continue", "c",
                             "step", "s", "next", "n", "finish", "fin", "break", "b",
                             "list", "l", "info", "i", "stop", "quit", "q"}) {
        EXPECT_TRUE(processor->hasCommand(name)) << name;
    }
    EXPECT_FALSE(processor->hasCommand("registers"));
}

TEST_F(CommandProcessorTest, CompletesPrimaryCommandNames) {
    std::vector<std::string> expected = {"start", "step", "stop"};
    EXPECT_EQ(processor->getCompletions("st"), expected);
    EXPECT_TRUE(processor->getCompletions("zz").empty());
}

TEST_F(CommandProcessorTest, HelpListsCommands) {
    EXPECT_TRUE(run("help"));
    EXPECT_NE(out.str().find("Available commands:"), std::string::npos);
    EXPECT_NE(out.str().find("Usage: break <line> [file]"), std::string::npos);

    out.str("");
    EXPECT_TRUE(run("h next"));
    EXPECT_NE(out.str().find("Usage: next"), std::string::npos);
}

TEST_F(CommandProcessorTest, ReportsUnknownAndMalformedInput) {
    EXPECT_TRUE(run("frobnicate"));
    EXPECT_NE(err.str().find("Unknown command: frobnicate"), std::string::npos);

    EXPECT_TRUE(run("file \"unterminated"));
    EXPECT_NE(err.str().find("Unterminated quote"), std::string::npos);

    EXPECT_TRUE(run("continue now"));
    EXPECT_NE(err.str().find("Too many arguments for continue"), std::string::npos);

    EXPECT_TRUE(run(""));
}

TEST_F(CommandProcessorTest, FileOpensDocument) {
    EXPECT_TRUE(run("file " + path));
    EXPECT_EQ(console->currentFile(), path);
    EXPECT_NE(out.str().find("(12 lines)"), std::string::npos);

    EXPECT_TRUE(run("file /nonexistent/x.py"));
    EXPECT_NE(err.str().find("Failed to open file"), std::string::npos);
    EXPECT_EQ(console->currentFile(), path);
}

TEST_F(CommandProcessorTest, BreakTogglesUsingOneBasedLines) {
    ASSERT_TRUE(run("file " + path));

    EXPECT_TRUE(run("break 3"));
    auto lines = controller->breakpointsFor(path);
    ASSERT_EQ(lines.count(3), 1u);
    EXPECT_TRUE(lines.at(3).enabled);
    EXPECT_EQ(console->markers(path), std::set<int>{2});
    EXPECT_NE(out.str().find(path + ":3 enabled"), std::string::npos);

    EXPECT_TRUE(run("b 3"));
    EXPECT_FALSE(controller->breakpointsFor(path).at(3).enabled);
    EXPECT_TRUE(console->markers(path).empty());
    EXPECT_NE(out.str().find(path + ":3 disabled"), std::string::npos);
}

TEST_F(CommandProcessorTest, BreakRejectsBadLines) {
    ASSERT_TRUE(run("file " + path));

    EXPECT_TRUE(run("break x"));
    EXPECT_NE(err.str().find("Invalid line number"), std::string::npos);
    EXPECT_TRUE(run("break 0"));
    EXPECT_NE(err.str().find("Line numbers start at 1"), std::string::npos);
    EXPECT_TRUE(controller->getAllBreakpoints().empty());
}

TEST_F(CommandProcessorTest, BreakWithoutFileFails) {
    EXPECT_TRUE(run("break 3"));
    EXPECT_NE(err.str().find("No file loaded"), std::string::npos);
}

TEST_F(CommandProcessorTest, InfoBreakpointsListsLocations) {
    ASSERT_TRUE(run("file " + path));
    EXPECT_TRUE(run("info breakpoints"));
    EXPECT_NE(out.str().find("No breakpoints."), std::string::npos);

    ASSERT_TRUE(run("break 5"));
    out.str("");
    EXPECT_TRUE(run("i breakpoints"));
    EXPECT_NE(out.str().find(path + ":5"), std::string::npos);
    EXPECT_NE(out.str().find("enabled"), std::string::npos);

    EXPECT_TRUE(run("info registers"));
    EXPECT_NE(err.str().find("Unknown info command"), std::string::npos);
}

TEST_F(CommandProcessorTest, SessionCommandsDriveController) {
    ASSERT_TRUE(run("file " + path));
    ASSERT_TRUE(run("break 2"));

    EXPECT_TRUE(run("start"));
    EXPECT_EQ(controller->getPhase(), SessionController::Phase::Starting);
    ASSERT_EQ(backend.spawnedScripts, std::vector<std::string>{path});
    EXPECT_TRUE(console->isReadOnly());

    backend.link->onEvent(BootstrapEvent{});
    controller->flush();
    EXPECT_EQ(controller->getPhase(), SessionController::Phase::Running);

    EXPECT_TRUE(run("step"));
    EXPECT_NE(out.str().find("Cannot step while the session is Running"), std::string::npos);

    backend.link->onEvent(LineEvent{path, 2});
    controller->flush();
    EXPECT_EQ(console->selection(path), 1);

    EXPECT_TRUE(run("n"));
    EXPECT_EQ(backend.link->requests.back(), "stepOver");
    backend.link->onEvent(LineEvent{path, 3});
    controller->flush();
    EXPECT_TRUE(run("s"));
    EXPECT_EQ(backend.link->requests.back(), "stepInto");
    backend.link->onEvent(LineEvent{path, 4});
    controller->flush();
    EXPECT_TRUE(run("fin"));
    EXPECT_EQ(backend.link->requests.back(), "stepReturn");
    EXPECT_TRUE(run("c"));
    EXPECT_EQ(backend.link->requests.back(), "run");

    EXPECT_TRUE(run("file " + path));
    EXPECT_NE(err.str().find("Stop the session before opening another file"), std::string::npos);

    EXPECT_TRUE(run("stop"));
    EXPECT_EQ(controller->getPhase(), SessionController::Phase::Idle);
    EXPECT_FALSE(console->isReadOnly());
}

TEST_F(CommandProcessorTest, StackAndLocalsAreShown) {
    ASSERT_TRUE(run("file " + path));
    ASSERT_TRUE(run("start"));
    backend.link->onEvent(BootstrapEvent{});
    backend.link->onEvent(LineEvent{path, 4});
    StackSnapshot stack;
    stack.pushFrame("compute", path, 4);
    stack.addLocal("total", "10");
    backend.link->onEvent(StackEvent{stack});
    controller->flush();

    out.str("");
    EXPECT_TRUE(run("info stack"));
    EXPECT_NE(out.str().find("#0 compute at " + path + ":4"), std::string::npos);
    EXPECT_TRUE(run("info locals"));
    EXPECT_NE(out.str().find("total"), std::string::npos);
    EXPECT_TRUE(run("info events"));
    EXPECT_NE(out.str().find("[PHASE]"), std::string::npos);

    EXPECT_TRUE(run("list"));
    EXPECT_NE(out.str().find("  > line_4 = 4"), std::string::npos);
}

TEST_F(CommandProcessorTest, StartWithoutFileStaysIdle) {
    EXPECT_TRUE(run("start"));
    EXPECT_EQ(controller->getPhase(), SessionController::Phase::Idle);
    EXPECT_TRUE(backend.spawnedScripts.empty());
}

TEST_F(CommandProcessorTest, QuitEndsTheLoop) {
    ASSERT_TRUE(run("file " + path));
    ASSERT_TRUE(run("start"));

    EXPECT_FALSE(run("quit"));
    EXPECT_EQ(controller->getPhase(), SessionController::Phase::Idle);
    EXPECT_FALSE(run("q"));
}
