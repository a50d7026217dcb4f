/**
 * @file text_debug_link_test.cpp
 * @brief Tests for the pipe-based debug link and the POSIX backend
 */

#include <gtest/gtest.h>
#include "debug_session/posix_process.hpp"
#include "debug_session/session_controller.hpp"
#include "debug_session/text_debug_link.hpp"
#include "logger.hpp"
#include "session_fakes.hpp"
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <pthread.h>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace {

// Collects events delivered on the link's reader thread
class EventCollector {
public:
    DebugLink::EventCallback callback() {
        return [this](SessionEvent event) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(std::move(event));
            cv.notify_all();
        };
    }

    bool waitFor(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return events.size() >= count; });
    }

    std::vector<SessionEvent> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

private:
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<SessionEvent> events;
};

void writeText(int fd, const std::string& text) {
    ASSERT_EQ(write(fd, text.data(), text.size()), static_cast<ssize_t>(text.size()));
}

std::string readLine(int fd) {
    std::string line;
    char c;
    while (read(fd, &c, 1) == 1 && c != '\n') {
        line += c;
    }
    return line;
}

} // namespace

class TextDebugLinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setOutput(&logSink);
        ASSERT_EQ(pipe(toRunner), 0);
        ASSERT_EQ(pipe(fromRunner), 0);
    }

    void TearDown() override {
        for (int fd : {toRunner[0], toRunner[1], fromRunner[0], fromRunner[1]}) {
            if (fd >= 0) close(fd);
        }
        Logger::setOutput(nullptr);
    }

    std::ostringstream logSink;
    int toRunner[2]{-1, -1};
    int fromRunner[2]{-1, -1};
};

TEST_F(TextDebugLinkTest, SendsRequestsAsLines) {
    EventCollector collector;
    TextDebugLink link(toRunner[1], fromRunner[0], collector.callback());

    link.run();
    link.stepOver();
    link.stepInto();
    link.stepReturn();
    link.setBreakpoint("/work/a.py", 10);
    link.clearBreakpoint(Breakpoint("/work/a.py", 11));
    link.enableBreakpoint(Breakpoint("/my dir/a.py", 12));
    link.disableBreakpoint(Breakpoint("/work/a.py", 13));

    EXPECT_EQ(readLine(toRunner[0]), "run");
    EXPECT_EQ(readLine(toRunner[0]), "next");
    EXPECT_EQ(readLine(toRunner[0]), "step");
    EXPECT_EQ(readLine(toRunner[0]), "return");
    EXPECT_EQ(readLine(toRunner[0]), "break /work/a.py 10");
    EXPECT_EQ(readLine(toRunner[0]), "clear /work/a.py 11");
    EXPECT_EQ(readLine(toRunner[0]), "enable \"/my dir/a.py\" 12");
    EXPECT_EQ(readLine(toRunner[0]), "disable /work/a.py 13");
}

TEST_F(TextDebugLinkTest, DeliversDecodedEvents) {
    EventCollector collector;
    TextDebugLink link(toRunner[1], fromRunner[0], collector.callback());

    writeText(fromRunner[1], "bootstrap\nline /work/a.py 3\n");
    // A line split across writes
    writeText(fromRunner[1], "frame main /work/a.py 3\nlocal x ");
    writeText(fromRunner[1], "5\nendstack\n");

    ASSERT_TRUE(collector.waitFor(3));
    auto events = collector.snapshot();
    EXPECT_TRUE(std::holds_alternative<BootstrapEvent>(events[0]));
    EXPECT_EQ(std::get<LineEvent>(events[1]).line, 3);
    EXPECT_EQ(std::get<StackEvent>(events[2]).stack.innermostLocals().at("x"), "5");
}

TEST_F(TextDebugLinkTest, SkipsMalformedLines) {
    EventCollector collector;
    TextDebugLink link(toRunner[1], fromRunner[0], collector.callback());

    writeText(fromRunner[1], "gibberish here\nline a.py nope\ninfo still alive\n");

    ASSERT_TRUE(collector.waitFor(1));
    auto events = collector.snapshot();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<InfoEvent>(events[0]).message, "still alive");
}

TEST_F(TextDebugLinkTest, ClosedLinkRejectsRequests) {
    EventCollector collector;
    TextDebugLink link(toRunner[1], fromRunner[0], collector.callback());
    EXPECT_TRUE(link.isOpen());

    link.close();
    link.close();

    EXPECT_FALSE(link.isOpen());
    EXPECT_THROW(link.run(), LinkError);
    EXPECT_THROW(link.setBreakpoint("a.py", 1), LinkError);
}

TEST_F(TextDebugLinkTest, BrokenPipeIsLinkError) {
    EventCollector collector;
    TextDebugLink link(toRunner[1], fromRunner[0], collector.callback());

    close(toRunner[0]);
    toRunner[0] = -1;

    // Default disposition: an unhandled SIGPIPE would end the test binary
    auto previous = signal(SIGPIPE, SIG_DFL);

    EXPECT_THROW(link.run(), LinkError);
    EXPECT_THROW(link.setBreakpoint("a.py", 3), LinkError);

    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    EXPECT_EQ(sigismember(&pending, SIGPIPE), 0);

    sigset_t mask;
    sigemptyset(&mask);
    pthread_sigmask(SIG_SETMASK, nullptr, &mask);
    EXPECT_EQ(sigismember(&mask, SIGPIPE), 0);

    signal(SIGPIPE, previous);
}

TEST_F(TextDebugLinkTest, RejectsInvalidDescriptors) {
    EXPECT_THROW(TextDebugLink(-1, fromRunner[0], nullptr), LinkError);
}

TEST(PosixBackendTest, SpawnBuildsInterpreterCommandLine) {
    auto config = SessionConfig::getInstance();
    config->resetToDefaults();
    config->session().interpreter = "python3";
    config->session().runner = "/opt/runner.py";

    PosixBackend backend(config);
    auto process = backend.spawn("/work/a.py", "/work");
    auto* posix = dynamic_cast<PosixProcess*>(process.get());
    ASSERT_NE(posix, nullptr);
    std::vector<std::string> expected = {"python3", "/opt/runner.py", "/work/a.py"};
    EXPECT_EQ(posix->arguments(), expected);

    config->session().runner.clear();
    process = backend.spawn("/work/a.py", "/work");
    expected = {"python3", "/work/a.py"};
    EXPECT_EQ(dynamic_cast<PosixProcess*>(process.get())->arguments(), expected);

    config->resetToDefaults();
}

TEST(PosixBackendTest, ConnectRequiresItsOwnProcess) {
    PosixBackend backend;
    FakeProcess foreign(std::make_shared<ProcessRecord>());
    EXPECT_THROW(backend.connect(foreign, nullptr), LinkError);
}

// Drives a whole session against a shell script speaking the line protocol
class PosixSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setOutput(&logSink);
        config = SessionConfig::getInstance();
        config->resetToDefaults();
        config->session().interpreter = "/bin/sh";
        config->session().finishTimeoutMs = 5000;

        script = "/tmp/debug_session_runner_" + std::to_string(getpid()) + ".sh";
        std::ofstream out(script);
        out << "echo bootstrap\n"
            << "while read cmd rest; do\n"
            << "  case \"$cmd\" in\n"
            << "    break) echo \"enable $rest\" ;;\n"
            << "    run) echo \"frame main $0 2\"; echo \"local x 41\"; echo endstack;"
            << " echo \"line $0 2\" ;;\n"
            << "    next) exit 0 ;;\n"
            << "  esac\n"
            << "done\n";
    }

    void TearDown() override {
        std::remove(script.c_str());
        config->resetToDefaults();
        Logger::setOutput(nullptr);
    }

    bool waitForPhase(SessionController& controller, SessionController::Phase phase) {
        for (int i = 0; i < 500; ++i) {
            controller.flush();
            if (controller.getPhase() == phase) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    std::ostringstream logSink;
    std::shared_ptr<SessionConfig> config;
    std::string script;
};

TEST_F(PosixSessionTest, RunsToBreakpointAndFinishes) {
    FakeUI ui;
    FakeDocuments docs;
    docs.workspace = "/tmp";
    docs.open(script);
    PosixBackend backend(config);
    SessionController controller(ui, docs, backend, config);

    controller.toggleBreakpoint(script, 1);
    controller.start();

    ASSERT_TRUE(waitForPhase(controller, SessionController::Phase::Paused));
    EXPECT_EQ(ui.selectionFor(script), 1);
    EXPECT_EQ(ui.locals.at("x"), "41");
    EXPECT_EQ(ui.markersFor(script), std::set<int>{1});

    ASSERT_TRUE(controller.stepOver());
    ASSERT_TRUE(waitForPhase(controller, SessionController::Phase::Idle));
    EXPECT_FALSE(controller.hasProcess());
    EXPECT_TRUE(ui.hasCall("showStatus Your script has finished running."));

    controller.stop();
    EXPECT_FALSE(ui.readOnly);
}

TEST_F(PosixSessionTest, StopKillsRunningScript) {
    FakeUI ui;
    FakeDocuments docs;
    docs.workspace = "/tmp";
    docs.open(script);
    PosixBackend backend(config);
    SessionController controller(ui, docs, backend, config);

    controller.start();
    ASSERT_TRUE(waitForPhase(controller, SessionController::Phase::Paused));

    controller.stop();
    EXPECT_EQ(controller.getPhase(), SessionController::Phase::Idle);
    EXPECT_FALSE(controller.hasProcess());
    EXPECT_FALSE(controller.hasLink());
}

TEST_F(PosixSessionTest, MissingInterpreterIsReported) {
    config->session().interpreter = "/nonexistent/python";
    FakeUI ui;
    FakeDocuments docs;
    docs.open(script);
    PosixBackend backend(config);
    SessionController controller(ui, docs, backend, config);

    controller.start();

    EXPECT_EQ(controller.getPhase(), SessionController::Phase::Idle);
    EXPECT_NE(ui.lastStatus().find("Could not run /nonexistent/python"), std::string::npos);
}
