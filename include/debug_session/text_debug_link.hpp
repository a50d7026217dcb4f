#ifndef DEBUG_SESSION_TEXT_DEBUG_LINK_HPP
#define DEBUG_SESSION_TEXT_DEBUG_LINK_HPP

#include "debug_link.hpp"
#include "link_protocol.hpp"
#include "config.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

// DebugLink over a pair of file descriptors using the line protocol. A reader
// thread decodes incoming lines and hands events to the callback. The link
// does not own the descriptors.
class TextDebugLink : public DebugLink {
public:
    TextDebugLink(int writeFd, int readFd, EventCallback onEvent);
    ~TextDebugLink() override;

    TextDebugLink(const TextDebugLink&) = delete;
    TextDebugLink& operator=(const TextDebugLink&) = delete;

    void run() override;
    void stepOver() override;
    void stepInto() override;
    void stepReturn() override;

    void setBreakpoint(const std::string& file, int line) override;
    void clearBreakpoint(const Breakpoint& bp) override;
    void enableBreakpoint(const Breakpoint& bp) override;
    void disableBreakpoint(const Breakpoint& bp) override;

    void close() override;
    bool isOpen() const override { return open; }

private:
    int writeFd;
    int readFd;
    int wakePipe[2]{-1, -1};
    EventCallback onEvent;
    std::atomic<bool> open{true};
    std::mutex writeMutex;
    std::thread reader;

    void send(const std::string& message);
    void readLoop();
    void deliver(const std::string& line, link_protocol::Decoder& decoder);
};

// Runs "<interpreter> [runner] <script>" and talks to it over its stdio.
class PosixBackend : public SessionBackend {
public:
    explicit PosixBackend(std::shared_ptr<SessionConfig> config = SessionConfig::getInstance());

    std::unique_ptr<ProcessHandle> spawn(const std::string& script,
                                         const std::string& workingDir) override;
    std::unique_ptr<DebugLink> connect(ProcessHandle& process,
                                       DebugLink::EventCallback onEvent) override;

private:
    std::shared_ptr<SessionConfig> config;
};

#endif // DEBUG_SESSION_TEXT_DEBUG_LINK_HPP
