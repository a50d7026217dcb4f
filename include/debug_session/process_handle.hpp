#ifndef DEBUG_SESSION_PROCESS_HANDLE_HPP
#define DEBUG_SESSION_PROCESS_HANDLE_HPP

#include "debug_events.hpp"
#include <functional>

// Lifecycle of the debuggee process.
class ProcessHandle {
public:
    using TerminationCallback = std::function<void(int exitCode, ExitStatus status)>;

    virtual ~ProcessHandle() = default;

    // Throws ProcessLaunchFailure
    virtual void start() = 0;
    virtual void kill() = 0;
    virtual bool waitForStarted(int timeoutMs) = 0;
    virtual bool waitForFinished(int timeoutMs) = 0;
    virtual bool isRunning() const = 0;

    // Called at most once, from any thread, when the process has exited
    virtual void setTerminationCallback(TerminationCallback callback) = 0;
};

#endif // DEBUG_SESSION_PROCESS_HANDLE_HPP
