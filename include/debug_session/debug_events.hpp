// include/debug_session/debug_events.hpp

#ifndef DEBUG_SESSION_DEBUG_EVENTS_HPP
#define DEBUG_SESSION_DEBUG_EVENTS_HPP

#include "breakpoint_store.hpp"
#include "stack_snapshot.hpp"
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <variant>

enum class ExitStatus {
    NormalExit,
    CrashExit
};

// Events delivered by the debug link. Line numbers are 1-based.
struct BootstrapEvent {};

struct LineEvent {
    std::string file;
    int line;
};

struct StackEvent {
    StackSnapshot stack;
};

struct BreakpointEnableEvent {
    Breakpoint breakpoint;
};

struct BreakpointDisableEvent {
    Breakpoint breakpoint;
};

struct BreakpointIgnoreEvent {
    Breakpoint breakpoint;
    int count;
};

struct BreakpointClearEvent {
    Breakpoint breakpoint;
};

struct InfoEvent {
    std::string message;
};

struct WarningEvent {
    std::string message;
};

struct ErrorEvent {
    std::string message;
};

struct PostmortemEvent {
    std::string context;
};

struct RestartEvent {};

struct CallEvent {
    std::string args;
};

struct ReturnEvent {
    std::string value;
};

struct ExceptionEvent {
    std::string name;
    std::string value;
};

// Raised by the process handle rather than the link
struct ProcessFinishedEvent {
    int exitCode;
    ExitStatus status;
};

using SessionEvent = std::variant<
    BootstrapEvent,
    LineEvent,
    StackEvent,
    BreakpointEnableEvent,
    BreakpointDisableEvent,
    BreakpointIgnoreEvent,
    BreakpointClearEvent,
    InfoEvent,
    WarningEvent,
    ErrorEvent,
    PostmortemEvent,
    RestartEvent,
    CallEvent,
    ReturnEvent,
    ExceptionEvent,
    ProcessFinishedEvent>;

// Short human-readable form, used in logs and the event history
std::string describeEvent(const SessionEvent& event);

// Event tagged with the session generation it was posted for, so events
// from a torn-down session can be recognised and dropped.
struct QueuedEvent {
    uint64_t session{0};
    SessionEvent event;
};

// Thread-safe FIFO of session events with a single consumer.
class DebugEventQueue {
public:
    void push(QueuedEvent event) {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopped) return;
        queue.push(std::move(event));
        cv.notify_all();
    }

    // Blocks until an event is available or the queue is stopped and empty.
    // A successful pop marks the consumer busy until taskDone().
    bool pop(QueuedEvent& event) {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return !queue.empty() || stopped; });

        if (queue.empty()) {
            return false;
        }

        event = std::move(queue.front());
        queue.pop();
        busy = true;
        return true;
    }

    void taskDone() {
        std::lock_guard<std::mutex> lock(mutex);
        busy = false;
        cv.notify_all();
    }

    // Blocks until every pushed event has been popped and handled
    void waitUntilIdle() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return (queue.empty() && !busy) || (stopped && queue.empty()); });
    }

    // Remaining events are still handed out; pushes are refused from now on
    void stop() {
        std::lock_guard<std::mutex> lock(mutex);
        stopped = true;
        cv.notify_all();
    }

private:
    std::queue<QueuedEvent> queue;
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool stopped{false};
    bool busy{false};
};

#endif // DEBUG_SESSION_DEBUG_EVENTS_HPP
