#ifndef DEBUG_SESSION_DEBUG_LINK_HPP
#define DEBUG_SESSION_DEBUG_LINK_HPP

#include "breakpoint_store.hpp"
#include "debug_events.hpp"
#include "process_handle.hpp"
#include <functional>
#include <memory>
#include <string>

// Request side of the channel to the debuggee. Requests are fire-and-forget;
// their outcome arrives later as an event. Every request throws LinkError
// once the link is closed.
class DebugLink {
public:
    using EventCallback = std::function<void(SessionEvent)>;

    virtual ~DebugLink() = default;

    virtual void run() = 0;
    virtual void stepOver() = 0;
    virtual void stepInto() = 0;
    virtual void stepReturn() = 0;

    virtual void setBreakpoint(const std::string& file, int line) = 0;
    virtual void clearBreakpoint(const Breakpoint& bp) = 0;
    virtual void enableBreakpoint(const Breakpoint& bp) = 0;
    virtual void disableBreakpoint(const Breakpoint& bp) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

// Creates the process and link for one session.
class SessionBackend {
public:
    virtual ~SessionBackend() = default;

    // The returned process has not been started yet
    virtual std::unique_ptr<ProcessHandle> spawn(const std::string& script,
                                                 const std::string& workingDir) = 0;

    // Events may be delivered on any thread until the link is closed.
    // Throws LinkError when the debuggee cannot be reached.
    virtual std::unique_ptr<DebugLink> connect(ProcessHandle& process,
                                               DebugLink::EventCallback onEvent) = 0;
};

#endif // DEBUG_SESSION_DEBUG_LINK_HPP
