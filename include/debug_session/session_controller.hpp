#ifndef DEBUG_SESSION_SESSION_CONTROLLER_HPP
#define DEBUG_SESSION_SESSION_CONTROLLER_HPP

#include "breakpoint_store.hpp"
#include "config.hpp"
#include "debug_events.hpp"
#include "debug_link.hpp"
#include "event_logger.hpp"
#include "process_handle.hpp"
#include "session_errors.hpp"
#include "session_mode.hpp"
#include "stack_snapshot.hpp"
#include "ui_sink.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Drives one debug session at a time. UI commands and debuggee events are
// serialised on a single mutex; events are queued and handled in arrival
// order by a dedicated dispatcher thread.
//
// UISink and DocumentHost are called with the controller locked, so their
// implementations must not call back into the controller.
class SessionController : public SessionMode {
public:
    enum class Phase {
        Idle,       // No session
        Starting,   // Process launched, link not yet bootstrapped
        Running,    // Debuggee executing
        Paused,     // Halted at a breakpoint or step boundary
        Finished    // Process exited, UI cleanup in progress
    };

    struct Location {
        std::string file;
        int line;   // 1-based
    };

    SessionController(UISink& ui,
                      DocumentHost& documents,
                      SessionBackend& backend,
                      std::shared_ptr<SessionConfig> config = SessionConfig::getInstance());
    ~SessionController() override;

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // SessionMode
    std::string name() const override { return "Graphical Debugger"; }
    std::string description() const override { return "Debug your Python 3 code."; }
    std::vector<Action> actions() override;
    void start() override;
    void stop() override;

    // Execution commands. Return false when the command was rejected.
    bool continueExecution();
    bool stepOver();
    bool stepInto();
    bool stepReturn();

    // line is 0-based, as the editor counts
    void toggleBreakpoint(const std::string& file, int line);

    // Queue an event for the current session
    void post(SessionEvent event);
    // Handle an event immediately, on the calling thread
    void dispatch(const SessionEvent& event);
    // Block until every queued event has been handled
    void flush();

    // Read-only views
    Phase getPhase() const;
    bool hasProcess() const;
    bool hasLink() const;
    std::optional<Location> getPosition() const;
    StackSnapshot getStack() const;
    BreakpointStore::LineMap breakpointsFor(const std::string& file) const;
    std::vector<Breakpoint> getAllBreakpoints() const;
    const EventLogger& getEventLogger() const { return *eventLogger; }

    static const char* phaseName(Phase phase);
    static const std::vector<std::string>& actionNames();

private:
    UISink& ui;
    DocumentHost& documents;
    SessionBackend& backend;
    std::shared_ptr<SessionConfig> config;
    std::shared_ptr<EventLogger> eventLogger;

    // Session state, guarded by mutex
    mutable std::mutex mutex;
    Phase phase{Phase::Idle};
    BreakpointStore store;
    std::unique_ptr<ProcessHandle> process;
    std::unique_ptr<DebugLink> link;
    std::string script;
    StackSnapshot stack;
    std::optional<Location> position;
    bool uiSessionActive{false};   // inspector shown and editor read-only
    std::atomic<uint64_t> sessionGeneration{0};

    // Event handling
    DebugEventQueue eventQueue;
    std::thread eventThread;
    void eventLoop();
    void postFor(uint64_t session, SessionEvent event);
    void handleEvent(const SessionEvent& event);

    void handle(const BootstrapEvent& event);
    void handle(const LineEvent& event);
    void handle(const StackEvent& event);
    void handle(const BreakpointEnableEvent& event);
    void handle(const BreakpointDisableEvent& event);
    void handle(const BreakpointIgnoreEvent& event);
    void handle(const BreakpointClearEvent& event);
    void handle(const InfoEvent& event);
    void handle(const WarningEvent& event);
    void handle(const ErrorEvent& event);
    void handle(const PostmortemEvent& event);
    void handle(const RestartEvent& event);
    void handle(const CallEvent& event);
    void handle(const ReturnEvent& event);
    void handle(const ExceptionEvent& event);
    void handle(const ProcessFinishedEvent& event);

    // Helpers; all expect mutex to be held
    void launch(const std::string& path);
    void teardown();
    void failSession(const SessionError& error);
    bool request(const std::string& what, const std::function<void(DebugLink&)>& send);
    bool issueCommand(const char* command, bool allowWhileRunning,
                      const std::function<void(DebugLink&)>& send);
    bool sessionLive() const;
    void setPhase(Phase next);
    void onBreakpointChanged(const Breakpoint& bp);
    void resyncMarkers();
    void recordInert(const SessionEvent& event);
};

#endif // DEBUG_SESSION_SESSION_CONTROLLER_HPP
