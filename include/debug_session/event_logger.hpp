#ifndef DEBUG_SESSION_EVENT_LOGGER_HPP
#define DEBUG_SESSION_EVENT_LOGGER_HPP

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

// Bounded history of what happened during debug sessions. Kept in memory so
// a postmortem or a failed launch always leaves a diagnostic record behind.
class EventLogger {
public:
    enum class EventType {
        PHASE,        // Session phase transition
        BREAKPOINT,   // Breakpoint created, enabled or disabled
        LINK,         // Request sent to or event received from the debuggee
        PROCESS,      // Process launched, killed or finished
        DIAGNOSTIC,   // Inert events and postmortem context
        ERROR         // Error condition
    };

    struct Event {
        EventType type;
        uint64_t sequence{0};   // assigned on record, never reused
        std::string description;
        std::string location;   // file:line or script path
        std::string extraInfo;
        std::chrono::system_clock::time_point timestamp;

        Event(EventType t,
              const std::string& desc,
              const std::string& loc = "",
              const std::string& extra = "");

        std::string getFormattedTime() const;
        std::string toString() const;
    };

    using Listener = std::function<void(const Event&)>;

    explicit EventLogger(size_t capacity = 1000);

    void logEvent(EventType type,
                  const std::string& description,
                  const std::string& location = "",
                  const std::string& extraInfo = "");

    void printLastEvents(size_t count = 10, std::ostream& out = std::cout) const;
    void generateSummary(std::ostream& out = std::cout) const;

    std::vector<Event> getEventsByType(EventType type) const;
    std::vector<Event> getEvents() const;
    size_t size() const;
    size_t getCapacity() const { return capacity; }

    void clear();
    void setEnabled(bool enable) { enabled = enable; }
    bool isEnabled() const { return enabled; }

    // Called outside the history lock, in the order they were added
    void addListener(Listener listener);
    void clearListeners();

    static std::string getEventTypeName(EventType type);
    static const char* getEventTypeTag(EventType type);

private:
    std::deque<Event> history;
    std::vector<Listener> listeners;
    const size_t capacity;
    uint64_t nextSequence{1};
    bool enabled{true};
    mutable std::mutex mutex;
};

#endif // DEBUG_SESSION_EVENT_LOGGER_HPP
