#include "debug_session/event_logger.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

struct TypeInfo {
    EventLogger::EventType type;
    const char* name;
    const char* tag;
};

// Display order for summaries
const TypeInfo kTypes[] = {
    {EventLogger::EventType::PHASE,      "Phase",      "[PHASE]"},
    {EventLogger::EventType::BREAKPOINT, "Breakpoint", "[BRK]"},
    {EventLogger::EventType::LINK,       "Link",       "[LINK]"},
    {EventLogger::EventType::PROCESS,    "Process",    "[PROC]"},
    {EventLogger::EventType::DIAGNOSTIC, "Diagnostic", "[DIAG]"},
    {EventLogger::EventType::ERROR,      "Error",      "[ERR]"},
};

const TypeInfo* findType(EventLogger::EventType type) {
    for (const auto& info : kTypes) {
        if (info.type == type) return &info;
    }
    return nullptr;
}

} // namespace

EventLogger::Event::Event(EventType t,
                          const std::string& desc,
                          const std::string& loc,
                          const std::string& extra)
    : type(t)
    , description(desc)
    , location(loc)
    , extraInfo(extra)
    , timestamp(std::chrono::system_clock::now())
{}

// HH:MM:SS.mmm in local time
std::string EventLogger::Event::getFormattedTime() const {
    std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    std::tm local{};
    localtime_r(&seconds, &local);

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

std::string EventLogger::Event::toString() const {
    std::ostringstream oss;
    oss << "[" << getFormattedTime() << "] "
        << std::left << std::setw(8) << getEventTypeTag(type)
        << description;
    if (!location.empty()) {
        oss << " at " << location;
    }
    if (!extraInfo.empty()) {
        oss << "\n    " << extraInfo;
    }
    return oss.str();
}

EventLogger::EventLogger(size_t capacity)
    : capacity(capacity)
{}

void EventLogger::logEvent(EventType type,
                           const std::string& description,
                           const std::string& location,
                           const std::string& extraInfo) {
    if (!enabled) return;

    Event event(type, description, location, extraInfo);
    std::vector<Listener> toNotify;
    {
        std::lock_guard<std::mutex> lock(mutex);
        event.sequence = nextSequence++;
        history.push_back(event);
        while (history.size() > capacity) {
            history.pop_front();
        }
        toNotify = listeners;
    }

    for (const auto& listener : toNotify) {
        listener(event);
    }
}

void EventLogger::printLastEvents(size_t count, std::ostream& out) const {
    std::lock_guard<std::mutex> lock(mutex);
    size_t skip = history.size() > count ? history.size() - count : 0;
    for (auto it = history.begin() + static_cast<std::ptrdiff_t>(skip); it != history.end(); ++it) {
        out << it->toString() << "\n";
    }
}

void EventLogger::generateSummary(std::ostream& out) const {
    std::lock_guard<std::mutex> lock(mutex);

    out << "\nEvent Summary:\n"
        << "=============\n";
    for (const auto& info : kTypes) {
        size_t count = 0;
        for (const auto& event : history) {
            if (event.type == info.type) ++count;
        }
        if (count > 0) {
            out << std::left << std::setw(12) << info.name << ": " << count << "\n";
        }
    }
    out << "Total Events: " << history.size() << "\n";
    if (!history.empty()) {
        out << "Span: " << history.front().getFormattedTime()
            << " - " << history.back().getFormattedTime() << "\n";
    }
}

std::vector<EventLogger::Event> EventLogger::getEventsByType(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Event> matching;
    for (const auto& event : history) {
        if (event.type == type) {
            matching.push_back(event);
        }
    }
    return matching;
}

std::vector<EventLogger::Event> EventLogger::getEvents() const {
    std::lock_guard<std::mutex> lock(mutex);
    return std::vector<Event>(history.begin(), history.end());
}

size_t EventLogger::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return history.size();
}

void EventLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    history.clear();
}

void EventLogger::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex);
    listeners.push_back(std::move(listener));
}

void EventLogger::clearListeners() {
    std::lock_guard<std::mutex> lock(mutex);
    listeners.clear();
}

std::string EventLogger::getEventTypeName(EventType type) {
    const TypeInfo* info = findType(type);
    return info ? info->name : "Unknown";
}

const char* EventLogger::getEventTypeTag(EventType type) {
    const TypeInfo* info = findType(type);
    return info ? info->tag : "[?]";
}
