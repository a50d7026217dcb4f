#include "debug_session/breakpoint_store.hpp"
#include "logger.hpp"
#include <stdexcept>

Breakpoint* BreakpointStore::find(const std::string& file, int line) {
    auto fileIt = breakpoints.find(file);
    if (fileIt == breakpoints.end()) return nullptr;

    auto it = fileIt->second.find(line);
    return it != fileIt->second.end() ? &it->second : nullptr;
}

const Breakpoint* BreakpointStore::find(const std::string& file, int line) const {
    auto fileIt = breakpoints.find(file);
    if (fileIt == breakpoints.end()) return nullptr;

    auto it = fileIt->second.find(line);
    return it != fileIt->second.end() ? &it->second : nullptr;
}

BreakpointStore::LineMap BreakpointStore::allFor(const std::string& file) const {
    auto it = breakpoints.find(file);
    return it != breakpoints.end() ? it->second : LineMap();
}

std::vector<Breakpoint> BreakpointStore::getAllBreakpoints() const {
    std::vector<Breakpoint> result;
    for (const auto& [_, lines] : breakpoints) {
        for (const auto& [line, bp] : lines) {
            result.push_back(bp);
        }
    }
    return result;
}

Breakpoint& BreakpointStore::create(const std::string& file, int line) {
    if (line < 1) {
        throw std::invalid_argument("Breakpoint line must be positive, got " +
                                    std::to_string(line) + " for " + file);
    }

    auto& lines = breakpoints[file];
    auto it = lines.find(line);
    if (it != lines.end()) {
        LOG_DEBUG("Reusing breakpoint at ", it->second.location());
        it->second.enabled = true;
        notify(it->second);
        return it->second;
    }

    auto inserted = lines.emplace(line, Breakpoint(file, line)).first;
    LOG_DEBUG("Breakpoint created at ", inserted->second.location());
    notify(inserted->second);
    return inserted->second;
}

Breakpoint* BreakpointStore::enable(const Breakpoint& bp) {
    return setEnabled(bp, true);
}

Breakpoint* BreakpointStore::disable(const Breakpoint& bp) {
    return setEnabled(bp, false);
}

Breakpoint* BreakpointStore::setEnabled(const Breakpoint& bp, bool enable) {
    Breakpoint* stored = find(bp.file, bp.line);
    if (!stored) {
        LOG_DEBUG("No breakpoint at ", bp.location(), " to ", enable ? "enable" : "disable");
        return nullptr;
    }

    stored->enabled = enable;
    LOG_DEBUG("Breakpoint at ", stored->location(), enable ? " enabled" : " disabled");
    notify(*stored);
    return stored;
}

void BreakpointStore::setChangeListener(ChangeListener listener) {
    changeListener = std::move(listener);
}

void BreakpointStore::notify(const Breakpoint& bp) const {
    if (changeListener) {
        changeListener(bp);
    }
}
