#ifndef DEBUG_SESSION_BREAKPOINT_STORE_HPP
#define DEBUG_SESSION_BREAKPOINT_STORE_HPP

#include <string>
#include <vector>
#include <map>
#include <functional>

// Line numbers are 1-based, as the debuggee reports them.
struct Breakpoint {
    std::string file;
    int line;
    bool enabled{true};
    int ignoreCount{0};  // reserved, not acted upon

    Breakpoint(const std::string& f, int l, bool e = true)
        : file(f), line(l), enabled(e) {}

    std::string location() const { return file + ":" + std::to_string(line); }
};

// At most one Breakpoint per (file, line). Every mutation is reported to the
// change listener so the owner can keep markers in step.
class BreakpointStore {
public:
    using LineMap = std::map<int, Breakpoint>;
    using ChangeListener = std::function<void(const Breakpoint&)>;

    BreakpointStore() = default;

    // Queries
    Breakpoint* find(const std::string& file, int line);
    const Breakpoint* find(const std::string& file, int line) const;
    LineMap allFor(const std::string& file) const;
    std::vector<Breakpoint> getAllBreakpoints() const;

    // Create-or-reuse: an existing breakpoint is returned (re-enabled if it
    // was disabled) instead of being duplicated. Throws std::invalid_argument
    // for lines < 1.
    Breakpoint& create(const std::string& file, int line);

    // State flips; both notify even when the state is unchanged. Return
    // nullptr when no breakpoint exists at bp's location.
    Breakpoint* enable(const Breakpoint& bp);
    Breakpoint* disable(const Breakpoint& bp);

    void setChangeListener(ChangeListener listener);

private:
    std::map<std::string, LineMap> breakpoints;
    ChangeListener changeListener;

    Breakpoint* setEnabled(const Breakpoint& bp, bool enable);
    void notify(const Breakpoint& bp) const;
};

#endif // DEBUG_SESSION_BREAKPOINT_STORE_HPP
