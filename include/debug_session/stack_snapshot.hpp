#ifndef DEBUG_SESSION_STACK_SNAPSHOT_HPP
#define DEBUG_SESSION_STACK_SNAPSHOT_HPP

#include <string>
#include <vector>
#include <map>
#include <iostream>

// Call stack as last reported by the debuggee, innermost frame first.
class StackSnapshot {
public:
    using Locals = std::map<std::string, std::string>;  // name -> rendered value

    struct Frame {
        std::string function;
        std::string file;
        int line;
        Locals locals;

        Frame(const std::string& fn, const std::string& f, int l, Locals vars = Locals())
            : function(fn), file(f), line(l), locals(std::move(vars)) {}
    };

    StackSnapshot() = default;
    explicit StackSnapshot(std::vector<Frame> frames) : frames(std::move(frames)) {}

    // Frames are appended from innermost to outermost
    void pushFrame(const std::string& function, const std::string& file, int line);
    void addLocal(const std::string& name, const std::string& value);
    void clear() { frames.clear(); }

    size_t getDepth() const { return frames.size(); }
    bool isEmpty() const { return frames.empty(); }
    const Frame* innermost() const;
    const std::vector<Frame>& getFrames() const { return frames; }

    // Empty when there is no frame
    Locals innermostLocals() const;

    void printBacktrace(std::ostream& out = std::cout) const;
    void printLocals(std::ostream& out = std::cout) const;

    bool operator==(const StackSnapshot& other) const;

private:
    std::vector<Frame> frames;
};

#endif // DEBUG_SESSION_STACK_SNAPSHOT_HPP
