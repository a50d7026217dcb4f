#include "debug_session/stack_snapshot.hpp"
#include <iomanip>

void StackSnapshot::pushFrame(const std::string& function, const std::string& file, int line) {
    frames.emplace_back(function, file, line);
}

void StackSnapshot::addLocal(const std::string& name, const std::string& value) {
    if (!frames.empty()) {
        frames.back().locals[name] = value;
    }
}

const StackSnapshot::Frame* StackSnapshot::innermost() const {
    return frames.empty() ? nullptr : &frames.front();
}

StackSnapshot::Locals StackSnapshot::innermostLocals() const {
    return frames.empty() ? Locals() : frames.front().locals;
}

void StackSnapshot::printBacktrace(std::ostream& out) const {
    if (frames.empty()) {
        out << "No stack\n";
        return;
    }

    out << "\nBacktrace:\n";
    int frameNum = 0;
    for (const auto& frame : frames) {
        out << "#" << frameNum++ << " "
            << (frame.function.empty() ? "<module>" : frame.function) << " at "
            << frame.file << ":" << frame.line << "\n";
    }
}

void StackSnapshot::printLocals(std::ostream& out) const {
    if (frames.empty()) {
        out << "No active frame\n";
        return;
    }

    out << "\nLocal variables in " << frames.front().function << ":\n";
    for (const auto& [name, value] : frames.front().locals) {
        out << "  " << std::left << std::setw(15) << name
            << " = " << value << "\n";
    }
}

bool StackSnapshot::operator==(const StackSnapshot& other) const {
    if (frames.size() != other.frames.size()) return false;
    for (size_t i = 0; i < frames.size(); ++i) {
        const auto& a = frames[i];
        const auto& b = other.frames[i];
        if (a.function != b.function || a.file != b.file ||
            a.line != b.line || a.locals != b.locals) {
            return false;
        }
    }
    return true;
}
