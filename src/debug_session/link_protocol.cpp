#include "debug_session/link_protocol.hpp"
#include <stdexcept>

namespace link_protocol {

namespace {

int parseLine(const std::string& text, const std::string& context) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid line number '" + text + "' in: " + context);
    }
    if (used != text.size()) {
        throw std::invalid_argument("Invalid line number '" + text + "' in: " + context);
    }
    return value;
}

std::string joinFrom(const std::vector<std::string>& args, size_t first) {
    std::string result;
    for (size_t i = first; i < args.size(); ++i) {
        if (i > first) result += " ";
        result += args[i];
    }
    return result;
}

void requireArgs(const std::vector<std::string>& args, size_t min, const std::string& line) {
    if (args.size() < min) {
        throw std::invalid_argument("Too few arguments for " + args[0] + ": " + line);
    }
}

Breakpoint breakpointFrom(const std::vector<std::string>& args, const std::string& line) {
    requireArgs(args, 3, line);
    return Breakpoint(args[1], parseLine(args[2], line));
}

} // namespace

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> args;
    bool inQuotes = false;
    bool haveToken = false;
    std::string current;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (inQuotes && c == '\\' && i + 1 < line.size()
            && (line[i + 1] == '"' || line[i + 1] == '\\')) {
            current += line[++i];
        } else if (c == '"') {
            inQuotes = !inQuotes;
            haveToken = true;
        } else if ((c == ' ' || c == '\t' || c == '\r') && !inQuotes) {
            if (haveToken) {
                args.push_back(current);
                current.clear();
                haveToken = false;
            }
        } else {
            current += c;
            haveToken = true;
        }
    }

    if (inQuotes) {
        throw std::invalid_argument("Unterminated quote in: " + line);
    }
    if (haveToken) {
        args.push_back(current);
    }

    return args;
}

std::string quote(const std::string& word) {
    if (!word.empty() && word.find_first_of(" \t\"") == std::string::npos) {
        return word;
    }
    std::string quoted = "\"";
    for (char c : word) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "\"";
}

std::string formatCommand(const std::string& verb) {
    return verb + "\n";
}

std::string formatBreakpointCommand(const std::string& verb, const std::string& file, int line) {
    return verb + " " + quote(file) + " " + std::to_string(line) + "\n";
}

std::optional<SessionEvent> Decoder::feed(const std::string& line) {
    auto args = tokenize(line);
    if (args.empty()) {
        return std::nullopt;
    }

    const std::string& verb = args[0];

    if (verb == "frame") {
        requireArgs(args, 4, line);
        if (!collectingStack) {
            pendingStack.clear();
            collectingStack = true;
        }
        pendingStack.pushFrame(args[1], args[2], parseLine(args[3], line));
        return std::nullopt;
    }
    if (verb == "local") {
        requireArgs(args, 2, line);
        if (!collectingStack || pendingStack.isEmpty()) {
            throw std::invalid_argument("Local outside a frame: " + line);
        }
        pendingStack.addLocal(args[1], joinFrom(args, 2));
        return std::nullopt;
    }
    if (verb == "endstack") {
        StackEvent event{pendingStack};
        reset();
        return SessionEvent(std::move(event));
    }

    if (collectingStack) {
        // A stack is never interleaved with other events
        reset();
        throw std::invalid_argument("Incomplete stack before: " + line);
    }

    if (verb == "bootstrap") return SessionEvent(BootstrapEvent{});
    if (verb == "restart") return SessionEvent(RestartEvent{});
    if (verb == "line") {
        requireArgs(args, 3, line);
        return SessionEvent(LineEvent{args[1], parseLine(args[2], line)});
    }
    if (verb == "enable") return SessionEvent(BreakpointEnableEvent{breakpointFrom(args, line)});
    if (verb == "disable") return SessionEvent(BreakpointDisableEvent{breakpointFrom(args, line)});
    if (verb == "clear") return SessionEvent(BreakpointClearEvent{breakpointFrom(args, line)});
    if (verb == "ignore") {
        requireArgs(args, 4, line);
        int count = parseLine(args[3], line);
        return SessionEvent(BreakpointIgnoreEvent{breakpointFrom(args, line), count});
    }
    if (verb == "info") return SessionEvent(InfoEvent{joinFrom(args, 1)});
    if (verb == "warning") return SessionEvent(WarningEvent{joinFrom(args, 1)});
    if (verb == "error") return SessionEvent(ErrorEvent{joinFrom(args, 1)});
    if (verb == "postmortem") return SessionEvent(PostmortemEvent{joinFrom(args, 1)});
    if (verb == "call") return SessionEvent(CallEvent{joinFrom(args, 1)});
    if (verb == "return") return SessionEvent(ReturnEvent{joinFrom(args, 1)});
    if (verb == "exception") {
        requireArgs(args, 2, line);
        return SessionEvent(ExceptionEvent{args[1], joinFrom(args, 2)});
    }

    throw std::invalid_argument("Unknown debugger event: " + verb);
}

void Decoder::reset() {
    pendingStack.clear();
    collectingStack = false;
}

} // namespace link_protocol
