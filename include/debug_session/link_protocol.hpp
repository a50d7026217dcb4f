#ifndef DEBUG_SESSION_LINK_PROTOCOL_HPP
#define DEBUG_SESSION_LINK_PROTOCOL_HPP

#include "debug_events.hpp"
#include <optional>
#include <string>
#include <vector>

// Newline-delimited text protocol spoken with the debug runner.
//
// Requests:  run | next | step | return
//            break|clear|enable|disable <file> <line>
// Events:    bootstrap | restart | endstack
//            line|enable|disable|clear <file> <line>
//            ignore <file> <line> <count>
//            frame <function> <file> <line>
//            local <name> <value...>
//            info|warning|error|postmortem|call|return <text...>
//            exception <name> <value...>
// Words containing spaces or quotes are wrapped in double quotes; inside
// quotes, \" and \\ stand for a literal quote and backslash.
namespace link_protocol {

std::vector<std::string> tokenize(const std::string& line);
std::string quote(const std::string& word);

std::string formatCommand(const std::string& verb);
std::string formatBreakpointCommand(const std::string& verb, const std::string& file, int line);

// Turns protocol lines into events. Stack frames arrive over several lines,
// so the decoder holds the frames until "endstack".
class Decoder {
public:
    // Returns the completed event, or nullopt while a stack is being
    // assembled or for blank lines. Throws std::invalid_argument on
    // malformed or unknown lines.
    std::optional<SessionEvent> feed(const std::string& line);

private:
    StackSnapshot pendingStack;
    bool collectingStack{false};

    void reset();
};

} // namespace link_protocol

#endif // DEBUG_SESSION_LINK_PROTOCOL_HPP
