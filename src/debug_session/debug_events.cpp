// src/debug_session/debug_events.cpp

#include "debug_session/debug_events.hpp"
#include <sstream>

namespace {

struct EventDescriber {
    std::string operator()(const BootstrapEvent&) const {
        return "bootstrap";
    }
    std::string operator()(const LineEvent& e) const {
        return "line " + e.file + ":" + std::to_string(e.line);
    }
    std::string operator()(const StackEvent& e) const {
        return "stack (" + std::to_string(e.stack.getDepth()) + " frames)";
    }
    std::string operator()(const BreakpointEnableEvent& e) const {
        return "breakpoint enabled " + e.breakpoint.location();
    }
    std::string operator()(const BreakpointDisableEvent& e) const {
        return "breakpoint disabled " + e.breakpoint.location();
    }
    std::string operator()(const BreakpointIgnoreEvent& e) const {
        return "breakpoint ignore " + e.breakpoint.location() + " x" + std::to_string(e.count);
    }
    std::string operator()(const BreakpointClearEvent& e) const {
        return "breakpoint cleared " + e.breakpoint.location();
    }
    std::string operator()(const InfoEvent& e) const {
        return "info: " + e.message;
    }
    std::string operator()(const WarningEvent& e) const {
        return "warning: " + e.message;
    }
    std::string operator()(const ErrorEvent& e) const {
        return "error: " + e.message;
    }
    std::string operator()(const PostmortemEvent& e) const {
        return "postmortem: " + e.context;
    }
    std::string operator()(const RestartEvent&) const {
        return "restart";
    }
    std::string operator()(const CallEvent& e) const {
        return "call " + e.args;
    }
    std::string operator()(const ReturnEvent& e) const {
        return "return " + e.value;
    }
    std::string operator()(const ExceptionEvent& e) const {
        return "exception " + e.name + ": " + e.value;
    }
    std::string operator()(const ProcessFinishedEvent& e) const {
        std::ostringstream ss;
        ss << "process finished with code " << e.exitCode
           << (e.status == ExitStatus::CrashExit ? " (crashed)" : "");
        return ss.str();
    }
};

} // namespace

std::string describeEvent(const SessionEvent& event) {
    return std::visit(EventDescriber{}, event);
}
