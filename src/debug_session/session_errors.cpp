#include "debug_session/session_errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoActiveDocument:     return "NoActiveDocument";
        case ErrorKind::LinkError:            return "LinkError";
        case ErrorKind::InvalidTransition:    return "InvalidTransition";
        case ErrorKind::ProcessLaunchFailure: return "ProcessLaunchFailure";
    }
    return "Unknown";
}
