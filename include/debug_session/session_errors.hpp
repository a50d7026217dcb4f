#ifndef DEBUG_SESSION_SESSION_ERRORS_HPP
#define DEBUG_SESSION_SESSION_ERRORS_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind {
    NoActiveDocument,      // start requested with nothing open or nameable
    LinkError,             // request sent while the link is absent or closed
    InvalidTransition,     // command issued in a phase that forbids it
    ProcessLaunchFailure   // spawn failed
};

const char* errorKindName(ErrorKind kind);

class SessionError : public std::runtime_error {
public:
    SessionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind kind() const { return errorKind; }

private:
    ErrorKind errorKind;
};

class NoActiveDocument : public SessionError {
public:
    explicit NoActiveDocument(const std::string& message)
        : SessionError(ErrorKind::NoActiveDocument, message) {}
};

class LinkError : public SessionError {
public:
    explicit LinkError(const std::string& message)
        : SessionError(ErrorKind::LinkError, message) {}
};

class InvalidTransition : public SessionError {
public:
    explicit InvalidTransition(const std::string& message)
        : SessionError(ErrorKind::InvalidTransition, message) {}
};

class ProcessLaunchFailure : public SessionError {
public:
    explicit ProcessLaunchFailure(const std::string& message)
        : SessionError(ErrorKind::ProcessLaunchFailure, message) {}
};

#endif // DEBUG_SESSION_SESSION_ERRORS_HPP
