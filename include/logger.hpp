#ifndef DEBUG_SESSION_LOGGER_HPP
#define DEBUG_SESSION_LOGGER_HPP

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel {
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Process-wide logger. The controller logs from the dispatcher thread and
// from whichever thread issues UI commands, so writes are serialised.
class Logger {
public:
    static void setLevel(LogLevel level) { currentLevel.store(level); }
    static LogLevel getLevel() { return currentLevel.load(); }
    static bool isEnabled(LogLevel level) { return level <= currentLevel.load(); }

    static void setColorEnabled(bool enabled) { colorEnabled.store(enabled); }

    // nullptr restores the default split (errors to stderr, rest to stdout)
    static void setOutput(std::ostream* out);

    // Accepts names (case-insensitive, "WARN" too) or 0-4. Anything else
    // selects INFO and returns false.
    static bool setLevelFromString(const std::string& levelStr);
    static std::string levelToString(LogLevel level);

    template<typename... Args>
    static void log(LogLevel level, const Args&... args) {
        if (!isEnabled(level)) return;

        std::ostringstream oss;
        ((oss << args), ...);
        write(level, oss.str());
    }

private:
    static std::atomic<LogLevel> currentLevel;
    static std::atomic<bool> colorEnabled;
    static std::ostream* output;
    static std::mutex writeMutex;

    static void write(LogLevel level, const std::string& message);
};

#define LOG_ERROR(...)   Logger::log(LogLevel::ERROR, __VA_ARGS__)
#define LOG_WARNING(...) Logger::log(LogLevel::WARNING, __VA_ARGS__)
#define LOG_INFO(...)    Logger::log(LogLevel::INFO, __VA_ARGS__)
#define LOG_DEBUG(...)   Logger::log(LogLevel::DEBUG, __VA_ARGS__)
#define LOG_TRACE(...)   Logger::log(LogLevel::TRACE, __VA_ARGS__)

#endif // DEBUG_SESSION_LOGGER_HPP
