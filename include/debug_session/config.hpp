#ifndef DEBUG_SESSION_CONFIG_HPP
#define DEBUG_SESSION_CONFIG_HPP

#include <string>
#include <memory>

class SessionConfig {
public:
    // Configuration groups
    struct SessionOptions {
        std::string interpreter{"python3"};
        std::string runner;               // debug runner placed before the script
        int startTimeoutMs{30000};
        int finishTimeoutMs{30000};
        bool statusMessages{true};
    };

    struct LogOptions {
        std::string level{"INFO"};
        bool colorOutput{true};
        size_t maxEventLogSize{1000};
    };

    struct ConsoleOptions {
        std::string prompt{"(dbg) "};
        bool enableHistory{true};
        bool enableCompletion{true};
        size_t maxHistorySize{1000};
    };

    // Singleton access
    static std::shared_ptr<SessionConfig> getInstance() {
        static std::shared_ptr<SessionConfig> instance = std::shared_ptr<SessionConfig>(new SessionConfig);
        return instance;
    }

    SessionOptions& session() { return sessionOptions; }
    LogOptions& log() { return logOptions; }
    ConsoleOptions& console() { return consoleOptions; }

    const SessionOptions& session() const { return sessionOptions; }
    const LogOptions& log() const { return logOptions; }
    const ConsoleOptions& console() const { return consoleOptions; }

    // Load/Save configuration
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    // Pushes the [log] section into the process-wide Logger
    void applyLogOptions() const;

    void resetToDefaults();

private:
    SessionConfig() = default;

    SessionOptions sessionOptions;
    LogOptions logOptions;
    ConsoleOptions consoleOptions;

    SessionConfig(const SessionConfig&) = delete;
    SessionConfig& operator=(const SessionConfig&) = delete;
};

#endif // DEBUG_SESSION_CONFIG_HPP
