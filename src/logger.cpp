#include "logger.hpp"
#include <cctype>

namespace {

struct LevelInfo {
    const char* name;    // canonical name, as written to config files
    const char* label;   // fixed-width tag in log lines
    const char* color;
};

// Indexed by LogLevel
const LevelInfo kLevels[] = {
    {"ERROR",   "ERROR", "\033[31m"},   // Red
    {"WARNING", "WARN ", "\033[33m"},   // Yellow
    {"INFO",    "INFO ", "\033[32m"},   // Green
    {"DEBUG",   "DEBUG", "\033[36m"},   // Cyan
    {"TRACE",   "TRACE", "\033[90m"},   // Gray
};

const LevelInfo& info(LogLevel level) {
    return kLevels[static_cast<int>(level)];
}

} // namespace

std::atomic<LogLevel> Logger::currentLevel{LogLevel::INFO};
std::atomic<bool> Logger::colorEnabled{true};  // Disabled by the console when stdout is not a tty
std::ostream* Logger::output = nullptr;
std::mutex Logger::writeMutex;

void Logger::setOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(writeMutex);
    output = out;
}

bool Logger::setLevelFromString(const std::string& levelStr) {
    std::string upper;
    for (char c : levelStr) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "WARN") upper = "WARNING";

    for (int i = 0; i < static_cast<int>(sizeof(kLevels) / sizeof(kLevels[0])); ++i) {
        if (upper == kLevels[i].name || upper == std::to_string(i)) {
            currentLevel.store(static_cast<LogLevel>(i));
            return true;
        }
    }
    currentLevel.store(LogLevel::INFO);
    return false;
}

std::string Logger::levelToString(LogLevel level) {
    return info(level).name;
}

void Logger::write(LogLevel level, const std::string& message) {
    const LevelInfo& li = info(level);

    std::lock_guard<std::mutex> lock(writeMutex);
    std::ostream& out = output ? *output
                               : (level == LogLevel::ERROR ? std::cerr : std::cout);
    if (colorEnabled) {
        out << li.color << "[" << li.label << "] \033[0m";
    } else {
        out << "[" << li.label << "] ";
    }
    out << message << std::endl;
}
