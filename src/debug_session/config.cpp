// src/debug_session/config.cpp
#include "debug_session/config.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>

namespace {

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

const char* boolString(bool value) {
    return value ? "true" : "false";
}

} // namespace

bool SessionConfig::loadFromFile(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_ERROR("Failed to open config file: ", filename);
            return false;
        }

        std::string line;
        std::string currentSection;
        int lineNumber = 0;

        while (std::getline(file, line)) {
            ++lineNumber;
            line = trim(line);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[' && line.back() == ']') {
                currentSection = line.substr(1, line.size() - 2);
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                LOG_WARNING(filename, ":", lineNumber, ": ignoring line without '='");
                continue;
            }

            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));

            if (currentSection == "session") {
                if (key == "interpreter") sessionOptions.interpreter = value;
                else if (key == "runner") sessionOptions.runner = value;
                else if (key == "startTimeoutMs") sessionOptions.startTimeoutMs = std::stoi(value);
                else if (key == "finishTimeoutMs") sessionOptions.finishTimeoutMs = std::stoi(value);
                else if (key == "statusMessages") sessionOptions.statusMessages = (value == "true");
                else LOG_WARNING(filename, ":", lineNumber, ": unknown key '", key, "' in [session]");
            }
            else if (currentSection == "log") {
                if (key == "level") logOptions.level = value;
                else if (key == "colorOutput") logOptions.colorOutput = (value == "true");
                else if (key == "maxEventLogSize") logOptions.maxEventLogSize = std::stoull(value);
                else LOG_WARNING(filename, ":", lineNumber, ": unknown key '", key, "' in [log]");
            }
            else if (currentSection == "console") {
                if (key == "prompt") consoleOptions.prompt = value;
                else if (key == "enableHistory") consoleOptions.enableHistory = (value == "true");
                else if (key == "enableCompletion") consoleOptions.enableCompletion = (value == "true");
                else if (key == "maxHistorySize") consoleOptions.maxHistorySize = std::stoull(value);
                else LOG_WARNING(filename, ":", lineNumber, ": unknown key '", key, "' in [console]");
            }
            else {
                LOG_WARNING(filename, ":", lineNumber, ": key outside a known section: ", key);
            }
        }

        return true;
    }
    catch (const std::exception& e) {
        LOG_ERROR("Error loading config: ", e.what());
        return false;
    }
}

bool SessionConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file for writing: ", filename);
        return false;
    }

    file << "[session]\n";
    file << "interpreter = " << sessionOptions.interpreter << "\n";
    file << "runner = " << sessionOptions.runner << "\n";
    file << "startTimeoutMs = " << sessionOptions.startTimeoutMs << "\n";
    file << "finishTimeoutMs = " << sessionOptions.finishTimeoutMs << "\n";
    file << "statusMessages = " << boolString(sessionOptions.statusMessages) << "\n\n";

    file << "[log]\n";
    file << "level = " << logOptions.level << "\n";
    file << "colorOutput = " << boolString(logOptions.colorOutput) << "\n";
    file << "maxEventLogSize = " << logOptions.maxEventLogSize << "\n\n";

    file << "[console]\n";
    file << "prompt = " << consoleOptions.prompt << "\n";
    file << "enableHistory = " << boolString(consoleOptions.enableHistory) << "\n";
    file << "enableCompletion = " << boolString(consoleOptions.enableCompletion) << "\n";
    file << "maxHistorySize = " << consoleOptions.maxHistorySize << "\n";

    if (!file) {
        LOG_ERROR("Failed to write config file: ", filename);
        return false;
    }
    return true;
}

void SessionConfig::applyLogOptions() const {
    if (!Logger::setLevelFromString(logOptions.level)) {
        LOG_WARNING("Unknown log level '", logOptions.level, "', using INFO");
    }
    Logger::setColorEnabled(logOptions.colorOutput);
}

void SessionConfig::resetToDefaults() {
    sessionOptions = SessionOptions();
    logOptions = LogOptions();
    consoleOptions = ConsoleOptions();
}
