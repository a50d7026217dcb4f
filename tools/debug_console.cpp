#include "debug_session/command_processor.hpp"
#include "debug_session/config.hpp"
#include "debug_session/console_ui.hpp"
#include "debug_session/link_protocol.hpp"
#include "debug_session/session_controller.hpp"
#include "debug_session/text_debug_link.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <unistd.h>

static void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [-c <config.ini>] [script.py]\n";
}

int main(int argc, char** argv) {
    std::string configFile;
    std::string script;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            configFile = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (script.empty()) {
            script = argv[i];
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        auto config = SessionConfig::getInstance();
        if (!configFile.empty() && !config->loadFromFile(configFile)) {
            std::cerr << "Could not load configuration from " << configFile << std::endl;
            return 1;
        }
        config->applyLogOptions();
        if (const char* level = std::getenv("DEBUG_SESSION_LOG_LEVEL")) {
            if (!Logger::setLevelFromString(level)) {
                LOG_WARNING("Unknown DEBUG_SESSION_LOG_LEVEL '", level, "', using INFO");
            }
        }
        if (!isatty(STDOUT_FILENO)) {
            config->log().colorOutput = false;
            Logger::setColorEnabled(false);
        }

        ConsoleUI::PromptOptions options(config->console().prompt,
                                         config->console().enableHistory,
                                         config->console().enableCompletion,
                                         config->console().maxHistorySize,
                                         config->log().colorOutput);
        ConsoleUI console(options);
        PosixBackend backend(config);
        SessionController controller(console, console, backend, config);
        CommandProcessor processor(controller, console);

        if (!script.empty()) {
            processor.processCommand("file " + link_protocol::quote(script));
        }

        processor.run();
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
