#include "debug_session/command_processor.hpp"
#include "debug_session/console_ui.hpp"
#include "debug_session/link_protocol.hpp"
#include "debug_session/session_controller.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

CommandProcessor::CommandProcessor(SessionController& ctrl, ConsoleUI& console)
    : controller(ctrl), ui(console) {
    registerCommands();
    ui.setCompletionCallback([this](const std::string& partial) {
        return getCompletions(partial);
    });
}

void CommandProcessor::run() {
    ui.printInfo(controller.name() + ": " + controller.description());
    ui.printInfo("Type 'help' for list of commands.");

    bool running = true;
    while (running) {
        auto input = ui.getInput();
        if (!input) {
            // End of input behaves like quit
            controller.stop();
            break;
        }
        if (input->empty()) continue;

        running = processCommand(*input);
    }
}

void CommandProcessor::registerCommands() {
    registerCommand(Command("help", "h", "Display help for commands",
                            "help [command]",
                            [this](const auto& args) { return cmdHelp(args); }));

    registerCommand(Command("file", "f", "Open a script",
                            "file <filename>",
                            [this](const auto& args) { return cmdFile(args); }));

    registerCommand(Command("start", "r", "Start debugging the current script",
                            "start",
                            [this](const auto& args) { return cmdStart(args); }));

    registerCommand(Command("continue", "c", "Continue to the next breakpoint",
                            "continue",
                            [this](const auto& args) { return cmdContinue(args); }));

    registerCommand(Command("step", "s", "Step into a function",
                            "step",
                            [this](const auto& args) { return cmdStep(args); }));

    registerCommand(Command("next", "n", "Step over a line of code",
                            "next",
                            [this](const auto& args) { return cmdNext(args); }));

    registerCommand(Command("finish", "fin", "Step out of the current function",
                            "finish",
                            [this](const auto& args) { return cmdFinish(args); }));

    registerCommand(Command("break", "b", "Toggle a breakpoint",
                            "break <line> [file]",
                            [this](const auto& args) { return cmdBreak(args); }));

    registerCommand(Command("list", "l", "List source code",
                            "list [line]",
                            [this](const auto& args) { return cmdList(args); }));

    registerCommand(Command("info", "i", "Display session state",
                            "info <breakpoints|stack|locals|events>",
                            [this](const auto& args) { return cmdInfo(args); }));

    registerCommand(Command("stop", "", "Stop the running code",
                            "stop",
                            [this](const auto& args) { return cmdStop(args); }));

    registerCommand(Command("quit", "q", "Exit the console",
                            "quit",
                            [this](const auto& args) { return cmdQuit(args); }));
}

void CommandProcessor::registerCommand(const Command& cmd) {
    commands[cmd.name] = cmd;
    if (!cmd.shortcut.empty()) {
        commands[cmd.shortcut] = cmd;
    }
}

bool CommandProcessor::hasCommand(const std::string& name) const {
    return commands.find(name) != commands.end();
}

bool CommandProcessor::processCommand(const std::string& cmdLine) {
    std::vector<std::string> args;
    try {
        args = parseCommandLine(cmdLine);
    } catch (const std::invalid_argument& e) {
        ui.printError(e.what());
        return true;
    }
    if (args.empty()) return true;

    auto cmdIt = commands.find(args[0]);
    if (cmdIt == commands.end()) {
        ui.printError("Unknown command: " + args[0]);
        return true;
    }

    try {
        return cmdIt->second.handler(args);
    } catch (const std::exception& e) {
        ui.printError("Command failed: " + std::string(e.what()));
        return true;
    }
}

std::vector<std::string> CommandProcessor::parseCommandLine(const std::string& cmdLine) const {
    return link_protocol::tokenize(cmdLine);
}

bool CommandProcessor::validateArgCount(const std::vector<std::string>& args,
                                        size_t min, size_t max) const {
    if (args.size() < min) {
        ui.printError("Too few arguments for " + args[0]);
        showHelp(args[0]);
        return false;
    }
    if (max != size_t(-1) && args.size() > max) {
        ui.printError("Too many arguments for " + args[0]);
        showHelp(args[0]);
        return false;
    }
    return true;
}

void CommandProcessor::showHelp(const std::string& command) const {
    if (command.empty()) {
        ui.printInfo("Available commands:");
        for (const auto& [name, cmd] : commands) {
            if (name == cmd.name) {  // Only show primary commands, not shortcuts
                ui.printInfo(formatCommandHelp(cmd));
            }
        }
        return;
    }

    auto it = commands.find(command);
    if (it == commands.end()) {
        ui.printError("Unknown command: " + command);
        return;
    }

    ui.printInfo(formatCommandHelp(it->second));
}

std::vector<std::string> CommandProcessor::getCompletions(const std::string& partial) const {
    std::vector<std::string> matches;
    for (const auto& [name, cmd] : commands) {
        if (name == cmd.name && name.compare(0, partial.size(), partial) == 0) {
            matches.push_back(name);
        }
    }
    return matches;
}

std::string CommandProcessor::formatCommandHelp(const Command& cmd) const {
    std::stringstream ss;
    ss << std::left << std::setw(15) << cmd.name;
    if (!cmd.shortcut.empty()) {
        ss << "(" << cmd.shortcut << ")";
        ss << std::setw(10 - cmd.shortcut.length()) << "";
    } else {
        ss << std::setw(12) << "";
    }
    ss << cmd.description << "\n";
    ss << "Usage: " << cmd.usage;
    return ss.str();
}

void CommandProcessor::reportRejected(const std::string& command) const {
    ui.printWarning("Cannot " + command + " while the session is " +
                    SessionController::phaseName(controller.getPhase()));
}

// Command Handlers
bool CommandProcessor::cmdHelp(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 1, 2)) return true;
    showHelp(args.size() > 1 ? args[1] : "");
    return true;
}

bool CommandProcessor::cmdFile(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 2, 2)) return true;

    if (controller.getPhase() != SessionController::Phase::Idle) {
        ui.printError("Stop the session before opening another file");
        return true;
    }
    if (ui.openDocument(args[1])) {
        ui.printInfo("Opened " + ui.currentFile() + " (" +
                     std::to_string(ui.lineCount(ui.currentFile())) + " lines)");
    } else {
        ui.printError("Failed to open file: " + args[1]);
    }
    return true;
}

bool CommandProcessor::cmdStart(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 1, 1)) return true;
    if (controller.getPhase() != SessionController::Phase::Idle) {
        reportRejected("start");
        return true;
    }
    controller.start();
    return true;
}

bool CommandProcessor::cmdContinue(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 1, 1)) return true;
    if (!controller.continueExecution()) reportRejected("continue");
    return true;
}

bool CommandProcessor::cmdStep(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 1, 1)) return true;
    if (!controller.stepInto()) reportRejected("step");
    return true;
}

bool CommandProcessor::cmdNext(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 1, 1)) return true;
    if (!controller.stepOver()) reportRejected("step over");
    return true;
}

bool CommandProcessor::cmdFinish(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 1, 1)) return true;
    if (!controller.stepReturn()) reportRejected("step out");
    return true;
}

bool CommandProcessor::cmdBreak(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 2, 3)) return true;

    int line = 0;
    try {
        line = std::stoi(args[1]);
    } catch (const std::exception&) {
        ui.printError("Invalid line number");
        return true;
    }
    if (line < 1) {
        ui.printError("Line numbers start at 1");
        return true;
    }

    std::string file = args.size() > 2
        ? std::filesystem::absolute(args[2]).lexically_normal().string()
        : ui.currentFile();
    if (file.empty()) {
        ui.printError("No file loaded");
        return true;
    }

    controller.toggleBreakpoint(file, line - 1);

    auto lines = controller.breakpointsFor(file);
    auto it = lines.find(line);
    bool enabled = it != lines.end() && it->second.enabled;
    ui.printInfo("Breakpoint at " + file + ":" + std::to_string(line) +
                 (enabled ? " enabled" : " disabled"));
    return true;
}

bool CommandProcessor::cmdList(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 1, 2)) return true;

    if (args.size() == 2) {
        int line = 0;
        try {
            line = std::stoi(args[1]);
        } catch (const std::exception&) {
            ui.printError("Invalid line number");
            return true;
        }
        ui.listSource(line - 5, 10);
    } else {
        ui.listAroundSelection(5);
    }
    return true;
}

bool CommandProcessor::cmdInfo(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 2, 2)) return true;

    const std::string& what = args[1];
    std::ostream& out = ui.stream();
    if (what == "breakpoints") {
        auto breakpoints = controller.getAllBreakpoints();
        if (breakpoints.empty()) {
            ui.printInfo("No breakpoints.");
            return true;
        }
        out << "Location                                 State\n";
        out << "-----------------------------------------------\n";
        for (const auto& bp : breakpoints) {
            out << std::left << std::setw(41) << bp.location()
                << (bp.enabled ? "enabled" : "disabled") << "\n";
        }
    } else if (what == "stack") {
        controller.getStack().printBacktrace(out);
    } else if (what == "locals") {
        controller.getStack().printLocals(out);
    } else if (what == "events") {
        controller.getEventLogger().printLastEvents(20, out);
    } else {
        ui.printError("Unknown info command. Available: breakpoints, stack, locals, events");
    }
    out.flush();
    return true;
}

bool CommandProcessor::cmdStop(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 1, 1)) return true;
    controller.stop();
    return true;
}

bool CommandProcessor::cmdQuit(const std::vector<std::string>& args) {
    if (!validateArgCount(args, 1, 1)) return true;
    controller.stop();
    return false;
}
