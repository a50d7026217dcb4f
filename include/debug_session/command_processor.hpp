#ifndef DEBUG_SESSION_COMMAND_PROCESSOR_HPP
#define DEBUG_SESSION_COMMAND_PROCESSOR_HPP

#include <string>
#include <vector>
#include <map>
#include <functional>

class SessionController;
class ConsoleUI;

class CommandProcessor {
public:
    struct Command {
        std::string name;
        std::string shortcut;
        std::string description;
        std::string usage;
        std::function<bool(const std::vector<std::string>&)> handler;

        Command(const std::string& n = "",
               const std::string& s = "",
               const std::string& d = "",
               const std::string& u = "",
               std::function<bool(const std::vector<std::string>&)> h = nullptr)
            : name(n), shortcut(s), description(d), usage(u), handler(h) {}
    };

    CommandProcessor(SessionController& controller, ConsoleUI& ui);

    // Main interface
    void run();
    // Returns false once the console should exit
    bool processCommand(const std::string& cmdLine);

    // Command management
    void registerCommand(const Command& cmd);
    bool hasCommand(const std::string& name) const;

    // Help system
    void showHelp(const std::string& command = "") const;
    std::vector<std::string> getCompletions(const std::string& partial) const;

private:
    SessionController& controller;
    ConsoleUI& ui;
    std::map<std::string, Command> commands;

    void registerCommands();

    // Command handlers
    bool cmdHelp(const std::vector<std::string>& args);
    bool cmdFile(const std::vector<std::string>& args);
    bool cmdStart(const std::vector<std::string>& args);
    bool cmdContinue(const std::vector<std::string>& args);
    bool cmdStep(const std::vector<std::string>& args);
    bool cmdNext(const std::vector<std::string>& args);
    bool cmdFinish(const std::vector<std::string>& args);
    bool cmdBreak(const std::vector<std::string>& args);
    bool cmdList(const std::vector<std::string>& args);
    bool cmdInfo(const std::vector<std::string>& args);
    bool cmdStop(const std::vector<std::string>& args);
    bool cmdQuit(const std::vector<std::string>& args);

    // Helper methods
    std::vector<std::string> parseCommandLine(const std::string& cmdLine) const;
    bool validateArgCount(const std::vector<std::string>& args, size_t min, size_t max) const;
    std::string formatCommandHelp(const Command& cmd) const;
    void reportRejected(const std::string& command) const;
};

#endif // DEBUG_SESSION_COMMAND_PROCESSOR_HPP
