#ifndef DEBUG_SESSION_CONSOLE_UI_HPP
#define DEBUG_SESSION_CONSOLE_UI_HPP

#include "ui_sink.hpp"
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Terminal front end: readline prompt, coloured output, and the editor state
// (open files, markers, selection) a graphical editor would keep in widgets.
class ConsoleUI : public UISink, public DocumentHost {
public:
    struct PromptOptions {
        std::string prompt;
        bool enableHistory;
        bool enableCompletion;
        size_t maxHistorySize;
        bool colorOutput;

        PromptOptions()
            : prompt("(dbg) ")
            , enableHistory(true)
            , enableCompletion(true)
            , maxHistorySize(1000)
            , colorOutput(true)
        {}

        PromptOptions(const std::string& p, bool eHist, bool eComp, size_t maxHist, bool color)
            : prompt(p)
            , enableHistory(eHist)
            , enableCompletion(eComp)
            , maxHistorySize(maxHist)
            , colorOutput(color)
        {}
    };

    explicit ConsoleUI(const PromptOptions& options = PromptOptions(),
                       std::ostream& out = std::cout,
                       std::ostream& err = std::cerr);

    // Input handling; nullopt on end of input
    std::optional<std::string> getInput();
    void setCompletionCallback(std::function<std::vector<std::string>(const std::string&)> callback);

    // Display formatting
    void printInfo(const std::string& message);
    void printWarning(const std::string& message);
    void printError(const std::string& message);
    void printSourceLine(const std::string& line, int lineNum, bool isCurrent, bool hasBreakpoint);
    std::ostream& stream() { return out; }

    // Documents
    bool openDocument(const std::string& path);
    std::string currentFile() const;
    void listSource(int startLine, int count);
    void listAroundSelection(int context);
    int lineCount(const std::string& file) const;
    void setWorkspaceDir(const std::string& dir);

    // Editor state, as last set by the controller
    std::set<int> markers(const std::string& file) const;
    std::optional<int> selection(const std::string& file) const;
    bool isReadOnly() const;
    bool isActionEnabled(const std::string& name) const;
    std::map<std::string, std::string> inspectorLocals() const;

    // UISink
    void moveSelection(const std::string& file, int line) override;
    void clearSelection(const std::string& file) override;
    void showInspector() override;
    void updateInspector(const StackSnapshot::Locals& locals) override;
    void removeInspector() override;
    void setMarker(const std::string& file, int line) override;
    void clearMarker(const std::string& file, int line) override;
    void clearAllMarkers(const std::string& file) override;
    void showStatus(const std::string& text) override;
    void setReadOnly(bool readOnly) override;
    void enableAction(const std::string& name, bool enabled) override;

    // DocumentHost
    std::optional<SourceDocument> currentDocument() const override;
    std::optional<std::string> saveDocument(const SourceDocument& doc) override;
    std::vector<std::string> openFiles() const override;
    std::string workspaceDir() const override;

private:
    struct Document {
        std::vector<std::string> lines;
        std::set<int> markers;            // 0-based
        std::optional<int> selection;     // 0-based
    };

    PromptOptions options;
    std::ostream& out;
    std::ostream& err;
    mutable std::mutex mutex;

    std::map<std::string, Document> documents;
    std::string current;
    std::string workspace;
    bool readOnly{false};
    bool inspectorVisible{false};
    std::map<std::string, std::string> locals;
    std::map<std::string, bool> actions;

    void printLocked(const char* color, const std::string& prefix, const std::string& message, std::ostream& stream);
    void listLocked(const std::string& file, int startLine, int count);
    const char* color(const char* code) const;
};

#endif // DEBUG_SESSION_CONSOLE_UI_HPP
