#include "debug_session/console_ui.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <readline/readline.h>
#include <readline/history.h>

// ANSI color codes
namespace Color {
    const char* RESET   = "\033[0m";
    const char* RED     = "\033[31m";
    const char* GREEN   = "\033[32m";
    const char* YELLOW  = "\033[33m";
    const char* CYAN    = "\033[36m";
}

// readline completion hooks are plain C functions
static std::function<std::vector<std::string>(const std::string&)> g_completionCallback;

static char* completion_generator(const char* text, int state) {
    static std::vector<std::string> matches;
    static size_t match_index = 0;

    if (state == 0) {
        matches.clear();
        match_index = 0;

        if (g_completionCallback) {
            matches = g_completionCallback(text);
        }
    }

    if (match_index >= matches.size()) {
        return nullptr;
    }

    return strdup(matches[match_index++].c_str());
}

static char** command_completion(const char* text, int start, int /*end*/) {
    rl_attempted_completion_over = 1;
    if (start != 0) {
        return nullptr;
    }
    return rl_completion_matches(text, completion_generator);
}

ConsoleUI::ConsoleUI(const PromptOptions& options, std::ostream& out, std::ostream& err)
    : options(options)
    , out(out)
    , err(err)
    , workspace(std::filesystem::current_path().string())
{
    rl_readline_name = "debug-console";
    if (options.enableCompletion) {
        rl_attempted_completion_function = command_completion;
    }
    if (options.enableHistory) {
        using_history();
        stifle_history(static_cast<int>(options.maxHistorySize));
    }
}

std::optional<std::string> ConsoleUI::getInput() {
    char* line = readline(options.prompt.c_str());
    if (!line) {
        return std::nullopt;
    }

    std::string input(line);
    free(line);

    if (!input.empty() && options.enableHistory) {
        add_history(input.c_str());
    }
    return input;
}

void ConsoleUI::setCompletionCallback(std::function<std::vector<std::string>(const std::string&)> callback) {
    g_completionCallback = std::move(callback);
}

const char* ConsoleUI::color(const char* code) const {
    return options.colorOutput ? code : "";
}

void ConsoleUI::printLocked(const char* code, const std::string& prefix,
                            const std::string& message, std::ostream& stream) {
    stream << color(code) << prefix << message << color(Color::RESET) << "\n";
    stream.flush();
}

void ConsoleUI::printInfo(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    printLocked(Color::GREEN, "", message, out);
}

void ConsoleUI::printWarning(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    printLocked(Color::YELLOW, "Warning: ", message, out);
}

void ConsoleUI::printError(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    printLocked(Color::RED, "Error: ", message, err);
}

void ConsoleUI::printSourceLine(const std::string& line, int lineNum, bool isCurrent, bool hasBreakpoint) {
    out << std::right << std::setw(4) << lineNum << " "
        << (hasBreakpoint ? color(Color::RED) : "") << (hasBreakpoint ? "*" : " ")
        << color(Color::RESET)
        << (isCurrent ? ">" : " ") << " ";

    if (isCurrent) {
        out << color(Color::CYAN);
    }
    out << line << color(Color::RESET) << "\n";
}

// Documents

bool ConsoleUI::openDocument(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open file: ", path);
        return false;
    }

    std::string resolved = std::filesystem::absolute(path).lexically_normal().string();
    Document doc;
    std::string line;
    while (std::getline(file, line)) {
        doc.lines.push_back(line);
    }

    std::lock_guard<std::mutex> lock(mutex);
    auto existing = documents.find(resolved);
    if (existing != documents.end()) {
        doc.markers = existing->second.markers;
    }
    documents[resolved] = std::move(doc);
    current = resolved;
    LOG_DEBUG("Loaded ", documents[resolved].lines.size(), " lines from ", resolved);
    return true;
}

std::string ConsoleUI::currentFile() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

int ConsoleUI::lineCount(const std::string& file) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = documents.find(file);
    return it != documents.end() ? static_cast<int>(it->second.lines.size()) : 0;
}

void ConsoleUI::setWorkspaceDir(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mutex);
    workspace = dir;
}

void ConsoleUI::listSource(int startLine, int count) {
    std::lock_guard<std::mutex> lock(mutex);
    listLocked(current, startLine, count);
}

void ConsoleUI::listAroundSelection(int context) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = documents.find(current);
    int center = (it != documents.end() && it->second.selection) ? *it->second.selection + 1 : 1;
    listLocked(current, center - context, 2 * context + 1);
}

void ConsoleUI::listLocked(const std::string& file, int startLine, int count) {
    auto it = documents.find(file);
    if (it == documents.end()) {
        printLocked(Color::RED, "Error: ", "No file loaded", err);
        return;
    }

    const Document& doc = it->second;
    int first = std::max(1, startLine);
    int last = std::min(static_cast<int>(doc.lines.size()), first + count - 1);
    for (int lineNum = first; lineNum <= last; ++lineNum) {
        bool isCurrent = doc.selection && *doc.selection == lineNum - 1;
        bool hasBreakpoint = doc.markers.count(lineNum - 1) > 0;
        printSourceLine(doc.lines[lineNum - 1], lineNum, isCurrent, hasBreakpoint);
    }
    out.flush();
}

std::set<int> ConsoleUI::markers(const std::string& file) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = documents.find(file);
    return it != documents.end() ? it->second.markers : std::set<int>();
}

std::optional<int> ConsoleUI::selection(const std::string& file) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = documents.find(file);
    return it != documents.end() ? it->second.selection : std::nullopt;
}

bool ConsoleUI::isReadOnly() const {
    std::lock_guard<std::mutex> lock(mutex);
    return readOnly;
}

bool ConsoleUI::isActionEnabled(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = actions.find(name);
    return it != actions.end() && it->second;
}

std::map<std::string, std::string> ConsoleUI::inspectorLocals() const {
    std::lock_guard<std::mutex> lock(mutex);
    return locals;
}

// UISink

void ConsoleUI::moveSelection(const std::string& file, int line) {
    std::lock_guard<std::mutex> lock(mutex);
    documents[file].selection = line;
    printLocked(Color::CYAN, "", file + ":" + std::to_string(line + 1), out);
    auto it = documents.find(file);
    if (line >= 0 && line < static_cast<int>(it->second.lines.size())) {
        printSourceLine(it->second.lines[line], line + 1, true,
                        it->second.markers.count(line) > 0);
        out.flush();
    }
}

void ConsoleUI::clearSelection(const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = documents.find(file);
    if (it != documents.end()) {
        it->second.selection.reset();
    }
}

void ConsoleUI::showInspector() {
    std::lock_guard<std::mutex> lock(mutex);
    inspectorVisible = true;
    locals.clear();
}

void ConsoleUI::updateInspector(const StackSnapshot::Locals& vars) {
    std::lock_guard<std::mutex> lock(mutex);
    locals = vars;
    if (!inspectorVisible) return;
    for (const auto& [name, value] : locals) {
        out << "  " << std::left << std::setw(15) << name << " = " << value << "\n";
    }
    out.flush();
}

void ConsoleUI::removeInspector() {
    std::lock_guard<std::mutex> lock(mutex);
    inspectorVisible = false;
    locals.clear();
}

void ConsoleUI::setMarker(const std::string& file, int line) {
    std::lock_guard<std::mutex> lock(mutex);
    documents[file].markers.insert(line);
}

void ConsoleUI::clearMarker(const std::string& file, int line) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = documents.find(file);
    if (it != documents.end()) {
        it->second.markers.erase(line);
    }
}

void ConsoleUI::clearAllMarkers(const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = documents.find(file);
    if (it != documents.end()) {
        it->second.markers.clear();
    }
}

void ConsoleUI::showStatus(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex);
    printLocked(Color::GREEN, "", text, out);
}

void ConsoleUI::setReadOnly(bool value) {
    std::lock_guard<std::mutex> lock(mutex);
    readOnly = value;
}

void ConsoleUI::enableAction(const std::string& name, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex);
    actions[name] = enabled;
}

// DocumentHost

std::optional<SourceDocument> ConsoleUI::currentDocument() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (current.empty()) {
        return std::nullopt;
    }
    // Files are only ever read from disk here, so they are never modified
    return SourceDocument{current, false};
}

std::optional<std::string> ConsoleUI::saveDocument(const SourceDocument& doc) {
    if (doc.path.empty()) {
        return std::nullopt;
    }
    return doc.path;
}

std::vector<std::string> ConsoleUI::openFiles() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> files;
    for (const auto& [path, doc] : documents) {
        if (!doc.lines.empty() || path == current) {
            files.push_back(path);
        }
    }
    return files;
}

std::string ConsoleUI::workspaceDir() const {
    std::lock_guard<std::mutex> lock(mutex);
    return workspace;
}
