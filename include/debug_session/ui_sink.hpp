#ifndef DEBUG_SESSION_UI_SINK_HPP
#define DEBUG_SESSION_UI_SINK_HPP

#include "stack_snapshot.hpp"
#include <optional>
#include <string>
#include <vector>

// Notifications from the controller to the editor surface. Line numbers are
// 0-based. Calls arrive from the command thread and the dispatcher thread.
class UISink {
public:
    virtual ~UISink() = default;

    virtual void moveSelection(const std::string& file, int line) = 0;
    virtual void clearSelection(const std::string& file) = 0;

    virtual void showInspector() = 0;
    virtual void updateInspector(const StackSnapshot::Locals& locals) = 0;
    virtual void removeInspector() = 0;

    virtual void setMarker(const std::string& file, int line) = 0;
    virtual void clearMarker(const std::string& file, int line) = 0;
    virtual void clearAllMarkers(const std::string& file) = 0;

    virtual void showStatus(const std::string& text) = 0;
    virtual void setReadOnly(bool readOnly) = 0;
    virtual void enableAction(const std::string& name, bool enabled) = 0;
};

struct SourceDocument {
    std::string path;     // empty until the document has been named
    bool modified{false};
};

// The editor's documents. Persisting them is the host's job.
class DocumentHost {
public:
    virtual ~DocumentHost() = default;

    virtual std::optional<SourceDocument> currentDocument() const = 0;

    // Asks the host to persist doc, prompting for a name if it has none.
    // Returns the saved path, or nullopt when the user declined.
    virtual std::optional<std::string> saveDocument(const SourceDocument& doc) = 0;

    virtual std::vector<std::string> openFiles() const = 0;
    virtual std::string workspaceDir() const = 0;
};

#endif // DEBUG_SESSION_UI_SINK_HPP
