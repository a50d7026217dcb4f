#include "debug_session/session_controller.hpp"
#include "logger.hpp"

namespace {

struct ActionInfo {
    const char* name;
    const char* displayName;
    const char* description;
};

const ActionInfo kActions[] = {
    {"stop", "Stop", "Stop the running code."},
    {"run", "Continue", "Continue to run your Python script."},
    {"step-over", "Step Over", "Step over a line of code."},
    {"step-in", "Step In", "Step into a function."},
    {"step-out", "Step Out", "Step out of a function."},
};

} // namespace

SessionController::SessionController(UISink& ui,
                                     DocumentHost& documents,
                                     SessionBackend& backend,
                                     std::shared_ptr<SessionConfig> cfg)
    : ui(ui)
    , documents(documents)
    , backend(backend)
    , config(cfg ? std::move(cfg) : SessionConfig::getInstance())
    , eventLogger(std::make_shared<EventLogger>(config->log().maxEventLogSize))
{
    store.setChangeListener([this](const Breakpoint& bp) { onBreakpointChanged(bp); });
    eventThread = std::thread([this]() { eventLoop(); });
}

SessionController::~SessionController() {
    stop();
    eventQueue.stop();
    if (eventThread.joinable()) {
        eventThread.join();
    }
}

const char* SessionController::phaseName(Phase phase) {
    switch (phase) {
        case Phase::Idle:     return "Idle";
        case Phase::Starting: return "Starting";
        case Phase::Running:  return "Running";
        case Phase::Paused:   return "Paused";
        case Phase::Finished: return "Finished";
    }
    return "Unknown";
}

const std::vector<std::string>& SessionController::actionNames() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> result;
        for (const auto& action : kActions) {
            result.emplace_back(action.name);
        }
        return result;
    }();
    return names;
}

std::vector<SessionMode::Action> SessionController::actions() {
    std::vector<Action> result;
    for (const auto& info : kActions) {
        result.emplace_back(info.name, info.displayName, info.description);
    }
    result[0].handler = [this]() { stop(); };
    result[1].handler = [this]() { continueExecution(); };
    result[2].handler = [this]() { stepOver(); };
    result[3].handler = [this]() { stepInto(); };
    result[4].handler = [this]() { stepReturn(); };
    return result;
}

// Session lifecycle

void SessionController::start() {
    std::lock_guard<std::mutex> lock(mutex);

    if (phase != Phase::Idle) {
        InvalidTransition error(std::string("start requested while ") + phaseName(phase));
        LOG_WARNING(error.what());
        eventLogger->logEvent(EventLogger::EventType::ERROR, error.what());
        return;
    }

    auto doc = documents.currentDocument();
    if (!doc) {
        NoActiveDocument error("There is no active text editor.");
        LOG_DEBUG(error.what());
        eventLogger->logEvent(EventLogger::EventType::ERROR, error.what());
        teardown();
        return;
    }

    std::string path = doc->path;
    if (path.empty() || doc->modified) {
        auto saved = documents.saveDocument(*doc);
        if (!saved || saved->empty()) {
            NoActiveDocument error(path.empty()
                ? "Current script has not been saved. Aborting debug."
                : "Could not save " + path + ". Aborting debug.");
            LOG_DEBUG(error.what());
            eventLogger->logEvent(EventLogger::EventType::ERROR, error.what());
            teardown();
            return;
        }
        path = *saved;
    }

    launch(path);
}

void SessionController::launch(const std::string& path) {
    uint64_t generation = ++sessionGeneration;
    script = path;

    LOG_DEBUG("Python script: ", path);
    LOG_DEBUG("Working directory: ", documents.workspaceDir());
    if (config->session().statusMessages) {
        ui.showStatus("Running script " + path);
    }

    try {
        process = backend.spawn(path, documents.workspaceDir());
        if (!process) {
            throw ProcessLaunchFailure("Could not create a process for " + path);
        }
        process->setTerminationCallback([this, generation](int exitCode, ExitStatus status) {
            postFor(generation, ProcessFinishedEvent{exitCode, status});
        });
        process->start();
        if (!process->waitForStarted(config->session().startTimeoutMs)) {
            throw ProcessLaunchFailure("Process for " + path + " did not start");
        }
        eventLogger->logEvent(EventLogger::EventType::PROCESS, "Process started", path);

        uiSessionActive = true;
        ui.showInspector();
        ui.setReadOnly(true);
        for (const auto& name : actionNames()) {
            ui.enableAction(name, true);
        }

        link = backend.connect(*process, [this, generation](SessionEvent event) {
            postFor(generation, std::move(event));
        });
        if (!link) {
            throw LinkError("Could not connect to the debugger for " + path);
        }
        setPhase(Phase::Starting);
    } catch (const SessionError& e) {
        failSession(e);
    }
}

void SessionController::stop() {
    std::lock_guard<std::mutex> lock(mutex);

    if (phase == Phase::Idle && !uiSessionActive && !process && !link) {
        LOG_DEBUG("stop requested with no session; nothing to do");
        return;
    }
    LOG_DEBUG("Stopping debugger.");
    teardown();
}

void SessionController::teardown() {
    ++sessionGeneration;  // anything still queued for this session is stale

    if (link) {
        link->close();
        link.reset();
        eventLogger->logEvent(EventLogger::EventType::LINK, "Link closed", script);
    }
    if (process) {
        process->kill();
        if (!process->waitForFinished(config->session().finishTimeoutMs)) {
            LOG_ERROR("Debuggee for ", script, " did not exit after kill");
            eventLogger->logEvent(EventLogger::EventType::ERROR,
                                  "Process did not exit after kill", script);
        }
        process.reset();
        eventLogger->logEvent(EventLogger::EventType::PROCESS, "Process killed", script);
    }

    stack.clear();
    position.reset();

    if (uiSessionActive) {
        ui.removeInspector();
        ui.setReadOnly(false);
        for (const auto& name : actionNames()) {
            ui.enableAction(name, false);
        }
        uiSessionActive = false;
    }

    if (phase != Phase::Idle) {
        setPhase(Phase::Idle);
    }
}

void SessionController::failSession(const SessionError& error) {
    LOG_ERROR(errorKindName(error.kind()), ": ", error.what());
    eventLogger->logEvent(EventLogger::EventType::ERROR, error.what(), script,
                          errorKindName(error.kind()));
    ui.showStatus(error.what());
    teardown();
}

// Execution commands

bool SessionController::continueExecution() {
    return issueCommand("run", true, [](DebugLink& l) { l.run(); });
}

bool SessionController::stepOver() {
    return issueCommand("step-over", false, [](DebugLink& l) { l.stepOver(); });
}

bool SessionController::stepInto() {
    return issueCommand("step-in", false, [](DebugLink& l) { l.stepInto(); });
}

bool SessionController::stepReturn() {
    return issueCommand("step-out", false, [](DebugLink& l) { l.stepReturn(); });
}

bool SessionController::issueCommand(const char* command, bool allowWhileRunning,
                                     const std::function<void(DebugLink&)>& send) {
    std::lock_guard<std::mutex> lock(mutex);

    bool allowed = phase == Phase::Paused || (allowWhileRunning && phase == Phase::Running);
    if (!allowed) {
        InvalidTransition error(std::string(command) + " is not allowed while " + phaseName(phase));
        LOG_WARNING(error.what());
        eventLogger->logEvent(EventLogger::EventType::ERROR, error.what(), "",
                              errorKindName(error.kind()));
        return false;
    }

    if (!request(command, send)) {
        return false;
    }
    position.reset();
    setPhase(Phase::Running);
    return true;
}

bool SessionController::request(const std::string& what,
                                const std::function<void(DebugLink&)>& send) {
    if (!link) {
        failSession(LinkError("Debugger link is not connected (" + what + ")"));
        return false;
    }
    try {
        send(*link);
    } catch (const LinkError& e) {
        failSession(e);
        return false;
    }
    eventLogger->logEvent(EventLogger::EventType::LINK, "Sent " + what);
    return true;
}

bool SessionController::sessionLive() const {
    return link && (phase == Phase::Running || phase == Phase::Paused);
}

void SessionController::setPhase(Phase next) {
    if (next == phase) return;
    LOG_DEBUG("Session phase ", phaseName(phase), " -> ", phaseName(next));
    eventLogger->logEvent(EventLogger::EventType::PHASE,
                          std::string(phaseName(phase)) + " -> " + phaseName(next));
    phase = next;
}

// Breakpoints

void SessionController::toggleBreakpoint(const std::string& file, int line) {
    std::lock_guard<std::mutex> lock(mutex);

    if (line < 0) {
        LOG_WARNING("Ignoring breakpoint toggle at invalid line ", line, " in ", file);
        return;
    }

    Breakpoint* existing = store.find(file, line + 1);
    if (existing && existing->enabled) {
        store.disable(*existing);
        if (sessionLive()) {
            Breakpoint bp = *existing;
            request("disable " + bp.location(), [&bp](DebugLink& l) { l.disableBreakpoint(bp); });
        }
        return;
    }

    bool reused = existing != nullptr;
    Breakpoint bp = store.create(file, line + 1);
    if (sessionLive()) {
        if (reused) {
            request("enable " + bp.location(), [&bp](DebugLink& l) { l.enableBreakpoint(bp); });
        } else {
            request("break " + bp.location(),
                    [&bp](DebugLink& l) { l.setBreakpoint(bp.file, bp.line); });
        }
    }
}

void SessionController::onBreakpointChanged(const Breakpoint& bp) {
    if (bp.enabled) {
        ui.setMarker(bp.file, bp.line - 1);
    } else {
        ui.clearMarker(bp.file, bp.line - 1);
    }
    eventLogger->logEvent(EventLogger::EventType::BREAKPOINT,
                          bp.enabled ? "Breakpoint enabled" : "Breakpoint disabled",
                          bp.location());
}

void SessionController::resyncMarkers() {
    for (const auto& file : documents.openFiles()) {
        ui.clearAllMarkers(file);
        ui.clearSelection(file);
        for (const auto& [line, bp] : store.allFor(file)) {
            if (bp.enabled) {
                ui.setMarker(file, line - 1);
            }
        }
    }
}

// Events

void SessionController::post(SessionEvent event) {
    postFor(sessionGeneration.load(), std::move(event));
}

void SessionController::postFor(uint64_t session, SessionEvent event) {
    eventQueue.push(QueuedEvent{session, std::move(event)});
}

void SessionController::flush() {
    eventQueue.waitUntilIdle();
}

void SessionController::dispatch(const SessionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex);
    handleEvent(event);
}

void SessionController::eventLoop() {
    QueuedEvent queued;
    while (eventQueue.pop(queued)) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (queued.session == sessionGeneration.load()) {
                handleEvent(queued.event);
            } else {
                LOG_TRACE("Dropping event from an earlier session: ", describeEvent(queued.event));
            }
        }
        eventQueue.taskDone();
    }
}

void SessionController::handleEvent(const SessionEvent& event) {
    LOG_TRACE("Debugger event: ", describeEvent(event));
    try {
        std::visit([this](const auto& e) { handle(e); }, event);
    } catch (const SessionError& e) {
        failSession(e);
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling event '", describeEvent(event), "': ", e.what());
        eventLogger->logEvent(EventLogger::EventType::ERROR,
                              std::string("Error handling event: ") + e.what(),
                              "", describeEvent(event));
    }
}

void SessionController::handle(const BootstrapEvent&) {
    if (phase != Phase::Starting) {
        LOG_WARNING("Ignoring bootstrap while ", phaseName(phase));
        return;
    }

    for (const auto& file : documents.openFiles()) {
        for (const auto& [line, bp] : store.allFor(file)) {
            if (!bp.enabled) continue;
            const std::string& target = file;
            int targetLine = line;
            if (!request("break " + bp.location(),
                         [&target, targetLine](DebugLink& l) { l.setBreakpoint(target, targetLine); })) {
                return;
            }
        }
    }

    if (request("run", [](DebugLink& l) { l.run(); })) {
        setPhase(Phase::Running);
    }
}

void SessionController::handle(const LineEvent& event) {
    if (phase != Phase::Running && phase != Phase::Paused) {
        LOG_WARNING("Ignoring line event while ", phaseName(phase));
        return;
    }
    if (event.line < 1) {
        LOG_WARNING("Ignoring line event with invalid line ", event.line);
        return;
    }

    position = Location{event.file, event.line};
    setPhase(Phase::Paused);
    ui.moveSelection(event.file, event.line - 1);
}

void SessionController::handle(const StackEvent& event) {
    if (phase == Phase::Idle || phase == Phase::Finished) {
        LOG_DEBUG("Ignoring stack while ", phaseName(phase));
        return;
    }

    stack = event.stack;
    if (stack.isEmpty()) {
        LOG_DEBUG("Debugger sent an empty stack");
        return;
    }
    ui.updateInspector(stack.innermostLocals());
}

void SessionController::handle(const BreakpointEnableEvent& event) {
    const Breakpoint& bp = event.breakpoint;
    if (store.find(bp.file, bp.line)) {
        store.enable(bp);
    } else {
        store.create(bp.file, bp.line);
    }
}

void SessionController::handle(const BreakpointDisableEvent& event) {
    const Breakpoint& bp = event.breakpoint;
    if (!store.disable(bp)) {
        // Unknown to the store; the marker still has to go
        ui.clearMarker(bp.file, bp.line - 1);
    }
}

void SessionController::handle(const BreakpointIgnoreEvent& event) {
    recordInert(event);
}

void SessionController::handle(const BreakpointClearEvent& event) {
    recordInert(event);
}

void SessionController::handle(const InfoEvent& event) {
    ui.showStatus("Debugger info: " + event.message);
}

void SessionController::handle(const WarningEvent& event) {
    ui.showStatus("Debugger warning: " + event.message);
}

void SessionController::handle(const ErrorEvent& event) {
    ui.showStatus("Debugger error: " + event.message);
}

void SessionController::handle(const PostmortemEvent& event) {
    // TODO: offer restart or inspection once the runner supports postmortem sessions
    LOG_ERROR("Debugger postmortem: ", event.context);
    eventLogger->logEvent(EventLogger::EventType::DIAGNOSTIC, "Postmortem", script, event.context);
    ui.showStatus("Debugger postmortem: " + event.context);
}

void SessionController::handle(const RestartEvent& event) {
    recordInert(event);
}

void SessionController::handle(const CallEvent& event) {
    recordInert(event);
}

void SessionController::handle(const ReturnEvent& event) {
    recordInert(event);
}

void SessionController::handle(const ExceptionEvent& event) {
    recordInert(event);
}

void SessionController::recordInert(const SessionEvent& event) {
    LOG_DEBUG("Unhandled debugger event: ", describeEvent(event));
    eventLogger->logEvent(EventLogger::EventType::DIAGNOSTIC, describeEvent(event));
}

void SessionController::handle(const ProcessFinishedEvent& event) {
    if (phase == Phase::Idle) {
        LOG_DEBUG("Ignoring process exit with no session");
        return;
    }

    setPhase(Phase::Finished);
    eventLogger->logEvent(EventLogger::EventType::PROCESS, describeEvent(event), script);

    for (const auto& name : actionNames()) {
        if (name != "stop") {
            ui.enableAction(name, false);
        }
    }
    if (config->session().statusMessages) {
        ui.showStatus("Your script has finished running.");
    }
    resyncMarkers();

    ++sessionGeneration;
    if (link) {
        link->close();
        link.reset();
    }
    if (process) {
        if (!process->waitForFinished(config->session().finishTimeoutMs)) {
            LOG_WARNING("Process reported exit but is still running; killing it");
            process->kill();
            process->waitForFinished(config->session().finishTimeoutMs);
        }
        process.reset();
    }
    stack.clear();
    position.reset();

    // Inspector and read-only mode stay until stop() so the last state can be read
    setPhase(Phase::Idle);
}

// Read-only views

SessionController::Phase SessionController::getPhase() const {
    std::lock_guard<std::mutex> lock(mutex);
    return phase;
}

bool SessionController::hasProcess() const {
    std::lock_guard<std::mutex> lock(mutex);
    return process != nullptr;
}

bool SessionController::hasLink() const {
    std::lock_guard<std::mutex> lock(mutex);
    return link != nullptr;
}

std::optional<SessionController::Location> SessionController::getPosition() const {
    std::lock_guard<std::mutex> lock(mutex);
    return position;
}

StackSnapshot SessionController::getStack() const {
    std::lock_guard<std::mutex> lock(mutex);
    return stack;
}

BreakpointStore::LineMap SessionController::breakpointsFor(const std::string& file) const {
    std::lock_guard<std::mutex> lock(mutex);
    return store.allFor(file);
}

std::vector<Breakpoint> SessionController::getAllBreakpoints() const {
    std::lock_guard<std::mutex> lock(mutex);
    return store.getAllBreakpoints();
}
