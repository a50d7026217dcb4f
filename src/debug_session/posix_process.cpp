#include "debug_session/posix_process.hpp"
#include "debug_session/session_errors.hpp"
#include "logger.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

PosixProcess::PosixProcess(std::vector<std::string> args, std::string dir)
    : argv(std::move(args))
    , workingDir(std::move(dir))
{}

PosixProcess::~PosixProcess() {
    kill();
    if (watcher.joinable()) {
        watcher.join();
    }
    closeFds();
}

void PosixProcess::start() {
    if (argv.empty()) {
        throw ProcessLaunchFailure("No program to run");
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (started) {
            throw ProcessLaunchFailure("Process " + argv[0] + " was already started");
        }
    }

    int inPipe[2];
    int outPipe[2];
    int errPipe[2];
    if (pipe(inPipe) != 0) {
        throw ProcessLaunchFailure(std::string("pipe: ") + std::strerror(errno));
    }
    if (pipe(outPipe) != 0) {
        int err = errno;
        ::close(inPipe[0]);
        ::close(inPipe[1]);
        throw ProcessLaunchFailure(std::string("pipe: ") + std::strerror(err));
    }
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        int err = errno;
        for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1]}) ::close(fd);
        throw ProcessLaunchFailure(std::string("pipe: ") + std::strerror(err));
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) ::close(fd);
        throw ProcessLaunchFailure(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        ::close(inPipe[0]);
        ::close(inPipe[1]);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(errPipe[0]);
        if (!workingDir.empty() && chdir(workingDir.c_str()) != 0) {
            int err = errno;
            (void)!write(errPipe[1], &err, sizeof(err));
            _exit(127);
        }
        execvp(cargv[0], cargv.data());
        int err = errno;
        (void)!write(errPipe[1], &err, sizeof(err));
        _exit(127);
    }

    // Parent
    ::close(inPipe[0]);
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    int childErr = 0;
    ssize_t n;
    do {
        n = read(errPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(errPipe[0]);

    if (n > 0) {
        waitpid(pid, nullptr, 0);
        ::close(inPipe[1]);
        ::close(outPipe[0]);
        throw ProcessLaunchFailure("Could not run " + argv[0] + ": " + std::strerror(childErr));
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        childPid = pid;
        toChild = inPipe[1];
        fromChild = outPipe[0];
        started = true;
    }
    LOG_DEBUG("Started ", argv[0], " as pid ", pid);
    watcher = std::thread([this]() { watch(); });
}

void PosixProcess::watch() {
    int rawStatus = 0;
    pid_t result;
    do {
        result = waitpid(childPid, &rawStatus, 0);
    } while (result < 0 && errno == EINTR);

    TerminationCallback callback;
    int exitCode = 0;
    ExitStatus exitStatus = ExitStatus::NormalExit;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (result < 0) {
            LOG_ERROR("waitpid(", childPid, "): ", std::strerror(errno));
            exitStatus = ExitStatus::CrashExit;
            exitCode = -1;
        } else if (WIFEXITED(rawStatus)) {
            exitCode = WEXITSTATUS(rawStatus);
        } else if (WIFSIGNALED(rawStatus)) {
            exitCode = WTERMSIG(rawStatus);
            exitStatus = ExitStatus::CrashExit;
        }
        code = exitCode;
        status = exitStatus;
        finished = true;
        callback = onTerminated;
    }
    finishedCv.notify_all();

    LOG_DEBUG("Process ", childPid, " exited with code ", exitCode);
    if (callback) {
        callback(exitCode, exitStatus);
    }
}

void PosixProcess::kill() {
    std::lock_guard<std::mutex> lock(mutex);
    if (started && !finished && childPid > 0) {
        if (::kill(childPid, SIGKILL) != 0 && errno != ESRCH) {
            LOG_WARNING("kill(", childPid, "): ", std::strerror(errno));
        }
    }
}

bool PosixProcess::waitForStarted(int /*timeoutMs*/) {
    // start() only returns once exec has succeeded
    std::lock_guard<std::mutex> lock(mutex);
    return started;
}

bool PosixProcess::waitForFinished(int timeoutMs) {
    std::unique_lock<std::mutex> lock(mutex);
    if (!started) return true;
    return finishedCv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                               [this] { return finished; });
}

bool PosixProcess::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex);
    return started && !finished;
}

int PosixProcess::exitCode() const {
    std::lock_guard<std::mutex> lock(mutex);
    return code;
}

void PosixProcess::setTerminationCallback(TerminationCallback callback) {
    std::lock_guard<std::mutex> lock(mutex);
    onTerminated = std::move(callback);
}

void PosixProcess::closeFds() {
    std::lock_guard<std::mutex> lock(mutex);
    closeFd(toChild);
    closeFd(fromChild);
}
