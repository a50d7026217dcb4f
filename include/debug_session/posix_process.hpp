#ifndef DEBUG_SESSION_POSIX_PROCESS_HPP
#define DEBUG_SESSION_POSIX_PROCESS_HPP

#include "process_handle.hpp"
#include <condition_variable>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

// Child process started with fork/execvp. Its stdin and stdout are pipes the
// debug link talks over; stderr is inherited.
class PosixProcess : public ProcessHandle {
public:
    PosixProcess(std::vector<std::string> argv, std::string workingDir);
    ~PosixProcess() override;

    PosixProcess(const PosixProcess&) = delete;
    PosixProcess& operator=(const PosixProcess&) = delete;

    void start() override;
    void kill() override;
    bool waitForStarted(int timeoutMs) override;
    bool waitForFinished(int timeoutMs) override;
    bool isRunning() const override;
    void setTerminationCallback(TerminationCallback callback) override;

    pid_t pid() const { return childPid; }
    int stdinFd() const { return toChild; }
    int stdoutFd() const { return fromChild; }
    int exitCode() const;
    const std::vector<std::string>& arguments() const { return argv; }

private:
    std::vector<std::string> argv;
    std::string workingDir;

    pid_t childPid{-1};
    int toChild{-1};
    int fromChild{-1};

    mutable std::mutex mutex;
    std::condition_variable finishedCv;
    bool started{false};
    bool finished{false};
    int code{0};
    ExitStatus status{ExitStatus::NormalExit};
    TerminationCallback onTerminated;
    std::thread watcher;

    void watch();
    void closeFds();
};

#endif // DEBUG_SESSION_POSIX_PROCESS_HPP
