#include "debug_session/text_debug_link.hpp"
#include "debug_session/posix_process.hpp"
#include "debug_session/session_errors.hpp"
#include "logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <unistd.h>

namespace {

// Blocks SIGPIPE on the calling thread for the lifetime of the guard. A write
// to a pipe whose reader is gone then fails with EPIPE instead of killing the
// process; the SIGPIPE it raised is consumed before the mask is restored.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&pipeSet);
        sigaddset(&pipeSet, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        alreadyPending = sigismember(&pending, SIGPIPE) == 1;

        blocked = pthread_sigmask(SIG_BLOCK, &pipeSet, &previous) == 0;
    }

    ~SigpipeGuard() {
        if (!blocked) return;
        if (brokenPipe && !alreadyPending) {
            const timespec zero{0, 0};
            while (sigtimedwait(&pipeSet, nullptr, &zero) < 0 && errno == EINTR) {
            }
        }
        pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

    void sawBrokenPipe() { brokenPipe = true; }

private:
    sigset_t pipeSet;
    sigset_t previous;
    bool alreadyPending{false};
    bool blocked{false};
    bool brokenPipe{false};
};

} // namespace

TextDebugLink::TextDebugLink(int wfd, int rfd, EventCallback callback)
    : writeFd(wfd)
    , readFd(rfd)
    , onEvent(std::move(callback))
{
    if (writeFd < 0 || readFd < 0) {
        throw LinkError("Debugger link needs open descriptors");
    }
    if (pipe2(wakePipe, O_CLOEXEC) != 0) {
        throw LinkError(std::string("pipe: ") + std::strerror(errno));
    }
    reader = std::thread([this]() { readLoop(); });
}

TextDebugLink::~TextDebugLink() {
    close();
    for (int& fd : wakePipe) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

void TextDebugLink::run() {
    send(link_protocol::formatCommand("run"));
}

void TextDebugLink::stepOver() {
    send(link_protocol::formatCommand("next"));
}

void TextDebugLink::stepInto() {
    send(link_protocol::formatCommand("step"));
}

void TextDebugLink::stepReturn() {
    send(link_protocol::formatCommand("return"));
}

void TextDebugLink::setBreakpoint(const std::string& file, int line) {
    send(link_protocol::formatBreakpointCommand("break", file, line));
}

void TextDebugLink::clearBreakpoint(const Breakpoint& bp) {
    send(link_protocol::formatBreakpointCommand("clear", bp.file, bp.line));
}

void TextDebugLink::enableBreakpoint(const Breakpoint& bp) {
    send(link_protocol::formatBreakpointCommand("enable", bp.file, bp.line));
}

void TextDebugLink::disableBreakpoint(const Breakpoint& bp) {
    send(link_protocol::formatBreakpointCommand("disable", bp.file, bp.line));
}

void TextDebugLink::close() {
    bool wasOpen = open.exchange(false);
    if (wasOpen && wakePipe[1] >= 0) {
        char wake = 'x';
        (void)!write(wakePipe[1], &wake, 1);
    }
    if (reader.joinable() && reader.get_id() != std::this_thread::get_id()) {
        reader.join();
    }
}

void TextDebugLink::send(const std::string& message) {
    if (!open) {
        throw LinkError("Debugger link is closed");
    }

    std::lock_guard<std::mutex> lock(writeMutex);
    std::string failure;
    {
        SigpipeGuard guard;
        size_t written = 0;
        while (written < message.size()) {
            ssize_t n = write(writeFd, message.data() + written, message.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EPIPE) guard.sawBrokenPipe();
                failure = std::strerror(errno);
                break;
            }
            written += static_cast<size_t>(n);
        }
    }
    if (!failure.empty()) {
        throw LinkError("Lost connection to the debugger: " + failure);
    }
    LOG_TRACE("-> ", message.substr(0, message.size() - 1));
}

void TextDebugLink::readLoop() {
    link_protocol::Decoder decoder;
    std::string buffer;
    char chunk[4096];

    while (open) {
        pollfd fds[2] = {
            {readFd, POLLIN, 0},
            {wakePipe[0], POLLIN, 0},
        };
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("poll on debugger link: ", std::strerror(errno));
            break;
        }
        if (fds[1].revents != 0) {
            break;
        }
        if (fds[0].revents == 0) {
            continue;
        }

        ssize_t n = read(readFd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("read on debugger link: ", std::strerror(errno));
            break;
        }
        if (n == 0) {
            LOG_DEBUG("Debugger link reached end of stream");
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));
        size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            deliver(line, decoder);
        }
    }
}

void TextDebugLink::deliver(const std::string& line, link_protocol::Decoder& decoder) {
    LOG_TRACE("<- ", line);
    try {
        auto event = decoder.feed(line);
        if (event && onEvent) {
            onEvent(std::move(*event));
        }
    } catch (const std::invalid_argument& e) {
        LOG_WARNING("Skipping debugger message: ", e.what());
    }
}

PosixBackend::PosixBackend(std::shared_ptr<SessionConfig> cfg)
    : config(cfg ? std::move(cfg) : SessionConfig::getInstance())
{}

std::unique_ptr<ProcessHandle> PosixBackend::spawn(const std::string& script,
                                                   const std::string& workingDir) {
    std::vector<std::string> argv;
    argv.push_back(config->session().interpreter);
    if (!config->session().runner.empty()) {
        argv.push_back(config->session().runner);
    }
    argv.push_back(script);
    return std::make_unique<PosixProcess>(std::move(argv), workingDir);
}

std::unique_ptr<DebugLink> PosixBackend::connect(ProcessHandle& process,
                                                 DebugLink::EventCallback onEvent) {
    auto* posix = dynamic_cast<PosixProcess*>(&process);
    if (!posix) {
        throw LinkError("PosixBackend can only connect to processes it spawned");
    }
    return std::make_unique<TextDebugLink>(posix->stdinFd(), posix->stdoutFd(), std::move(onEvent));
}
