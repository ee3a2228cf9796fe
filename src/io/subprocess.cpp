// =============================================================================
// cadvc - Subprocess Execution Implementation
// =============================================================================
// fork/execvp with three pipes plus a close-on-exec status pipe that reports
// exec failures back to the parent. Output is drained with poll() until both
// streams reach EOF or the deadline expires.
// =============================================================================

#include "cadvc/io/subprocess.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "cadvc/common/logger.h"

namespace cadvc::io {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kReadBufferSize = 64 * 1024;

/// @brief Microseconds between exit checks once output has closed.
constexpr useconds_t kWaitPollInterval = 5000;

/// @brief Owning file descriptor.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FileDescriptor read;
    FileDescriptor write;
};

Pipe makePipe() {
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        throw IOError("Failed to create pipe", std::error_code(errno, std::generic_category()));
    }
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

void setNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw IOError("Failed to configure pipe", std::error_code(errno, std::generic_category()));
    }
}

void ignoreSigpipe() {
    static const bool ignored = [] {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)ignored;
}

/// @brief Child side after fork: wire up pipes and exec. Never returns.
/// @note Async-signal-safe calls only.
[[noreturn]] void execChild(std::vector<char*>& args, const ProcessOptions& options, Pipe& in,
                            Pipe& out, Pipe& err, Pipe& status) {
    auto fail = [&](int code) {
        [[maybe_unused]] auto written = ::write(status.write.get(), &code, sizeof(code));
        ::_exit(127);
    };

    if (::dup2(in.read.get(), STDIN_FILENO) < 0 || ::dup2(out.write.get(), STDOUT_FILENO) < 0 ||
        ::dup2(err.write.get(), STDERR_FILENO) < 0) {
        fail(errno);
    }
    if (options.workingDirectory && ::chdir(options.workingDirectory->c_str()) != 0) {
        fail(errno);
    }

    ::signal(SIGPIPE, SIG_DFL);
    ::execvp(args[0], args.data());
    fail(errno);
    ::_exit(127);
}

ErrorCode launchErrorCode(int err) noexcept {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::kNotFound;
        case EACCES:
        case EPERM:
            return ErrorCode::kPermissionDenied;
        default:
            return ErrorCode::kIOError;
    }
}

int decodeWaitStatus(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw IOError("waitpid failed", std::error_code(errno, std::generic_category()));
        }
    }
    return decodeWaitStatus(status);
}

/// @brief Read everything currently available; closes the descriptor on EOF.
void drain(FileDescriptor& fd, std::string& sink) {
    std::array<char, kReadBufferSize> buffer{};
    while (true) {
        const ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            fd.reset();
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        throw IOError("Failed to read child output", std::error_code(errno, std::generic_category()));
    }
}

ProcessResult runImpl(const std::vector<std::string>& argv, const ProcessOptions& options) {
    ignoreSigpipe();

    Pipe in = makePipe();
    Pipe out = makePipe();
    Pipe err = makePipe();
    Pipe status = makePipe();

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const auto deadline = Clock::now() + options.timeout;

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw IOError(fmt::format("Failed to start '{}'", argv.front()),
                      std::error_code(errno, std::generic_category()));
    }
    if (pid == 0) {
        execChild(args, options, in, out, err, status);
    }

    in.read.reset();
    out.write.reset();
    err.write.reset();
    status.write.reset();

    // The status pipe closes on successful exec; otherwise it carries errno
    int launchErrno = 0;
    ssize_t got = 0;
    do {
        got = ::read(status.read.get(), &launchErrno, sizeof(launchErrno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(launchErrno))) {
        waitForChild(pid);
        const std::error_code ec(launchErrno, std::generic_category());
        throw CadvcException(launchErrorCode(launchErrno),
                             fmt::format("Cannot run '{}': {}", argv.front(), ec.message()));
    }

    ProcessResult result;
    FileDescriptor stdinFd = std::move(in.write);
    FileDescriptor stdoutFd = std::move(out.read);
    FileDescriptor stderrFd = std::move(err.read);

    std::size_t written = 0;
    if (options.stdinData.empty()) {
        stdinFd.reset();
    } else {
        setNonBlocking(stdinFd.get());
    }
    setNonBlocking(stdoutFd.get());
    setNonBlocking(stderrFd.get());

    while (stdoutFd.valid() || stderrFd.valid()) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        if (stdoutFd.valid()) {
            fds[count++] = pollfd{stdoutFd.get(), POLLIN, 0};
        }
        if (stderrFd.valid()) {
            fds[count++] = pollfd{stderrFd.get(), POLLIN, 0};
        }
        if (stdinFd.valid()) {
            fds[count++] = pollfd{stdinFd.get(), POLLOUT, 0};
        }

        const int ready = ::poll(fds.data(), count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::kill(pid, SIGKILL);
            waitForChild(pid);
            throw IOError("poll failed", std::error_code(errno, std::generic_category()));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == stdoutFd.get()) {
                drain(stdoutFd, result.stdoutText);
            } else if (fds[i].fd == stderrFd.get()) {
                drain(stderrFd, result.stderrText);
            } else if (fds[i].fd == stdinFd.get()) {
                const ssize_t n = ::write(stdinFd.get(), options.stdinData.data() + written,
                                          options.stdinData.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                }
                // EPIPE: the child stopped reading, which is its business
                if ((n < 0 && errno != EAGAIN && errno != EINTR) ||
                    written == options.stdinData.size()) {
                    stdinFd.reset();
                }
            }
        }
    }

    stdinFd.reset();

    // Output closed early; the child may still be running
    while (!result.timedOut) {
        int waitStatus = 0;
        const pid_t done = ::waitpid(pid, &waitStatus, WNOHANG);
        if (done == pid) {
            result.exitCode = decodeWaitStatus(waitStatus);
            return result;
        }
        if (done < 0 && errno != EINTR) {
            throw IOError("waitpid failed", std::error_code(errno, std::generic_category()));
        }
        if (Clock::now() >= deadline) {
            result.timedOut = true;
            break;
        }
        ::usleep(kWaitPollInterval);
    }

    if (result.timedOut) {
        ::kill(pid, SIGKILL);
        CADVC_LOG_WARNING("'{}' exceeded {} ms and was killed", formatCommandLine(argv),
                          options.timeout.count());
    }
    result.exitCode = waitForChild(pid);
    return result;
}

}  // namespace

std::string formatCommandLine(const std::vector<std::string>& argv) {
    return fmt::format("{}", fmt::join(argv, " "));
}

Result<ProcessResult> runProcess(const std::vector<std::string>& argv,
                                 const ProcessOptions& options) {
    if (argv.empty() || argv.front().empty()) {
        return makeError<ProcessResult>(ErrorCode::kUsageError, "Empty command line");
    }
    CADVC_LOG_DEBUG("Running: {}", formatCommandLine(argv));
    auto result = tryExecute([&] { return runImpl(argv, options); });
    if (result) {
        CADVC_LOG_TRACE("{} exited {}: {}", argv.front(), result->exitCode, result->stderrText);
    }
    return result;
}

}  // namespace cadvc::io
