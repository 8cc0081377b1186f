// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Linux Process PAL Implementation

#include "faultline/pal/linux/linux_process_pal.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace faultline {
namespace pal {
namespace linux {

namespace {

constexpr auto WAIT_POLL_INTERVAL = std::chrono::milliseconds(10);

/**
 * @brief argv/envp arrays prepared before fork.
 *
 * The child must not allocate, so every string the exec call needs is
 * materialized here and the pointer arrays refer into it.
 */
struct ExecImage {
    std::vector<std::string> argStorage;
    std::vector<std::string> envStorage;
    std::vector<char*> argv;
    std::vector<char*> envp;

    explicit ExecImage(const ProcessSpec& spec) {
        argStorage.reserve(spec.args.size() + 1);
        argStorage.push_back(spec.executable);
        argStorage.insert(argStorage.end(), spec.args.begin(), spec.args.end());

        for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
            std::string entry(*e);
            auto eq = entry.find('=');
            if (eq != std::string::npos && spec.env.count(entry.substr(0, eq)) > 0) {
                continue;
            }
            envStorage.push_back(std::move(entry));
        }
        for (const auto& kv : spec.env) {
            envStorage.push_back(kv.first + "=" + kv.second);
        }

        for (auto& s : argStorage) argv.push_back(&s[0]);
        argv.push_back(nullptr);
        for (auto& s : envStorage) envp.push_back(&s[0]);
        envp.push_back(nullptr);
    }
};

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/**
 * @brief Child side after fork: wire descriptors and exec. Never returns.
 *
 * Only async-signal-safe calls are made here.
 */
[[noreturn]] void execChild(const ExecImage& image, int stdoutFd, int stderrFd, int errPipe) {
    // Own process group so a timeout kill also reaches grandchildren.
    ::setpgid(0, 0);

    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
        ::dup2(devNull, STDIN_FILENO);
    }
    ::dup2(stdoutFd, STDOUT_FILENO);
    ::dup2(stderrFd, STDERR_FILENO);

    ::execvpe(image.argv[0], image.argv.data(), image.envp.data());

    int err = errno;
    ssize_t ignored = ::write(errPipe, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

/**
 * @brief Parent side: learn whether exec succeeded.
 *
 * The pipe is close-on-exec, so EOF with no data means the exec went through.
 */
int readExecErrno(int errPipe) {
    int err = 0;
    ssize_t n;
    do {
        n = ::read(errPipe, &err, sizeof(err));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(err)) ? err : 0;
}

} // anonymous namespace

// =============================================================================
// run
// =============================================================================

core::Result<ProcessResult, ProcessError> LinuxProcessPAL::run(const ProcessSpec& spec) {
    using Res = core::Result<ProcessResult, ProcessError>;

    ExecImage image(spec);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 ||
        ::pipe2(execPipe, O_CLOEXEC) != 0) {
        int err = errno;
        for (int* p : {outPipe, errPipe, execPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        return Res::error(ProcessError(ProcessErrorCode::PipeFailed,
            std::string("pipe2 failed: ") + std::strerror(err), err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int* p : {outPipe, errPipe, execPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        return Res::error(ProcessError(ProcessErrorCode::ForkFailed,
            std::string("fork failed: ") + std::strerror(err), err));
    }

    if (pid == 0) {
        execChild(image, outPipe[1], errPipe[1], execPipe[1]);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int execErr = readExecErrno(execPipe[0]);
    closeFd(execPipe[0]);
    if (execErr != 0) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        ::waitpid(pid, nullptr, 0);
        return Res::error(ProcessError(ProcessErrorCode::ExecFailed,
            "exec " + spec.executable + " failed: " + std::strerror(execErr), execErr));
    }

    const bool hasDeadline = spec.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;

    ProcessResult result;
    bool timedOut = false;
    char chunk[4096];

    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        int waitMs = -1;
        if (hasDeadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                timedOut = true;
                break;
            }
            waitMs = static_cast<int>(remaining.count());
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (outPipe[0] >= 0) fds[count++] = {outPipe[0], POLLIN, 0};
        if (errPipe[0] >= 0) fds[count++] = {errPipe[0], POLLIN, 0};

        int ready = ::poll(fds, count, waitMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) continue;

            bool isOut = fds[i].fd == outPipe[0];
            if (n <= 0) {
                closeFd(isOut ? outPipe[0] : errPipe[0]);
                continue;
            }
            (isOut ? result.stdoutText : result.stderrText).append(chunk, static_cast<size_t>(n));
        }
    }

    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    if (timedOut) {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
        return Res::error(ProcessError(ProcessErrorCode::Timeout,
            spec.executable + " did not finish within " +
            std::to_string(spec.timeout.count()) + "ms"));
    }

    // Output is drained; the child has closed its ends and is exiting.
    std::chrono::milliseconds reapTimeout(0);
    if (hasDeadline) {
        reapTimeout = std::max(std::chrono::milliseconds(1),
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()));
    }
    auto status = wait(ProcessHandle{pid}, reapTimeout);
    if (status.isError()) {
        if (status.error().code == ProcessErrorCode::Timeout) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
        }
        return Res::error(status.error());
    }

    result.exitCode = status.value();
    return Res::success(std::move(result));
}

// =============================================================================
// spawn / signal / wait
// =============================================================================

core::Result<ProcessHandle, ProcessError> LinuxProcessPAL::spawn(const ProcessSpec& spec) {
    using Res = core::Result<ProcessHandle, ProcessError>;

    ExecImage image(spec);

    const std::string outPath = spec.stdoutPath.empty() ? "/dev/null" : spec.stdoutPath;
    int outFd = ::open(outPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (outFd < 0) {
        int err = errno;
        return Res::error(ProcessError(ProcessErrorCode::PipeFailed,
            "cannot open " + outPath + ": " + std::strerror(err), err));
    }

    int execPipe[2] = {-1, -1};
    if (::pipe2(execPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeFd(outFd);
        return Res::error(ProcessError(ProcessErrorCode::PipeFailed,
            std::string("pipe2 failed: ") + std::strerror(err), err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeFd(outFd);
        closeFd(execPipe[0]);
        closeFd(execPipe[1]);
        return Res::error(ProcessError(ProcessErrorCode::ForkFailed,
            std::string("fork failed: ") + std::strerror(err), err));
    }

    if (pid == 0) {
        execChild(image, outFd, outFd, execPipe[1]);
    }

    closeFd(outFd);
    closeFd(execPipe[1]);
    int execErr = readExecErrno(execPipe[0]);
    closeFd(execPipe[0]);

    if (execErr != 0) {
        ::waitpid(pid, nullptr, 0);
        return Res::error(ProcessError(ProcessErrorCode::ExecFailed,
            "exec " + spec.executable + " failed: " + std::strerror(execErr), execErr));
    }

    return Res::success(ProcessHandle{pid});
}

core::Result<void, ProcessError> LinuxProcessPAL::signal(ProcessHandle handle, int signo) {
    using Res = core::Result<void, ProcessError>;

    if (handle == INVALID_PROCESS_HANDLE || handle.pid <= 0) {
        return Res::error(ProcessError(ProcessErrorCode::InvalidHandle, "invalid process handle"));
    }
    if (::kill(static_cast<pid_t>(handle.pid), signo) != 0) {
        int err = errno;
        return Res::error(ProcessError(ProcessErrorCode::SignalFailed,
            "kill(" + std::to_string(handle.pid) + ") failed: " + std::strerror(err), err));
    }
    return Res::success();
}

core::Result<int, ProcessError> LinuxProcessPAL::wait(
    ProcessHandle handle,
    std::chrono::milliseconds timeout
) {
    using Res = core::Result<int, ProcessError>;

    if (handle == INVALID_PROCESS_HANDLE || handle.pid <= 0) {
        return Res::error(ProcessError(ProcessErrorCode::InvalidHandle, "invalid process handle"));
    }

    const pid_t pid = static_cast<pid_t>(handle.pid);
    const bool hasDeadline = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, hasDeadline ? WNOHANG : 0);
        if (r == pid) {
            return Res::success(decodeStatus(status));
        }
        if (r < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            return Res::error(ProcessError(ProcessErrorCode::WaitFailed,
                "waitpid(" + std::to_string(handle.pid) + ") failed: " + std::strerror(err), err));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Res::error(ProcessError(ProcessErrorCode::Timeout,
                "process " + std::to_string(handle.pid) + " still running after " +
                std::to_string(timeout.count()) + "ms"));
        }
        std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
    }
}

} // namespace linux
} // namespace pal
} // namespace faultline
