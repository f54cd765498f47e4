#include "CommandExecutor.hpp"
#include "EmuError.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

namespace {

constexpr int kTerminateGraceMs = 1000;

struct ExecArgs {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    ExecArgs(const std::string& program, const std::vector<std::string>& args) {
        storage.reserve(args.size() + 1);
        storage.push_back(program);
        storage.insert(storage.end(), args.begin(), args.end());
        for (auto& s : storage) {
            argv.push_back(&s[0]);
        }
        argv.push_back(nullptr);
    }
};

bool makePipe(int fds[2]) {
    if (pipe(fds) != 0) {
        return false;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Child side: wire stdio and exec. Only async-signal-safe calls from here on.
[[noreturn]] void execChild(char* const* argv, int stdoutFd, int stderrFd, int errnoFd) {
    int devNull = open("/dev/null", O_RDWR);
    if (devNull >= 0) {
        dup2(devNull, STDIN_FILENO);
    }
    dup2(stdoutFd >= 0 ? stdoutFd : devNull, STDOUT_FILENO);
    dup2(stderrFd >= 0 ? stderrFd : devNull, STDERR_FILENO);

    execvp(argv[0], argv);

    int err = errno;
    ssize_t ignored = write(errnoFd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

int readExecErrno(int errnoFd) {
    int err = 0;
    ssize_t n;
    do {
        n = read(errnoFd, &err, sizeof(err));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(err)) ? err : 0;
}

void throwLaunchError(const std::string& program, int err) {
    std::string message = "Failed to launch '" + program + "': " + std::strerror(err);
    if (err == ENOENT) {
        throw EmuError(EmuErrorKind::SdkUnavailable, message);
    }
    if (err == EACCES || err == EPERM) {
        throw EmuError(EmuErrorKind::PermissionDenied, message);
    }
    throw EmuError(EmuErrorKind::CommandExecutionFailure, message);
}

int waitForExit(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// SIGTERM, then SIGKILL once the grace period runs out. Reaps the child.
int terminateProcess(pid_t pid, int graceMs) {
    constexpr int kReapPollMs = 20;
    if (kill(pid, SIGTERM) != 0 && errno == ESRCH) {
        return waitForExit(pid);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(graceMs);
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t reaped = waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            if (WIFEXITED(status)) return WEXITSTATUS(status);
            if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
            return -1;
        }
        if (reaped < 0 && errno != EINTR) {
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kReapPollMs));
    }

    LOG_DEBUG("Process " + std::to_string(pid) + " ignored SIGTERM, sending SIGKILL");
    kill(pid, SIGKILL);
    return waitForExit(pid);
}

} // namespace

CommandResult CommandExecutor::run(const std::string& program, const std::vector<std::string>& args) {
    return execute(program, args, defaultTimeoutMs_);
}

CommandResult CommandExecutor::runWithRetry(const std::string& program, const std::vector<std::string>& args,
                                            int attempts, int delayMs) {
    CommandResult result;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        result = run(program, args);
        if (result.success()) {
            return result;
        }
        LOG_DEBUG("Attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
                  " failed: " + formatCommandLine(program, args));
        if (attempt < attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        }
    }
    return result;
}

std::string CommandExecutor::formatCommandLine(const std::string& program, const std::vector<std::string>& args) {
    std::ostringstream ss;
    ss << program;
    for (const auto& arg : args) {
        ss << " " << arg;
    }
    return ss.str();
}

CommandResult ProcessCommandExecutor::execute(const std::string& program, const std::vector<std::string>& args,
                                              int timeoutMs) {
    ExecArgs execArgs(program, args);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (!makePipe(outPipe) || !makePipe(errPipe) || !makePipe(statusPipe)) {
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to create pipes: " + std::string(std::strerror(errno)));
    }

    if (Logger::getInstance().isEnabled(LogLevel::DEBUG)) {
        LOG_DEBUG("Executing: " + formatCommandLine(program, args));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int* fds : {outPipe, errPipe, statusPipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        throw EmuError(EmuErrorKind::CommandExecutionFailure, "fork failed: " + std::string(std::strerror(err)));
    }

    if (pid == 0) {
        execChild(execArgs.argv.data(), outPipe[1], errPipe[1], statusPipe[1]);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    int execErr = readExecErrno(statusPipe[0]);
    closeFd(statusPipe[0]);
    if (execErr != 0) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        waitForExit(pid);
        throwLaunchError(program, execErr);
    }

    CommandResult result;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    char buffer[4096];

    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (timeoutMs > 0 && remaining <= 0) {
            closeFd(outPipe[0]);
            closeFd(errPipe[0]);
            terminateProcess(pid, kTerminateGraceMs);
            throw EmuError(EmuErrorKind::Timeout,
                           "Command timed out after " + std::to_string(timeoutMs) + "ms: " +
                           formatCommandLine(program, args));
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (outPipe[0] >= 0) fds[count++] = {outPipe[0], POLLIN, 0};
        if (errPipe[0] >= 0) fds[count++] = {errPipe[0], POLLIN, 0};

        int ready = poll(fds, count, timeoutMs > 0 ? static_cast<int>(std::min<long long>(remaining, 100)) : 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            bool isStdout = fds[i].fd == outPipe[0];
            if (n > 0) {
                (isStdout ? result.stdoutText : result.stderrText).append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                closeFd(isStdout ? outPipe[0] : errPipe[0]);
            }
        }
    }

    closeFd(outPipe[0]);
    closeFd(errPipe[0]);
    result.exitCode = waitForExit(pid);

    if (!result.success()) {
        LOG_DEBUG("Command exited with " + std::to_string(result.exitCode) + ": " +
                  formatCommandLine(program, args));
    }
    return result;
}

pid_t ProcessCommandExecutor::spawnDetached(const std::string& program, const std::vector<std::string>& args) {
    ExecArgs execArgs(program, args);

    int pidPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (!makePipe(pidPipe) || !makePipe(statusPipe)) {
        closeFd(pidPipe[0]); closeFd(pidPipe[1]);
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to create pipes: " + std::string(std::strerror(errno)));
    }

    LOG_INFO("Spawning detached: " + formatCommandLine(program, args));

    pid_t intermediate = fork();
    if (intermediate < 0) {
        int err = errno;
        closeFd(pidPipe[0]); closeFd(pidPipe[1]);
        closeFd(statusPipe[0]); closeFd(statusPipe[1]);
        throw EmuError(EmuErrorKind::CommandExecutionFailure, "fork failed: " + std::string(std::strerror(err)));
    }

    if (intermediate == 0) {
        setsid();
        pid_t grandchild = fork();
        if (grandchild == 0) {
            execChild(execArgs.argv.data(), -1, -1, statusPipe[1]);
        }
        ssize_t ignored = write(pidPipe[1], &grandchild, sizeof(grandchild));
        (void)ignored;
        _exit(grandchild < 0 ? 1 : 0);
    }

    closeFd(pidPipe[1]);
    closeFd(statusPipe[1]);
    waitForExit(intermediate);

    pid_t spawned = -1;
    ssize_t n = read(pidPipe[0], &spawned, sizeof(spawned));
    closeFd(pidPipe[0]);

    int execErr = readExecErrno(statusPipe[0]);
    closeFd(statusPipe[0]);

    if (n != static_cast<ssize_t>(sizeof(spawned)) || spawned < 0) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure, "Failed to spawn '" + program + "'");
    }
    if (execErr != 0) {
        throwLaunchError(program, execErr);
    }

    LOG_DEBUG("Detached process started with pid " + std::to_string(spawned));
    return spawned;
}

int ProcessCommandExecutor::streamLines(const std::string& program, const std::vector<std::string>& args,
                                        const LineCallback& onLine, const KeepGoing& keepGoing) {
    ExecArgs execArgs(program, args);

    int outPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (!makePipe(outPipe) || !makePipe(statusPipe)) {
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to create pipes: " + std::string(std::strerror(errno)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(statusPipe[0]); closeFd(statusPipe[1]);
        throw EmuError(EmuErrorKind::CommandExecutionFailure, "fork failed: " + std::string(std::strerror(err)));
    }

    if (pid == 0) {
        execChild(execArgs.argv.data(), outPipe[1], -1, statusPipe[1]);
    }

    closeFd(outPipe[1]);
    closeFd(statusPipe[1]);

    int execErr = readExecErrno(statusPipe[0]);
    closeFd(statusPipe[0]);
    if (execErr != 0) {
        closeFd(outPipe[0]);
        waitForExit(pid);
        throwLaunchError(program, execErr);
    }

    std::string pending;
    char buffer[4096];
    bool cancelled = false;

    while (outPipe[0] >= 0) {
        if (!keepGoing()) {
            cancelled = true;
            break;
        }

        pollfd fd{outPipe[0], POLLIN, 0};
        int ready = poll(&fd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(outPipe[0], buffer, sizeof(buffer));
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            break;
        }
        pending.append(buffer, static_cast<size_t>(n));

        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!keepGoing()) {
                cancelled = true;
                break;
            }
            onLine(line);
        }
        if (cancelled) {
            break;
        }
    }

    closeFd(outPipe[0]);
    if (cancelled) {
        terminateProcess(pid, kTerminateGraceMs);
        return -1;
    }
    if (!pending.empty()) {
        onLine(pending);
    }
    return waitForExit(pid);
}

bool ProcessCommandExecutor::commandExists(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) {
        return false;
    }

    std::istringstream paths(pathEnv);
    std::string dir;
    while (std::getline(paths, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

bool ProcessCommandExecutor::isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    return kill(pid, 0) == 0 || errno == EPERM;
}
