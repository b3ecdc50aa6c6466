#include "process_runner.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr int kReadEnd = 0;
constexpr int kWriteEnd = 1;

/// Upper bound on one poll() so a child that exits without closing the pipe is noticed.
constexpr int kPollIntervalMs = 100;

int exitCodeOf(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

/**
 * @brief Non-blocking reap.
 *
 * @return True once the child has been reaped; @p status then holds its wait status.
 */
bool reapIfExited(pid_t pid, int& status) {
    while (true) {
        pid_t reaped = waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            return true;
        }
        if (reaped == 0) {
            return false;
        }
        if (errno != EINTR) {
            status = -1;
            return true;
        }
    }
}

void reapBlocking(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

/**
 * @brief Reads whatever is buffered in a non-blocking pipe.
 *
 * @return False once the write side is closed or the read fails.
 */
bool drainPipe(int fd, std::string& output) {
    char buf[8192];
    while (true) {
        ssize_t bytesRead = read(fd, buf, sizeof(buf));
        if (bytesRead > 0) {
            output.append(buf, static_cast<std::size_t>(bytesRead));
            continue;
        }
        if (bytesRead < 0 && errno == EINTR) {
            continue;
        }
        if (bytesRead < 0 && errno == EAGAIN) {
            return true;
        }
        return false;
    }
}

} // namespace

std::string describeCommand(const std::vector<std::string>& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) {
            text += ' ';
        }
        text += arg;
    }
    return text;
}

std::expected<CommandResult, std::string> PosixProcessRunner::run(const std::vector<std::string>& argv,
                                                                  std::chrono::seconds timeout) {
    if (argv.empty()) {
        return std::unexpected("Empty command");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(std::string("Failed to create pipe: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[kReadEnd]);
        close(fds[kWriteEnd]);
        return std::unexpected(std::string("Failed to fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // child: own process group, stdout and stderr share the pipe, stdin is empty
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(fds[kWriteEnd], STDOUT_FILENO);
        dup2(fds[kWriteEnd], STDERR_FILENO);
        execv(args[0], args.data());

        const char* reason = std::strerror(errno);
        const char prefix[] = "Cannot run command: ";
        ssize_t ignored = write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
        ignored = write(STDERR_FILENO, reason, std::strlen(reason));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    close(fds[kWriteEnd]);
    fcntl(fds[kReadEnd], F_SETFL, fcntl(fds[kReadEnd], F_GETFL) | O_NONBLOCK);

    CommandResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool pipeOpen = true;
    bool exited = false;
    int status = 0;

    // The child's exit ends the run even if a descendant still holds the pipe.
    while (true) {
        if (reapIfExited(pid, status)) {
            exited = true;
            if (pipeOpen) {
                pipeOpen = drainPipe(fds[kReadEnd], result.output);
            }
            break;
        }

        int waitMs = kPollIntervalMs;
        if (timeout.count() > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timedOut = true;
                break;
            }
            waitMs = static_cast<int>(std::min<std::chrono::milliseconds::rep>(remaining.count(), kPollIntervalMs));
        }

        if (!pipeOpen) {
            poll(nullptr, 0, waitMs);
            continue;
        }

        pollfd pfd{fds[kReadEnd], POLLIN, 0};
        int ready = poll(&pfd, 1, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            pipeOpen = false;
            continue;
        }
        if (ready > 0) {
            pipeOpen = drainPipe(fds[kReadEnd], result.output);
        }
    }

    if (result.timedOut) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        reapBlocking(pid);
    }
    close(fds[kReadEnd]);

    result.exitCode = exited ? exitCodeOf(status) : -1;
    return result;
}
