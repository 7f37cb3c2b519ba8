#include "system_command.h"
#include "../common/structured_logger.h"
#include "../common/input_validator.h"
#include <chrono>
#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace emuflow {
namespace ocal {
namespace system {

namespace {

const size_t MAX_STDERR_BYTES = 64 * 1024;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Returns false on EOF or a hard read error
bool drain(int fd, std::string& sink, size_t limit) {
    char buffer[65536];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            size_t room = sink.size() < limit ? limit - sink.size() : 0;
            sink.append(buffer, static_cast<size_t>(n) < room ? static_cast<size_t>(n) : room);
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // anonymous namespace

std::string formatCommandLine(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            line += InputValidator::quoteForShell(arg);
        } else {
            line += arg;
        }
    }
    return line;
}

CommandResult executeCommand(const std::vector<std::string>& argv,
                             int timeoutMs,
                             size_t maxOutputBytes) {
    CommandResult result;
    result.command = formatCommandLine(argv);
    auto startTime = std::chrono::steady_clock::now();

    if (argv.empty() || argv[0].empty()) {
        result.error = "Empty command";
        result.launchFailed = true;
        SLOG_ERROR().message("Invalid command").context("error", result.error);
        return result;
    }

    if (timeoutMs <= 0 || timeoutMs > 3600000) { // Max 1 hour
        result.error = "Invalid timeout value. Must be between 1 and 3600000 ms";
        result.launchFailed = true;
        SLOG_ERROR().message("Invalid timeout value").context("timeout_ms", timeoutMs);
        return result;
    }

    SLOG_DEBUG().message("Executing command").context("command", result.command);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.error = std::string("Failed to create pipes: ") + std::strerror(errno);
        result.launchFailed = true;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        SLOG_ERROR().message("Command launch failed").context("error", result.error);
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        result.launchFailed = true;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        SLOG_ERROR().message("Command launch failed").context("error", result.error);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        static const char message[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, message, sizeof(message) - 1);
        (void)ignored;
        ::_exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    ::fcntl(outPipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(errPipe[0], F_SETFL, O_NONBLOCK);

    auto deadline = startTime + std::chrono::milliseconds(timeoutMs);
    int outFd = outPipe[0];
    int errFd = errPipe[0];
    bool pollFailed = false;

    while (outFd >= 0 || errFd >= 0) {
        int waitMs = remainingMs(deadline);
        if (waitMs == 0) {
            result.timedOut = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (outFd >= 0) {
            fds[count++] = {outFd, POLLIN, 0};
        }
        if (errFd >= 0) {
            fds[count++] = {errFd, POLLIN, 0};
        }

        int ready = ::poll(fds, count, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error += std::string("poll failed: ") + std::strerror(errno);
            pollFailed = true;
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == outFd) {
                if (!drain(outFd, result.output, maxOutputBytes)) {
                    closeFd(outFd);
                }
            } else if (fds[i].fd == errFd) {
                if (!drain(errFd, result.error, MAX_STDERR_BYTES)) {
                    closeFd(errFd);
                }
            }
        }
    }

    closeFd(outFd);
    closeFd(errFd);

    int status = 0;
    if (result.timedOut || pollFailed) {
        // Either the deadline passed or polling broke; the child may still be running
        if (::waitpid(pid, &status, WNOHANG) == 0) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            if (!result.timedOut) {
                result.timedOut = remainingMs(deadline) == 0;
            }
        }
    } else {
        // Pipes closed; give the child until the deadline to exit
        while (true) {
            pid_t done = ::waitpid(pid, &status, WNOHANG);
            if (done == pid) {
                break;
            }
            if (done < 0 && errno != EINTR) {
                break;
            }
            if (remainingMs(deadline) == 0) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
                result.timedOut = true;
                break;
            }
            ::usleep(2000);
        }
    }

    if (result.timedOut) {
        result.exitCode = -1;
        result.success = false;
        if (!result.error.empty()) {
            result.error += "\n";
        }
        result.error += "Command timed out after " + std::to_string(timeoutMs) + "ms";
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        result.success = (result.exitCode == 0);
        if (result.exitCode == 127 && result.error.find("exec failed") != std::string::npos) {
            result.launchFailed = true;
        }
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
        result.success = false;
    }

    auto endTime = std::chrono::steady_clock::now();
    result.executionTimeMs = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count()
    );

    SLOG_DEBUG().message("Command completed")
        .context("success", result.success)
        .context("exit_code", result.exitCode)
        .context("timed_out", result.timedOut)
        .context("output_bytes", result.output.size())
        .context("execution_time_ms", result.executionTimeMs);

    if (!result.success && !result.error.empty()) {
        SLOG_WARNING().message("Command error")
            .context("command", result.command)
            .context("error", result.error);
    }

    return result;
}

} // namespace system
} // namespace ocal
} // namespace emuflow
