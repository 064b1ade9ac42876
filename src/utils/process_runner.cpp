#include "utils/process_runner.h"
#include "logger.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace pem {
namespace utils {

namespace {

using Clock = std::chrono::steady_clock;

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Drains whatever is readable; closes the descriptor on EOF or error.
void drain(int& fd, std::string& sink) {
    char buffer[4096];
    while (fd >= 0) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            size_t room = CommandRunner::kMaxCapturedBytes > sink.size()
                              ? CommandRunner::kMaxCapturedBytes - sink.size()
                              : 0;
            sink.append(buffer, std::min(room, static_cast<size_t>(n)));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        closeFd(fd);
    }
}

// Returns true once the child has been reaped.
bool tryReap(pid_t pid, int& status) {
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return true;
        }
        if (r < 0 && errno == EINTR) {
            continue;
        }
        if (r < 0) {
            // ECHILD: already reaped elsewhere, nothing left to wait for
            status = 0;
            return true;
        }
        return false;
    }
}

int terminateGroup(pid_t pid, std::chrono::milliseconds grace) {
    int status = 0;
    kill(-pid, SIGTERM);

    auto graceDeadline = Clock::now() + grace;
    while (Clock::now() < graceDeadline) {
        if (tryReap(pid, status)) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    LOG_WARN("CommandRunner", "Process " + std::to_string(pid) + " ignored SIGTERM, sending SIGKILL");
    kill(-pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return status;
}

} // namespace

CommandResult CommandRunner::run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout,
                                 std::chrono::milliseconds killGrace) {
    CommandResult result;
    auto started = Clock::now();
    auto deadline = started + timeout;

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe2(outPipe, O_CLOEXEC) != 0 || pipe2(errPipe, O_CLOEXEC) != 0) {
        result.startFailed = true;
        result.stderrText = std::string("Failed to create pipes: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.startFailed = true;
        result.stderrText = std::string("fork failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        execvp(argv[0], argv.data());

        const char* prefix = "failed to execute ";
        const char* reason = std::strerror(errno);
        ssize_t ignored = write(STDERR_FILENO, prefix, std::strlen(prefix));
        ignored = write(STDERR_FILENO, argv[0], std::strlen(argv[0]));
        ignored = write(STDERR_FILENO, ": ", 2);
        ignored = write(STDERR_FILENO, reason, std::strlen(reason));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    fcntl(outPipe[0], F_SETFL, fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(errPipe[0], F_SETFL, fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);

    int outFd = outPipe[0];
    int errFd = errPipe[0];
    int status = 0;
    bool reaped = false;

    while (!reaped) {
        auto now = Clock::now();
        if (now >= deadline) {
            result.timedOut = true;
            status = terminateGroup(pid, killGrace);
            reaped = true;
            break;
        }

        if (outFd < 0 && errFd < 0) {
            // Output closed; the child may still be running with detached descriptors
            if (tryReap(pid, status)) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            continue;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (outFd >= 0) {
            fds[count++] = {outFd, POLLIN, 0};
        }
        if (errFd >= 0) {
            fds[count++] = {errFd, POLLIN, 0};
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int waitMs = static_cast<int>(std::min<long long>(remaining.count(), 100));
        int ready = poll(fds, count, waitMs);
        if (ready < 0 && errno != EINTR) {
            LOG_ERROR("CommandRunner", std::string("poll failed: ") + std::strerror(errno));
            status = terminateGroup(pid, killGrace);
            reaped = true;
            break;
        }

        drain(outFd, result.stdoutText);
        drain(errFd, result.stderrText);
    }

    // Pick up anything written between the last poll and exit
    drain(outFd, result.stdoutText);
    drain(errFd, result.stderrText);
    closeFd(outFd);
    closeFd(errFd);

    result.exitCode = decodeStatus(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    if (result.timedOut) {
        if (!result.stderrText.empty() && result.stderrText.back() != '\n') {
            result.stderrText += '\n';
        }
        result.stderrText += "Command timed out after " + std::to_string(timeout.count()) + "ms";
    }
    return result;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
        start = end + 1;
    }
    return lines;
}

} // namespace utils
} // namespace pem
