#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace pem {
namespace utils {

/**
 * @brief Outcome of running an external command
 */
struct CommandResult {
    int exitCode = -1;            ///< Exit status, 128 + signal number if killed by a signal
    std::string stdoutText;       ///< Captured standard output
    std::string stderrText;       ///< Captured standard error
    bool timedOut = false;        ///< The command exceeded its timeout and was terminated
    bool startFailed = false;     ///< fork() or pipe setup failed, nothing ran
    std::chrono::milliseconds duration{0};

    bool success() const { return !timedOut && !startFailed && exitCode == 0; }
};

/**
 * @brief Runs external programs with captured output and a hard timeout
 *
 * The child is started in its own process group. On timeout the whole group
 * receives SIGTERM, then SIGKILL once the grace period has elapsed.
 */
class CommandRunner {
public:
    /// Upper bound on captured bytes per stream, the rest is discarded
    static constexpr size_t kMaxCapturedBytes = 1024 * 1024;

    /**
     * @brief Run a program and wait for it to finish
     *
     * @param program Executable name or path (looked up in PATH)
     * @param args Arguments, not including the program name
     * @param timeout Wall-clock limit for the whole run
     * @param killGrace Time between SIGTERM and SIGKILL on timeout
     * @return CommandResult Exit status and captured output
     */
    static CommandResult run(const std::string& program,
                             const std::vector<std::string>& args,
                             std::chrono::milliseconds timeout,
                             std::chrono::milliseconds killGrace = std::chrono::seconds(2));
};

/**
 * @brief Split captured output into non-empty lines
 */
std::vector<std::string> splitLines(const std::string& text);

} // namespace utils
} // namespace pem
