#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pem {

/**
 * @brief Process-wide settings
 *
 * Loaded once at startup from UPEM_* environment variables (plus TZ) and
 * the command line. Every field has a default except the exporter
 * credentials, which are required.
 */
struct Settings {
    std::string timezone = "UTC";
    double defaultPastMinutes = 5.0;
    double defaultFutureMinutes = 5.0;

    std::string protectAddress;
    std::string protectUsername;
    std::string protectPassword;

    int logIntervalSeconds = 10;
    int maxRetries = 3;
    int retryDelaySeconds = 5;
    int exportTimeoutSeconds = 300;
    int exportWorkers = 4;

    bool keepSplitFiles = true;
    double combineToleranceSeconds = 1.0;
    std::string combineMethod = "ffmpeg";     ///< ffmpeg, binary or none

    std::string downloadsDir = "./downloads";
    std::string exporterCommand = "protect-archiver";
    std::string ffmpegCommand = "ffmpeg";

    // Command line
    int port = 8888;
    int httpThreads = 4;
    std::string staticDir;

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Read settings from the environment
     *
     * @param lookup Variable lookup, defaults to getenv
     * @return Settings Defaults overridden by every variable that is set
     * @throws ConfigError if a variable holds a malformed or out-of-range value
     */
    static Settings fromEnvironment(const EnvLookup& lookup = nullptr);

    /**
     * @brief Names of the required credential variables that are unset
     */
    std::vector<std::string> missingCredentials() const;
};

/**
 * @brief Global configuration for the application
 *
 * Holds the Settings loaded at startup so that main() and the API share a
 * single copy.
 */
class GlobalConfig {
public:
    static GlobalConfig& getInstance();

    /**
     * @brief Load settings from the environment and apply command line values
     *
     * Logs every effective value (password masked) and every missing
     * credential.
     *
     * @param port HTTP port from the command line
     * @param httpThreads HTTP worker threads from the command line
     * @param staticDir Directory with web UI assets, empty to disable
     * @return true if the settings are complete, false otherwise
     */
    bool initialize(int port, int httpThreads, const std::string& staticDir);

    Settings getSettings() const;
    void setSettings(const Settings& settings);

private:
    GlobalConfig() = default;

    GlobalConfig(const GlobalConfig&) = delete;
    GlobalConfig& operator=(const GlobalConfig&) = delete;
    GlobalConfig(GlobalConfig&&) = delete;
    GlobalConfig& operator=(GlobalConfig&&) = delete;

    Settings settings_;
    mutable std::mutex mutex_;
};

} // namespace pem
