#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>

namespace pem {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    OFF
};

/**
 * @brief Parse a log level name ("trace", "debug", ... "off")
 *
 * @param name Level name, case-insensitive
 * @param fallback Level returned when the name is not recognized
 * @return LogLevel The parsed level
 */
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Lowercase name of a log level
 */
std::string logLevelName(LogLevel level);

/**
 * @brief Process-wide logger
 *
 * Writes timestamped lines to the console and, optionally, to a file.
 * Timestamps use the process timezone (see utils::applyTimezone).
 */
class Logger {
public:
    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    /**
     * @brief Append log output to a file
     *
     * @param filename Path to the log file, parent directories are created
     * @return true if file was opened successfully, false otherwise
     */
    bool setOutputFile(const std::string& filename);

    void closeLogFile();

    /**
     * @brief Enable or disable console logging
     *
     * @param enable True to enable console logging, false to disable
     */
    void enableConsoleLogging(bool enable);

    /**
     * @brief Log a message at the specified level
     *
     * @param level The log level for this message
     * @param source The component emitting the message (e.g. "EventRegistry")
     * @param message The message to log
     */
    void log(LogLevel level, const std::string& source, const std::string& message);

    void trace(const std::string& source, const std::string& message);
    void debug(const std::string& source, const std::string& message);
    void info(const std::string& source, const std::string& message);
    void warn(const std::string& source, const std::string& message);
    void error(const std::string& source, const std::string& message);
    void fatal(const std::string& source, const std::string& message);

    ~Logger();

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static std::string levelTag(LogLevel level);
    static std::string currentTimestamp();

    std::atomic<LogLevel> currentLevel_;
    std::atomic<bool> consoleLogging_;
    std::ofstream logFile_;
    std::mutex logMutex_;
};

#define LOG_TRACE(source, message) pem::Logger::getInstance().trace(source, message)
#define LOG_DEBUG(source, message) pem::Logger::getInstance().debug(source, message)
#define LOG_INFO(source, message) pem::Logger::getInstance().info(source, message)
#define LOG_WARN(source, message) pem::Logger::getInstance().warn(source, message)
#define LOG_ERROR(source, message) pem::Logger::getInstance().error(source, message)
#define LOG_FATAL(source, message) pem::Logger::getInstance().fatal(source, message)

} // namespace pem
