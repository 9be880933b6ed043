/**
 * @file logger.hpp
 * @brief Structured logging for the ResponderVault backup manager.
 *
 * Every backup, restore, listing, and retention event goes through Logger. A line carries
 * a local timestamp, the level, the message, and an optional JSON object of context
 * fields (artifact paths, timestamps, error text).
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <mutex>
#include <optional>
#include <json/json.h>

class BackupConfig;

/**
 * @brief Log levels, most severe first.
 */
enum class LogLevel {
    Error,
    Warn,
    Info,
    Http,
    Debug
};

/**
 * @brief Thread-safe logger writing to a combined log, an error log, and optionally the console.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger.
     *
     * Parent directories of both log files are created on first write.
     *
     * @param logFile File receiving every line at or above the level.
     * @param errorLogFile File additionally receiving error lines.
     * @param level Most verbose level written.
     * @param console If true, lines are echoed (errors and warnings to stderr).
     */
    Logger(std::string logFile, std::string errorLogFile, LogLevel level = LogLevel::Info, bool console = true);

    /**
     * @brief Constructs a logger from the log section of a configuration.
     *
     * @throws std::runtime_error If the configured level is unknown.
     */
    explicit Logger(const BackupConfig& config);

    void error(const std::string& message, const Json::Value& fields = Json::Value()) const;
    void warn(const std::string& message, const Json::Value& fields = Json::Value()) const;
    void info(const std::string& message, const Json::Value& fields = Json::Value()) const;
    void debug(const std::string& message, const Json::Value& fields = Json::Value()) const;

    /**
     * @brief Writes one line if @p level is enabled.
     *
     * @param level Severity of the line.
     * @param message Human-readable event description.
     * @param fields JSON object of context fields; null or empty objects are omitted.
     */
    void log(LogLevel level, const std::string& message, const Json::Value& fields = Json::Value()) const;

    bool enabled(LogLevel level) const { return level <= level_; }

    /**
     * @brief Parses "error", "warn", "info", "http", or "debug".
     */
    static std::optional<LogLevel> parseLevel(const std::string& name);
    static const char* levelName(LogLevel level);

private:
    void append(const std::string& path, const std::string& line) const;

    std::string logFile_;
    std::string errorLogFile_;
    LogLevel level_;
    bool console_;
    mutable std::mutex mutex_;
};

#endif // LOGGER_HPP
