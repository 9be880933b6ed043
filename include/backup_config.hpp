/**
 * @file backup_config.hpp
 * @brief Configuration management for the ResponderVault backup manager.
 *
 * Defines the configuration class holding the Backup Store location, retention cap,
 * database connection, archiving, schedule, logging, and notification settings.
 * Values are loaded from a JSON file; every key has a default so a missing file
 * yields a usable configuration.
 *
 * @note The DATABASE_URL and LOG_LEVEL environment variables override the
 * corresponding file values.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <string>
#include <optional>
#include <cstddef>
#include <json/json.h>

/**
 * @brief Configuration class for the backup manager.
 *
 * Treated as an immutable value once constructed: the manager, scheduler, and
 * strategies each receive a copy or a const reference.
 */
class BackupConfig {
public:
    /// Longest accepted schedule period (100 years); keeps steady_clock deadlines from overflowing.
    static constexpr int maxScheduleIntervalHours = 876000;

    /**
     * @brief Constructs a configuration with all defaults applied.
     *
     * Environment overrides (DATABASE_URL, LOG_LEVEL) are still honoured.
     */
    BackupConfig();

    /**
     * @brief Constructs a configuration from a JSON file.
     *
     * A non-existent file is treated as an empty object, so defaults apply.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file cannot be read or parsed, or a value is invalid.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration from an already parsed JSON object.
     *
     * @param configJson Configuration object.
     * @throws std::runtime_error If a value is invalid.
     */
    explicit BackupConfig(const Json::Value& configJson);

    std::string backupDir = "backups";              ///< Backup Store location.
    std::size_t maxBackups = 7;                     ///< Retention cap across all artifact kinds.
    std::string uploadsDir = "uploads";             ///< Uploaded-content directory to archive.
    std::string restoreDir = ".";                   ///< Extraction destination for file restores.
    std::optional<std::string> databaseUrl;         ///< Data-store connection string.
    std::string dumpProgram = "pg_dump";            ///< Dump capability.
    std::string restoreProgram = "psql";            ///< Restore capability.
    std::string fileArchiver = "libarchive";        ///< "libarchive" (in-process) or "tar" (external).
    std::string tarProgram = "tar";                 ///< External tar used when fileArchiver is "tar".
    int scheduleIntervalHours = 24;                 ///< Scheduler period.
    std::string logFile = "logs/combined.log";      ///< Log file receiving every line.
    std::string errorLogFile = "logs/error.log";    ///< Log file receiving error lines.
    std::string logLevel = "info";                  ///< Most verbose level written.
    bool logToConsole = true;                       ///< Echo log lines to stdout/stderr.
    std::string webhookUrl;                         ///< Notification webhook; empty disables notifications.
    long notificationTimeoutSeconds = 10;           ///< Webhook request timeout.

private:
    void load(const Json::Value& configJson);
    void applyEnvironment();
    void validate() const;
};

#endif // BACKUP_CONFIG_HPP
