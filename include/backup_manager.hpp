/**
 * @file backup_manager.hpp
 * @brief Backup & restore orchestration for the incident-management data store and uploads.
 *
 * BackupManager produces database snapshots and upload archives in the Backup Store,
 * enforces the retention cap, restores either kind of artifact, and lists the catalog.
 * It is constructed explicitly with an immutable configuration and injected strategies;
 * there is no shared global instance.
 *
 * @note Concurrent calls from several call sites are not coordinated: two overlapping
 * retention passes may miscount, and two snapshots within the same millisecond collide.
 */

#ifndef BACKUP_MANAGER_HPP
#define BACKUP_MANAGER_HPP

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "backup_store.hpp"
#include "retention_policy.hpp"

class DatabaseBackupStrategy;
class FileBackupStrategy;
class NotificationStrategy;
class BackupScheduler;
class Logger;

/**
 * @brief Paths produced by one full backup.
 */
struct FullBackupResult {
    std::string databasePath; ///< Database snapshot artifact.
    std::string filesPath;    ///< Upload archive artifact.
};

/**
 * @brief Main backup orchestration class.
 */
class BackupManager {
public:
    /**
     * @brief Constructs a manager and ensures the Backup Store exists.
     *
     * @param config Configuration; copied and never modified afterwards.
     * @param dbStrategy Dump/restore capability for the data store.
     * @param fileStrategy Archive/extract capability for uploaded content.
     * @param logger Logging collaborator.
     * @throws std::invalid_argument If a collaborator is null.
     * @throws std::filesystem::filesystem_error If the Backup Store cannot be created.
     */
    BackupManager(BackupConfig config,
                  std::shared_ptr<DatabaseBackupStrategy> dbStrategy,
                  std::shared_ptr<FileBackupStrategy> fileStrategy,
                  std::shared_ptr<const Logger> logger);

    /**
     * @brief Builds a manager wired to the production strategies named by @p config
     * (PostgreSQL client tools, libarchive or tar).
     */
    static std::unique_ptr<BackupManager> create(const BackupConfig& config, std::shared_ptr<const Logger> logger);

    /**
     * @brief Dumps the database to `database-<timestamp>.sql`, then runs a retention pass.
     *
     * @return Artifact path; ConfigurationError if no connection string is configured
     *         (nothing is spawned or created); ProcessExecutionError if the dump fails
     *         (the partial file is left on disk).
     */
    BackupResult<std::string> createDatabaseBackup();

    /**
     * @brief Archives the uploads directory to `files-<timestamp>.tar.gz`.
     *
     * Does not run a retention pass.
     *
     * @return Artifact path or ProcessExecutionError.
     */
    BackupResult<std::string> createFileBackup();

    /**
     * @brief Runs the database and file producers concurrently and waits for both.
     *
     * Succeeds only if both succeed. On failure the error of the failing producer is
     * returned (the database producer's when both fail); an artifact the other producer
     * completed stays on disk.
     */
    BackupResult<FullBackupResult> createFullBackup();

    /**
     * @brief Pipes a database snapshot into the restore capability.
     *
     * The path is not checked beforehand; a missing file is reported as ProcessExecutionError.
     */
    BackupResult<void> restoreDatabase(const std::string& backupFile);

    /**
     * @brief Extracts a file archive into the configured restore directory.
     *
     * Existing files are overwritten; nothing is cleared first.
     */
    BackupResult<void> restoreFiles(const std::string& backupFile);

    /**
     * @brief Lists recognised artifact names in storage enumeration order.
     *
     * Never fails: enumeration errors are logged and yield an empty list.
     */
    std::vector<std::string> listBackups() const;

    /**
     * @brief Runs one full backup now, then every @p interval on a background thread.
     *
     * @param interval Period between scheduled runs.
     * @param notifier Optional sink for run outcomes.
     * @return Handle that stops the schedule when stopped or destroyed. The manager must outlive it.
     */
    std::unique_ptr<BackupScheduler> schedule(std::chrono::milliseconds interval,
                                              std::shared_ptr<NotificationStrategy> notifier = nullptr);

    /**
     * @brief Convenience overload taking the period in hours.
     */
    std::unique_ptr<BackupScheduler> schedule(int intervalHours,
                                              std::shared_ptr<NotificationStrategy> notifier = nullptr);

private:
    std::size_t cleanupOldBackups();

    const BackupConfig config;                             ///< Immutable configuration.
    BackupStore store;                                     ///< Backup Store location.
    RetentionPolicy retention;                             ///< Count-based retention.
    std::shared_ptr<DatabaseBackupStrategy> dbStrategy;    ///< Database dump/restore.
    std::shared_ptr<FileBackupStrategy> fileStrategy;      ///< Upload archive/extract.
    std::shared_ptr<const Logger> logger;                  ///< Logging collaborator.
};

#endif // BACKUP_MANAGER_HPP
