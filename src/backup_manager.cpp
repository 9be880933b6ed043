#include "backup_manager.hpp"
#include "backup_scheduler.hpp"
#include "command_runner.hpp"
#include "database_backup.hpp"
#include "file_backup.hpp"
#include "logger.hpp"
#include <future>
#include <stdexcept>

namespace {

Json::Value artifactFields(const std::string& backupFile) {
    Json::Value fields;
    fields["backupFile"] = backupFile;
    return fields;
}

Json::Value failureFields(const BackupError& error, const std::string& backupFile) {
    Json::Value fields = artifactFields(backupFile);
    fields["error"] = error.message;
    fields["errorType"] = toString(error.code);
    return fields;
}

// Waits for a producer; an exception it threw becomes a ProcessExecution error.
BackupResult<std::string> collect(std::future<BackupResult<std::string>>& task) {
    try {
        return task.get();
    } catch (const std::exception& e) {
        return backupError(BackupErrc::ProcessExecution, e.what());
    }
}

} // namespace

BackupManager::BackupManager(BackupConfig config,
                             std::shared_ptr<DatabaseBackupStrategy> dbStrategy,
                             std::shared_ptr<FileBackupStrategy> fileStrategy,
                             std::shared_ptr<const Logger> logger)
    : config(std::move(config)),
      store(this->config.backupDir),
      retention(store, this->config.maxBackups, logger),
      dbStrategy(std::move(dbStrategy)),
      fileStrategy(std::move(fileStrategy)),
      logger(std::move(logger)) {
    if (!this->dbStrategy || !this->fileStrategy) {
        throw std::invalid_argument("BackupManager requires database and file strategies");
    }
    store.ensure();
}

std::unique_ptr<BackupManager> BackupManager::create(const BackupConfig& config, std::shared_ptr<const Logger> logger) {
    auto runner = std::make_shared<PosixCommandRunner>();
    auto dbStrategy = std::make_shared<PostgreSQLBackupStrategy>(runner, config.dumpProgram, config.restoreProgram);

    std::shared_ptr<FileBackupStrategy> fileStrategy;
    if (config.fileArchiver == "tar") {
        fileStrategy = std::make_shared<TarCommandFileBackupStrategy>(runner, config.tarProgram);
    } else {
        fileStrategy = std::make_shared<TarGzFileBackupStrategy>();
    }
    return std::make_unique<BackupManager>(config, dbStrategy, fileStrategy, std::move(logger));
}

BackupResult<std::string> BackupManager::createDatabaseBackup() {
    std::string timestamp = BackupStore::timestamp(std::chrono::system_clock::now());
    std::string backupFile = store.artifactPath(ArtifactKind::DatabaseSnapshot, timestamp).string();

    if (!config.databaseUrl) {
        BackupError error{BackupErrc::Configuration, "DATABASE_URL not configured"};
        logger->error("Database backup failed", failureFields(error, backupFile));
        return std::unexpected(error);
    }

    auto result = dbStrategy->dump(*config.databaseUrl, backupFile);
    if (!result) {
        BackupError error{BackupErrc::ProcessExecution, result.error()};
        Json::Value fields = failureFields(error, backupFile);
        fields["timestamp"] = timestamp;
        logger->error("Database backup failed", fields);
        return std::unexpected(error);
    }

    Json::Value fields = artifactFields(backupFile);
    fields["timestamp"] = timestamp;
    logger->info("Database backup created successfully", fields);

    cleanupOldBackups();
    return backupFile;
}

BackupResult<std::string> BackupManager::createFileBackup() {
    std::string timestamp = BackupStore::timestamp(std::chrono::system_clock::now());
    std::string backupFile = store.artifactPath(ArtifactKind::FileArchive, timestamp).string();

    auto result = fileStrategy->archive(config.uploadsDir, backupFile);
    if (!result) {
        BackupError error{BackupErrc::ProcessExecution, result.error()};
        Json::Value fields = failureFields(error, backupFile);
        fields["timestamp"] = timestamp;
        logger->error("File backup failed", fields);
        return std::unexpected(error);
    }

    Json::Value fields = artifactFields(backupFile);
    fields["timestamp"] = timestamp;
    logger->info("File backup created successfully", fields);
    // Retention runs only after database snapshots.
    return backupFile;
}

BackupResult<FullBackupResult> BackupManager::createFullBackup() {
    BackupResult<std::string> databaseResult = backupError(BackupErrc::ProcessExecution, "Database backup did not run");
    BackupResult<std::string> filesResult = backupError(BackupErrc::ProcessExecution, "File backup did not run");
    try {
        auto databaseTask = std::async(std::launch::async, [this] { return createDatabaseBackup(); });
        auto filesTask = std::async(std::launch::async, [this] { return createFileBackup(); });
        databaseResult = collect(databaseTask);
        filesResult = collect(filesTask);
    } catch (const std::exception& e) {
        // std::async itself failed to start a producer.
        databaseResult = backupError(BackupErrc::ProcessExecution, e.what());
    }

    if (!databaseResult || !filesResult) {
        BackupError error = !databaseResult ? databaseResult.error() : filesResult.error();
        Json::Value fields;
        fields["error"] = error.message;
        fields["errorType"] = toString(error.code);
        logger->error("Full backup failed", fields);
        return std::unexpected(error);
    }

    Json::Value fields;
    fields["databaseBackup"] = *databaseResult;
    fields["filesBackup"] = *filesResult;
    logger->info("Full backup completed successfully", fields);
    return FullBackupResult{*databaseResult, *filesResult};
}

BackupResult<void> BackupManager::restoreDatabase(const std::string& backupFile) {
    if (!config.databaseUrl) {
        BackupError error{BackupErrc::Configuration, "DATABASE_URL not configured"};
        logger->error("Database restore failed", failureFields(error, backupFile));
        return std::unexpected(error);
    }

    auto result = dbStrategy->restore(*config.databaseUrl, backupFile);
    if (!result) {
        BackupError error{BackupErrc::ProcessExecution, result.error()};
        logger->error("Database restore failed", failureFields(error, backupFile));
        return std::unexpected(error);
    }

    logger->info("Database restored successfully", artifactFields(backupFile));
    return {};
}

BackupResult<void> BackupManager::restoreFiles(const std::string& backupFile) {
    auto result = fileStrategy->extract(backupFile, config.restoreDir);
    if (!result) {
        BackupError error{BackupErrc::ProcessExecution, result.error()};
        logger->error("File restore failed", failureFields(error, backupFile));
        return std::unexpected(error);
    }

    logger->info("Files restored successfully", artifactFields(backupFile));
    return {};
}

std::vector<std::string> BackupManager::listBackups() const {
    auto names = store.enumerate();
    if (!names) {
        Json::Value fields;
        fields["error"] = names.error().message;
        logger->error("Failed to list backups", fields);
        return {};
    }
    return std::move(*names);
}

std::size_t BackupManager::cleanupOldBackups() {
    return retention.enforce(listBackups());
}

std::unique_ptr<BackupScheduler> BackupManager::schedule(std::chrono::milliseconds interval,
                                                         std::shared_ptr<NotificationStrategy> notifier) {
    auto scheduler = std::make_unique<BackupScheduler>(*this, interval, logger, std::move(notifier));
    scheduler->start();
    return scheduler;
}

std::unique_ptr<BackupScheduler> BackupManager::schedule(int intervalHours,
                                                         std::shared_ptr<NotificationStrategy> notifier) {
    if (intervalHours <= 0 || intervalHours > BackupConfig::maxScheduleIntervalHours) {
        throw std::invalid_argument("Backup interval must be between 1 and " +
                                    std::to_string(BackupConfig::maxScheduleIntervalHours) + " hours");
    }
    return schedule(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::hours(intervalHours)),
                    std::move(notifier));
}
