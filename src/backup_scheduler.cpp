#include "backup_scheduler.hpp"
#include "backup_config.hpp"
#include "backup_manager.hpp"
#include "logger.hpp"
#include "notification.hpp"
#include <stdexcept>

BackupScheduler::BackupScheduler(BackupManager& manager,
                                 std::chrono::milliseconds interval,
                                 std::shared_ptr<const Logger> logger,
                                 std::shared_ptr<NotificationStrategy> notifier)
    : manager(manager), interval(interval), logger(std::move(logger)), notifier(std::move(notifier)) {
    if (this->interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Backup interval must be positive");
    }
    if (this->interval > std::chrono::hours(BackupConfig::maxScheduleIntervalHours)) {
        throw std::invalid_argument("Backup interval exceeds " +
                                    std::to_string(BackupConfig::maxScheduleIntervalHours) + " hours");
    }
    if (!this->logger) {
        throw std::invalid_argument("BackupScheduler requires a logger");
    }
}

BackupScheduler::~BackupScheduler() {
    stop();
}

void BackupScheduler::start() {
    if (running.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopRequested = false;
    }

    runOnce();
    worker = std::thread(&BackupScheduler::loop, this);

    Json::Value fields;
    fields["intervalHours"] = std::chrono::duration<double, std::ratio<3600>>(interval).count();
    logger->info("Backup scheduler started", fields);
}

void BackupScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopRequested = true;
    }
    wakeup.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
    if (running.exchange(false)) {
        logger->info("Backup scheduler stopped");
    }
}

void BackupScheduler::loop() {
    auto next = std::chrono::steady_clock::now() + interval;
    std::unique_lock<std::mutex> lock(mutex);
    while (!stopRequested) {
        if (wakeup.wait_until(lock, next, [this] { return stopRequested; })) {
            break;
        }
        lock.unlock();
        runOnce();
        lock.lock();

        next += interval;
        auto now = std::chrono::steady_clock::now();
        if (next < now) {
            next = now;
        }
    }
}

void BackupScheduler::runOnce() {
    ++runs;
    std::string errorMessage;
    try {
        auto result = manager.createFullBackup();
        if (result) {
            Json::Value fields;
            fields["databaseBackup"] = result->databasePath;
            fields["filesBackup"] = result->filesPath;
            logger->info("Scheduled backup completed", fields);
            report("system_backup_completed", "System backup completed successfully", fields);
            return;
        }
        errorMessage = result.error().message;
    } catch (const std::exception& e) {
        errorMessage = e.what();
    }

    ++failures;
    Json::Value fields;
    fields["error"] = errorMessage;
    logger->error("Scheduled backup failed", fields);
    report("system_backup_failed", "System backup failed: " + errorMessage, fields);
}

void BackupScheduler::report(const char* event, const std::string& message, const Json::Value& details) {
    if (!notifier) {
        return;
    }
    std::string error;
    try {
        auto result = notifier->notify(event, message, details);
        if (result) {
            return;
        }
        error = result.error();
    } catch (const std::exception& e) {
        error = e.what();
    }

    Json::Value fields;
    fields["event"] = event;
    fields["error"] = error;
    logger->warn("Backup notification failed", fields);
}
