/**
 * @file backup_scheduler.hpp
 * @brief Periodic full backups with a stoppable handle.
 */

#ifndef BACKUP_SCHEDULER_HPP
#define BACKUP_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <json/json.h>

class BackupManager;
class Logger;
class NotificationStrategy;

/**
 * @brief Runs a full backup immediately and then once per interval.
 *
 * Runs never overlap: a single timer thread performs them in sequence, and the next
 * deadline is the previous deadline plus the interval (a run that overshoots its slot is
 * followed by the next one straight away, without catching up on missed slots).
 * Failures of a run are logged and reported to the notifier; they never stop the schedule.
 */
class BackupScheduler {
public:
    /**
     * @brief Constructs a stopped scheduler.
     *
     * @param manager Manager performing the backups; must outlive the scheduler.
     * @param interval Period between runs.
     * @param logger Logging collaborator.
     * @param notifier Optional sink for run outcomes.
     * @throws std::invalid_argument If the interval is not positive or the logger is null.
     */
    BackupScheduler(BackupManager& manager,
                    std::chrono::milliseconds interval,
                    std::shared_ptr<const Logger> logger,
                    std::shared_ptr<NotificationStrategy> notifier = nullptr);

    /**
     * @brief Stops the schedule and joins the timer thread.
     */
    ~BackupScheduler();

    BackupScheduler(const BackupScheduler&) = delete;
    BackupScheduler& operator=(const BackupScheduler&) = delete;

    /**
     * @brief Performs the initial full backup synchronously, then arms the timer thread.
     *
     * Calling start() on a running scheduler has no effect.
     */
    void start();

    /**
     * @brief Wakes and joins the timer thread. A run in progress completes first.
     */
    void stop();

    bool isRunning() const { return running.load(); }

    /**
     * @brief Number of runs attempted so far, including the initial one.
     */
    std::size_t runCount() const { return runs.load(); }

    /**
     * @brief Number of runs that ended in an error.
     */
    std::size_t failureCount() const { return failures.load(); }

    std::chrono::milliseconds getInterval() const { return interval; }

private:
    void runOnce();
    void loop();
    void report(const char* event, const std::string& message, const Json::Value& details);

    BackupManager& manager;
    std::chrono::milliseconds interval;
    std::shared_ptr<const Logger> logger;
    std::shared_ptr<NotificationStrategy> notifier;

    std::thread worker;
    std::mutex mutex;
    std::condition_variable wakeup;
    bool stopRequested = false;
    std::atomic<bool> running{false};
    std::atomic<std::size_t> runs{0};
    std::atomic<std::size_t> failures{0};
};

#endif // BACKUP_SCHEDULER_HPP
