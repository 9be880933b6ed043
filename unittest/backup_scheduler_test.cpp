#include <gtest/gtest.h>
#include "backup_manager.hpp"
#include "backup_scheduler.hpp"
#include "notification.hpp"
#include "test_helpers.hpp"
#include <functional>
#include <stdexcept>
#include <thread>

using namespace testing_support;
using std::chrono::milliseconds;

namespace {

class RecordingNotifier : public NotificationStrategy {
public:
    std::expected<void, std::string> notify(const std::string& event,
                                            const std::string& message,
                                            [[maybe_unused]] const Json::Value& details) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        messages_.push_back(message);
        if (fail) {
            return std::unexpected("HTTP 503");
        }
        return {};
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::atomic<bool> fail{false};

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
    std::vector<std::string> messages_;
};

bool waitFor(const std::function<bool()>& condition, milliseconds timeout = milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds(5));
    }
    return condition();
}

} // namespace

class BackupSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = makeConfig(tmp_.path());
        logger_ = makeLogger(config_);
        dbStrategy_ = std::make_shared<FakeDatabaseStrategy>();
        fileStrategy_ = std::make_shared<FakeFileStrategy>();
        manager_ = std::make_unique<BackupManager>(config_, dbStrategy_, fileStrategy_, logger_);
        notifier_ = std::make_shared<RecordingNotifier>();
    }

    TempDir tmp_;
    BackupConfig config_;
    std::shared_ptr<const Logger> logger_;
    std::shared_ptr<FakeDatabaseStrategy> dbStrategy_;
    std::shared_ptr<FakeFileStrategy> fileStrategy_;
    std::unique_ptr<BackupManager> manager_;
    std::shared_ptr<RecordingNotifier> notifier_;
};

// The first full backup completes before schedule() returns
TEST_F(BackupSchedulerTest, InitialRunIsImmediate) {
    auto scheduler = manager_->schedule(1, notifier_);
    EXPECT_TRUE(scheduler->isRunning());
    EXPECT_EQ(scheduler->runCount(), 1u);
    EXPECT_EQ(manager_->listBackups().size(), 2u);
    EXPECT_EQ(notifier_->events(), (std::vector<std::string>{"system_backup_completed"}));
    EXPECT_EQ(scheduler->getInterval().count(), 3600000);

    scheduler->stop();
    EXPECT_FALSE(scheduler->isRunning());
    EXPECT_NE(readFile(config_.logFile).find("Backup scheduler started {\"intervalHours\":1"), std::string::npos);
}

TEST_F(BackupSchedulerTest, RunsEveryInterval) {
    auto scheduler = manager_->schedule(milliseconds(20));
    EXPECT_TRUE(waitFor([&] { return scheduler->runCount() >= 3; }));
    scheduler->stop();

    std::size_t runs = scheduler->runCount();
    std::this_thread::sleep_for(milliseconds(60));
    EXPECT_EQ(scheduler->runCount(), runs);
    EXPECT_EQ(scheduler->failureCount(), 0u);
}

// A failed run is reported and later ticks still fire
TEST_F(BackupSchedulerTest, FailureDoesNotStopSchedule) {
    dbStrategy_->failingDumps = 1;
    auto scheduler = manager_->schedule(milliseconds(20), notifier_);
    EXPECT_EQ(scheduler->failureCount(), 1u);

    EXPECT_TRUE(waitFor([&] { return scheduler->runCount() >= 2; }));
    scheduler->stop();

    EXPECT_EQ(scheduler->failureCount(), 1u);
    auto events = notifier_->events();
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[0], "system_backup_failed");
    EXPECT_EQ(events[1], "system_backup_completed");
    EXPECT_EQ(notifier_->messages()[0], "System backup failed: pg_dump exited with status 1");
    EXPECT_NE(readFile(config_.errorLogFile).find("Scheduled backup failed"), std::string::npos);
}

TEST_F(BackupSchedulerTest, ThrowingRunIsContained) {
    dbStrategy_->throwingDumps = 1;
    auto scheduler = manager_->schedule(milliseconds(20));
    EXPECT_EQ(scheduler->failureCount(), 1u);
    EXPECT_TRUE(waitFor([&] { return scheduler->runCount() >= 2; }));
    scheduler->stop();
    EXPECT_NE(readFile(config_.errorLogFile).find("dump crashed"), std::string::npos);
}

TEST_F(BackupSchedulerTest, NotificationFailureIsOnlyWarned) {
    notifier_->fail = true;
    auto scheduler = manager_->schedule(milliseconds(20), notifier_);
    EXPECT_TRUE(waitFor([&] { return scheduler->runCount() >= 2; }));
    scheduler->stop();

    EXPECT_EQ(scheduler->failureCount(), 0u);
    EXPECT_NE(readFile(config_.logFile).find("WARN: Backup notification failed"), std::string::npos);
}

TEST_F(BackupSchedulerTest, StartAndStopAreIdempotent) {
    BackupScheduler scheduler(*manager_, std::chrono::hours(1), logger_);
    scheduler.start();
    scheduler.start();
    EXPECT_EQ(scheduler.runCount(), 1u);

    scheduler.stop();
    scheduler.stop();
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(BackupSchedulerTest, RejectsInvalidArguments) {
    EXPECT_THROW(BackupScheduler(*manager_, milliseconds(0), logger_), std::invalid_argument);
    EXPECT_THROW(BackupScheduler(*manager_, milliseconds(10), nullptr), std::invalid_argument);
    EXPECT_THROW(manager_->schedule(0), std::invalid_argument);
}

// An interval whose deadline would overflow steady_clock is refused before any run
TEST_F(BackupSchedulerTest, RejectsOversizedInterval) {
    EXPECT_THROW(manager_->schedule(3000000), std::invalid_argument);
    EXPECT_THROW(BackupScheduler(*manager_, std::chrono::hours(3000000), logger_), std::invalid_argument);
    EXPECT_EQ(dbStrategy_->dumpCalls.load(), 0);

    BackupScheduler longest(*manager_, std::chrono::hours(BackupConfig::maxScheduleIntervalHours), logger_);
    longest.start();
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(longest.runCount(), 1u);
    longest.stop();
}
