#include <gtest/gtest.h>
#include "logger.hpp"
#include "test_helpers.hpp"

using namespace testing_support;

class LoggerTest : public ::testing::Test {
protected:
    std::string combined() const { return readFile(tmp_ / "logs/combined.log"); }
    std::string errors() const { return readFile(tmp_ / "logs/error.log"); }

    Logger makeLogger(LogLevel level) const {
        return Logger((tmp_ / "logs/combined.log").string(), (tmp_ / "logs/error.log").string(), level, false);
    }

    TempDir tmp_;
};

TEST_F(LoggerTest, ErrorsGoToBothFiles) {
    Logger logger = makeLogger(LogLevel::Info);
    Json::Value fields;
    fields["backupFile"] = "backups/database-T.sql";
    logger.error("Database backup failed", fields);
    logger.info("Old backup deleted");

    std::string errorLog = errors();
    EXPECT_NE(errorLog.find("ERROR: Database backup failed"), std::string::npos);
    EXPECT_NE(errorLog.find("\"backupFile\":\"backups/database-T.sql\""), std::string::npos);
    EXPECT_EQ(errorLog.find("Old backup deleted"), std::string::npos);

    std::string all = combined();
    EXPECT_NE(all.find("ERROR: Database backup failed"), std::string::npos);
    EXPECT_NE(all.find("INFO: Old backup deleted"), std::string::npos);
}

TEST_F(LoggerTest, LineFormat) {
    Logger logger = makeLogger(LogLevel::Info);
    logger.info("Backup scheduler started");
    std::string line = combined();
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.front(), '[');
    EXPECT_EQ(line.substr(20, 2), "] ");
    EXPECT_EQ(line.substr(22), "INFO: Backup scheduler started\n");
}

TEST_F(LoggerTest, LevelFiltering) {
    Logger logger = makeLogger(LogLevel::Warn);
    logger.debug("debug line");
    logger.info("info line");
    logger.warn("warn line");
    logger.error("error line");

    std::string all = combined();
    EXPECT_EQ(all.find("debug line"), std::string::npos);
    EXPECT_EQ(all.find("info line"), std::string::npos);
    EXPECT_NE(all.find("WARN: warn line"), std::string::npos);
    EXPECT_NE(all.find("ERROR: error line"), std::string::npos);
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::Error);
    EXPECT_EQ(Logger::parseLevel("http"), LogLevel::Http);
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::Debug);
    EXPECT_FALSE(Logger::parseLevel("INFO"));
    EXPECT_STREQ(Logger::levelName(LogLevel::Warn), "WARN");
}

TEST_F(LoggerTest, ConfigWithUnknownLevelThrows) {
    BackupConfig config = makeConfig(tmp_.path());
    config.logLevel = "loud";
    EXPECT_THROW(Logger{config}, std::runtime_error);
}
