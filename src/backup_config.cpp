#include "backup_config.hpp"
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>

namespace fs = std::filesystem;

BackupConfig::BackupConfig() {
    applyEnvironment();
    validate();
}

BackupConfig::BackupConfig(const std::string& configFile) {
    Json::Value configJson(Json::objectValue);
    if (fs::exists(configFile)) {
        std::ifstream file(configFile);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open config file: " + configFile);
        }
        Json::Reader reader;
        if (!reader.parse(file, configJson)) {
            throw std::runtime_error("Failed to parse config file: " + configFile + " (" +
                                     reader.getFormattedErrorMessages() + ")");
        }
        if (!configJson.isObject()) {
            throw std::runtime_error("Config file must contain a JSON object: " + configFile);
        }
    }
    load(configJson);
    applyEnvironment();
    validate();
}

BackupConfig::BackupConfig(const Json::Value& configJson) {
    if (!configJson.isNull() && !configJson.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }
    load(configJson);
    applyEnvironment();
    validate();
}

void BackupConfig::load(const Json::Value& configJson) {
    if (configJson.isNull()) {
        return;
    }

    backupDir = configJson.get("backup_dir", backupDir).asString();
    int max = configJson.get("max_backups", static_cast<int>(maxBackups)).asInt();
    if (max < 1) {
        throw std::runtime_error("max_backups must be at least 1, got " + std::to_string(max));
    }
    maxBackups = static_cast<std::size_t>(max);
    uploadsDir = configJson.get("uploads_dir", uploadsDir).asString();
    restoreDir = configJson.get("restore_dir", restoreDir).asString();

    std::string url = configJson.get("database_url", "").asString();
    if (!url.empty()) {
        databaseUrl = url;
    }
    dumpProgram = configJson.get("dump_program", dumpProgram).asString();
    restoreProgram = configJson.get("restore_program", restoreProgram).asString();
    fileArchiver = configJson.get("file_archiver", fileArchiver).asString();
    tarProgram = configJson.get("tar_program", tarProgram).asString();

    const Json::Value& schedule = configJson["schedule"];
    if (schedule.isObject()) {
        scheduleIntervalHours = schedule.get("interval_hours", scheduleIntervalHours).asInt();
    }

    const Json::Value& log = configJson["log"];
    if (log.isObject()) {
        logFile = log.get("file", logFile).asString();
        errorLogFile = log.get("error_file", errorLogFile).asString();
        logLevel = log.get("level", logLevel).asString();
        logToConsole = log.get("console", logToConsole).asBool();
    }

    const Json::Value& notification = configJson["notification"];
    if (notification.isObject()) {
        webhookUrl = notification.get("webhook_url", "").asString();
        notificationTimeoutSeconds = notification.get("timeout_seconds", 10).asInt();
    }
}

void BackupConfig::applyEnvironment() {
    if (const char* url = std::getenv("DATABASE_URL"); url && *url) {
        databaseUrl = url;
    }
    if (const char* level = std::getenv("LOG_LEVEL"); level && *level) {
        logLevel = level;
    }
}

void BackupConfig::validate() const {
    if (backupDir.empty()) {
        throw std::runtime_error("backup_dir must not be empty");
    }
    if (fileArchiver != "libarchive" && fileArchiver != "tar") {
        throw std::runtime_error("Unsupported file_archiver: " + fileArchiver);
    }
    if (scheduleIntervalHours <= 0 || scheduleIntervalHours > maxScheduleIntervalHours) {
        throw std::runtime_error("schedule.interval_hours must be between 1 and " +
                                 std::to_string(maxScheduleIntervalHours) + ", got " +
                                 std::to_string(scheduleIntervalHours));
    }
    if (logLevel != "error" && logLevel != "warn" && logLevel != "info" &&
        logLevel != "http" && logLevel != "debug") {
        throw std::runtime_error("Unsupported log level: " + logLevel);
    }
    if (notificationTimeoutSeconds <= 0) {
        throw std::runtime_error("notification.timeout_seconds must be positive");
    }
}
