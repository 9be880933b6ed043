#include "logger.hpp"
#include "backup_config.hpp"
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

LogLevel requireLevel(const std::string& name) {
    auto level = Logger::parseLevel(name);
    if (!level) {
        throw std::runtime_error("Unsupported log level: " + name);
    }
    return *level;
}

std::string formatFields(const Json::Value& fields) {
    if (fields.isNull() || (fields.isObject() && fields.empty())) {
        return {};
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return " " + Json::writeString(builder, fields);
}

} // namespace

Logger::Logger(std::string logFile, std::string errorLogFile, LogLevel level, bool console)
    : logFile_(std::move(logFile)), errorLogFile_(std::move(errorLogFile)), level_(level), console_(console) {}

Logger::Logger(const BackupConfig& config)
    : Logger(config.logFile, config.errorLogFile, requireLevel(config.logLevel), config.logToConsole) {}

void Logger::error(const std::string& message, const Json::Value& fields) const {
    log(LogLevel::Error, message, fields);
}

void Logger::warn(const std::string& message, const Json::Value& fields) const {
    log(LogLevel::Warn, message, fields);
}

void Logger::info(const std::string& message, const Json::Value& fields) const {
    log(LogLevel::Info, message, fields);
}

void Logger::debug(const std::string& message, const Json::Value& fields) const {
    log(LogLevel::Debug, message, fields);
}

void Logger::log(LogLevel level, const std::string& message, const Json::Value& fields) const {
    if (!enabled(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);

    std::string line = std::string("[") + timeBuf + "] " + levelName(level) + ": " + message + formatFields(fields);

    std::lock_guard<std::mutex> lock(mutex_);
    if (console_) {
        if (level <= LogLevel::Warn) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }
    append(logFile_, line);
    if (level == LogLevel::Error && errorLogFile_ != logFile_) {
        append(errorLogFile_, line);
    }
}

void Logger::append(const std::string& path, const std::string& line) const {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::ofstream out(path, std::ios::app);
    if (out.is_open()) {
        out << line << '\n';
        out.flush();
    } else if (console_) {
        std::cerr << "Error: Cannot write to log file: " << path << std::endl;
    }
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    if (name == "error") return LogLevel::Error;
    if (name == "warn") return LogLevel::Warn;
    if (name == "info") return LogLevel::Info;
    if (name == "http") return LogLevel::Http;
    if (name == "debug") return LogLevel::Debug;
    return std::nullopt;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Http:  return "HTTP";
        case LogLevel::Debug: return "DEBUG";
    }
    return "UNKNOWN";
}
