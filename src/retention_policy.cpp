#include "retention_policy.hpp"
#include "logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

RetentionPolicy::RetentionPolicy(BackupStore store, std::size_t maxBackups, std::shared_ptr<const Logger> logger)
    : store_(std::move(store)), maxBackups_(maxBackups), logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("RetentionPolicy requires a logger");
    }
}

std::vector<BackupArtifact> RetentionPolicy::selectExpired(std::vector<BackupArtifact> artifacts, std::size_t maxBackups) {
    std::sort(artifacts.begin(), artifacts.end(), [](const BackupArtifact& a, const BackupArtifact& b) {
        if (a.modified != b.modified) {
            return a.modified > b.modified;
        }
        return a.name > b.name;
    });
    if (artifacts.size() <= maxBackups) {
        return {};
    }
    return std::vector<BackupArtifact>(artifacts.begin() + static_cast<std::ptrdiff_t>(maxBackups), artifacts.end());
}

std::size_t RetentionPolicy::enforce(const std::vector<std::string>& catalog) const {
    auto artifacts = store_.describe(catalog);
    if (!artifacts) {
        Json::Value fields;
        fields["error"] = artifacts.error().message;
        logger_->error("Failed to cleanup old backups", fields);
        return 0;
    }

    std::size_t deleted = 0;
    for (const auto& artifact : selectExpired(std::move(*artifacts), maxBackups_)) {
        std::error_code ec;
        bool removed = fs::remove(artifact.path, ec);
        if (ec || !removed) {
            Json::Value fields;
            fields["error"] = ec ? ec.message() : std::string("backup no longer exists");
            fields["backup"] = artifact.name;
            logger_->error("Failed to cleanup old backups", fields);
            return deleted;
        }
        ++deleted;
        Json::Value fields;
        fields["backup"] = artifact.name;
        logger_->info("Old backup deleted", fields);
    }
    return deleted;
}
