#include "backup_store.hpp"
#include <ctime>
#include <cstdio>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kDatabasePrefix = "database-";
constexpr std::string_view kDatabaseExtension = ".sql";
constexpr std::string_view kFilesPrefix = "files-";
constexpr std::string_view kFilesExtension = ".tar.gz";

bool endsWith(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

} // namespace

BackupStore::BackupStore(fs::path root) : root_(std::move(root)) {}

void BackupStore::ensure() const {
    fs::create_directories(root_);
}

fs::path BackupStore::artifactPath(ArtifactKind kind, const std::string& timestamp) const {
    std::string name;
    if (kind == ArtifactKind::DatabaseSnapshot) {
        name = std::string(kDatabasePrefix) + timestamp + std::string(kDatabaseExtension);
    } else {
        name = std::string(kFilesPrefix) + timestamp + std::string(kFilesExtension);
    }
    return root_ / name;
}

BackupResult<std::vector<std::string>> BackupStore::enumerate() const {
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        return backupError(BackupErrc::StorageEnumeration,
                           "Failed to read backup directory " + root_.string() + ": " + ec.message());
    }

    std::vector<std::string> names;
    while (it != fs::directory_iterator()) {
        std::string name = it->path().filename().string();
        if (classify(name)) {
            names.push_back(std::move(name));
        }
        it.increment(ec);
        if (ec) {
            return backupError(BackupErrc::StorageEnumeration,
                               "Failed to read backup directory " + root_.string() + ": " + ec.message());
        }
    }
    return names;
}

BackupResult<std::vector<BackupArtifact>> BackupStore::describe(const std::vector<std::string>& names) const {
    std::vector<BackupArtifact> artifacts;
    artifacts.reserve(names.size());
    for (const auto& name : names) {
        auto kind = classify(name);
        if (!kind) {
            continue;
        }
        fs::path path = root_ / name;
        std::error_code ec;
        auto modified = fs::last_write_time(path, ec);
        if (ec) {
            return backupError(BackupErrc::StorageDeletion,
                               "Failed to stat backup " + path.string() + ": " + ec.message());
        }
        artifacts.push_back(BackupArtifact{*kind, name, path, modified});
    }
    return artifacts;
}

std::optional<ArtifactKind> BackupStore::classify(std::string_view name) {
    if (endsWith(name, kDatabaseExtension)) {
        return ArtifactKind::DatabaseSnapshot;
    }
    if (endsWith(name, kFilesExtension)) {
        return ArtifactKind::FileArchive;
    }
    return std::nullopt;
}

std::string BackupStore::timestamp(std::chrono::system_clock::time_point when) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(when);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(when - seconds).count();
    std::time_t timeT = std::chrono::system_clock::to_time_t(seconds);
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);

    char dateBuf[32];
    std::strftime(dateBuf, sizeof(dateBuf), "%Y-%m-%dT%H-%M-%S", &tmUtc);
    char millisBuf[8];
    std::snprintf(millisBuf, sizeof(millisBuf), "-%03dZ", static_cast<int>(millis));
    return std::string(dateBuf) + millisBuf;
}
