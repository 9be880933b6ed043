/**
 * @file backup_store.hpp
 * @brief The on-disk Backup Store holding database snapshots and file archives.
 *
 * The store is a single directory; its listing is the catalog. Artifact names encode
 * their kind and creation time: `database-<timestamp>.sql` and `files-<timestamp>.tar.gz`,
 * where the timestamp is ISO-8601 UTC with ':' and '.' replaced by '-'.
 */

#ifndef BACKUP_STORE_HPP
#define BACKUP_STORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <filesystem>
#include <chrono>
#include "backup_error.hpp"

/**
 * @brief Kinds of artifacts kept in the Backup Store.
 */
enum class ArtifactKind {
    DatabaseSnapshot,
    FileArchive
};

/**
 * @brief One artifact found in the Backup Store.
 */
struct BackupArtifact {
    ArtifactKind kind;
    std::string name;
    std::filesystem::path path;
    std::filesystem::file_time_type modified;
};

class BackupStore {
public:
    explicit BackupStore(std::filesystem::path root);

    /**
     * @brief Creates the store directory and any missing parents. Idempotent.
     *
     * @throws std::filesystem::filesystem_error If the location cannot be created.
     */
    void ensure() const;

    const std::filesystem::path& root() const { return root_; }

    /**
     * @brief Returns `<root>/database-<timestamp>.sql` or `<root>/files-<timestamp>.tar.gz`.
     */
    std::filesystem::path artifactPath(ArtifactKind kind, const std::string& timestamp) const;

    /**
     * @brief Lists the names of recognised artifacts, in directory enumeration order.
     *
     * @return Names, or a StorageEnumeration error.
     */
    BackupResult<std::vector<std::string>> enumerate() const;

    /**
     * @brief Stats the named artifacts.
     *
     * @return Artifacts with their modification times, or a StorageDeletion error naming
     *         the first entry that could not be inspected.
     */
    BackupResult<std::vector<BackupArtifact>> describe(const std::vector<std::string>& names) const;

    /**
     * @brief Classifies a file name by its extension (".sql" or ".tar.gz").
     */
    static std::optional<ArtifactKind> classify(std::string_view name);

    /**
     * @brief Formats a filesystem-safe timestamp, e.g. "2026-10-19T08-30-05-123Z".
     */
    static std::string timestamp(std::chrono::system_clock::time_point when);

private:
    std::filesystem::path root_;
};

#endif // BACKUP_STORE_HPP
