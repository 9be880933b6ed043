/**
 * @file retention_policy.hpp
 * @brief Count-based retention over the Backup Store catalog.
 */

#ifndef RETENTION_POLICY_HPP
#define RETENTION_POLICY_HPP

#include <string>
#include <vector>
#include <memory>
#include <cstddef>
#include "backup_store.hpp"

class Logger;

/**
 * @brief Keeps the newest `maxBackups` artifacts and deletes the rest.
 *
 * The cap is shared by database snapshots and file archives. Failures never propagate:
 * they are logged and end the current pass, leaving any remaining excess for the next one.
 */
class RetentionPolicy {
public:
    /**
     * @brief Constructs a retention policy.
     *
     * @param store Backup Store the catalog refers to.
     * @param maxBackups Number of artifacts to keep, across all kinds.
     * @param logger Receives deletion and failure events.
     */
    RetentionPolicy(BackupStore store, std::size_t maxBackups, std::shared_ptr<const Logger> logger);

    /**
     * @brief Runs one retention pass over @p catalog.
     *
     * Entries are ordered by modification time, newest first (ties by name, descending);
     * everything past the cap is removed one at a time.
     *
     * @param catalog Artifact names as returned by the catalog lister.
     * @return Number of artifacts deleted in this pass.
     */
    std::size_t enforce(const std::vector<std::string>& catalog) const;

    /**
     * @brief Orders artifacts newest first and returns those beyond @p maxBackups.
     */
    static std::vector<BackupArtifact> selectExpired(std::vector<BackupArtifact> artifacts, std::size_t maxBackups);

private:
    BackupStore store_;
    std::size_t maxBackups_;
    std::shared_ptr<const Logger> logger_;
};

#endif // RETENTION_POLICY_HPP
