/**
 * @file backup_error.hpp
 * @brief Error taxonomy shared by the ResponderVault backup operations.
 *
 * Every caller-facing operation returns a BackupResult, an std::expected carrying
 * either the value or a BackupError that names the failure category.
 */

#ifndef BACKUP_ERROR_HPP
#define BACKUP_ERROR_HPP

#include <string>
#include <expected>

/**
 * @brief Failure categories reported by the backup manager.
 */
enum class BackupErrc {
    Configuration,      ///< Required configuration (e.g. the connection string) is missing.
    ProcessExecution,   ///< An external capability failed to start or exited non-zero.
    StorageEnumeration, ///< The Backup Store could not be listed.
    StorageDeletion     ///< An artifact could not be inspected or removed during retention.
};

/**
 * @brief Error value carried by BackupResult.
 */
struct BackupError {
    BackupErrc code;
    std::string message;
};

template <typename T>
using BackupResult = std::expected<T, BackupError>;

/**
 * @brief Returns a short, stable name for an error category ("ConfigurationError", ...).
 */
const char* toString(BackupErrc code);

inline std::unexpected<BackupError> backupError(BackupErrc code, std::string message) {
    return std::unexpected(BackupError{code, std::move(message)});
}

#endif // BACKUP_ERROR_HPP
