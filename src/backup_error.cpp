#include "backup_error.hpp"

const char* toString(BackupErrc code) {
    switch (code) {
        case BackupErrc::Configuration:      return "ConfigurationError";
        case BackupErrc::ProcessExecution:   return "ProcessExecutionError";
        case BackupErrc::StorageEnumeration: return "StorageEnumerationError";
        case BackupErrc::StorageDeletion:    return "StorageDeletionError";
    }
    return "UnknownError";
}
