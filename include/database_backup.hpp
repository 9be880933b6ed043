/**
 * @file database_backup.hpp
 * @brief Defines database snapshot and restore strategies for ResponderVault.
 *
 * Provides the interface for dumping the primary data store into a plain SQL artifact
 * and replaying such an artifact, with a PostgreSQL implementation driving pg_dump and psql.
 *
 * @note Requires the PostgreSQL client tools in the system PATH.
 */

#ifndef DATABASE_BACKUP_HPP
#define DATABASE_BACKUP_HPP

#include <string>
#include <memory>
#include <expected>

class CommandRunner;

/**
 * @brief Interface for database backup strategies.
 *
 * The connection string is passed per call; the manager owns it and checks that it is configured.
 */
class DatabaseBackupStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~DatabaseBackupStrategy() = default;

    /**
     * @brief Dumps the database into a file.
     *
     * @param connectionString Data-store connection string.
     * @param outputFile Artifact path; created or truncated.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> dump(const std::string& connectionString,
                                                  const std::string& outputFile) = 0;

    /**
     * @brief Replays a dump file into the database.
     *
     * @param connectionString Data-store connection string.
     * @param inputFile Artifact path; not validated before the restore capability runs.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> restore(const std::string& connectionString,
                                                     const std::string& inputFile) = 0;
};

/**
 * @brief PostgreSQL strategy: `pg_dump <conn> > file` and `psql <conn> < file`.
 */
class PostgreSQLBackupStrategy : public DatabaseBackupStrategy {
public:
    /**
     * @brief Constructs a PostgreSQL backup strategy.
     *
     * @param runner Executes the client programs.
     * @param dumpProgram Dump program name or path (e.g. "pg_dump").
     * @param restoreProgram Restore program name or path (e.g. "psql").
     */
    PostgreSQLBackupStrategy(std::shared_ptr<CommandRunner> runner,
                             std::string dumpProgram = "pg_dump",
                             std::string restoreProgram = "psql");

    std::expected<void, std::string> dump(const std::string& connectionString,
                                          const std::string& outputFile) override;

    std::expected<void, std::string> restore(const std::string& connectionString,
                                             const std::string& inputFile) override;

private:
    std::shared_ptr<CommandRunner> runner; ///< Process executor.
    std::string dumpProgram;               ///< Dump capability.
    std::string restoreProgram;            ///< Restore capability.
};

#endif // DATABASE_BACKUP_HPP
