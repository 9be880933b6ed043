/**
 * @file backup_cli.hpp
 * @brief Command-line entry point driving the backup manager.
 *
 * Usage: respondervault [--config <path>] [--interval-hours N] <command> [args]
 *
 *   backup [full|database|files]   create artifacts (default: full)
 *   restore-database <file>        replay a database snapshot
 *   restore-files <file>           extract a file archive
 *   list                           print artifact names, one per line
 *   daemon                         back up now and every interval until SIGINT/SIGTERM
 */

#ifndef BACKUP_CLI_HPP
#define BACKUP_CLI_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <iosfwd>

/**
 * @brief Parsed command line.
 */
struct CliOptions {
    std::string configFile = "respondervault.json"; ///< JSON configuration path.
    std::string command;                            ///< Sub-command name.
    std::vector<std::string> args;                  ///< Sub-command arguments.
    std::optional<int> intervalHours;               ///< Daemon period override.
    bool help = false;                              ///< Usage requested.
};

/**
 * @brief Parses and validates the command line.
 *
 * @return Options, or a message describing the usage error.
 */
std::expected<CliOptions, std::string> parseCliArguments(const std::vector<std::string>& arguments);

/**
 * @brief Returns the usage text.
 */
std::string cliUsage(const std::string& program);

/**
 * @brief Executes the parsed command.
 *
 * @param options Parsed command line.
 * @param out Receives command output (paths, listings).
 * @param err Receives error summaries.
 * @return Process exit status: 0 on success, 1 on any failure.
 */
int runCli(const CliOptions& options, std::ostream& out, std::ostream& err);

#endif // BACKUP_CLI_HPP
