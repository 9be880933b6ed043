#include "database_backup.hpp"
#include "command_runner.hpp"
#include <stdexcept>

PostgreSQLBackupStrategy::PostgreSQLBackupStrategy(std::shared_ptr<CommandRunner> runner,
                                                   std::string dumpProgram,
                                                   std::string restoreProgram)
    : runner(std::move(runner)), dumpProgram(std::move(dumpProgram)), restoreProgram(std::move(restoreProgram)) {
    if (!this->runner) {
        throw std::invalid_argument("PostgreSQLBackupStrategy requires a command runner");
    }
}

std::expected<void, std::string> PostgreSQLBackupStrategy::dump(const std::string& connectionString,
                                                                const std::string& outputFile) {
    CommandSpec command;
    command.argv = {dumpProgram, connectionString};
    command.stdoutFile = outputFile;

    auto result = runner->run(command);
    if (!result) {
        return std::unexpected("Failed to execute " + dumpProgram + ": " + result.error());
    }
    return {};
}

std::expected<void, std::string> PostgreSQLBackupStrategy::restore(const std::string& connectionString,
                                                                   const std::string& inputFile) {
    CommandSpec command;
    command.argv = {restoreProgram, connectionString};
    command.stdinFile = inputFile;

    auto result = runner->run(command);
    if (!result) {
        return std::unexpected("Failed to execute " + restoreProgram + ": " + result.error());
    }
    return {};
}
