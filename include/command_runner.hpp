/**
 * @file command_runner.hpp
 * @brief External process execution for dump, restore, and archive capabilities.
 *
 * Strategies never spawn processes directly; they describe the invocation as a
 * CommandSpec and hand it to a CommandRunner, which tests can replace with a fake.
 */

#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>

/**
 * @brief Description of one external process invocation.
 */
struct CommandSpec {
    std::vector<std::string> argv;          ///< Program (looked up in PATH) followed by its arguments.
    std::optional<std::string> stdinFile;   ///< File connected to the child's stdin.
    std::optional<std::string> stdoutFile;  ///< File (created or truncated) receiving the child's stdout.

    /**
     * @brief Returns the program name, used in error messages.
     *
     * Arguments are never included since they may contain credentials.
     */
    std::string program() const { return argv.empty() ? std::string() : argv.front(); }
};

/**
 * @brief Interface for running external programs to completion.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs the command and waits for it to exit.
     *
     * @param command Invocation to perform.
     * @return std::expected<void, std::string> Success on exit status 0; otherwise a
     *         message describing the spawn failure, the exit status, or the terminating signal.
     */
    virtual std::expected<void, std::string> run(const CommandSpec& command) = 0;
};

/**
 * @brief CommandRunner based on fork/execvp/waitpid.
 *
 * Redirection files are opened in the parent before forking, so an unreadable
 * input or unwritable output fails without spawning anything. The output file is
 * left in place when the command fails.
 */
class PosixCommandRunner : public CommandRunner {
public:
    std::expected<void, std::string> run(const CommandSpec& command) override;
};

#endif // COMMAND_RUNNER_HPP
