#include "command_runner.hpp"
#include <cerrno>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Exit status used by the child when execvp fails, as shells do for "command not found".
constexpr int kExecFailedStatus = 127;

class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() { reset(); }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

} // namespace

std::expected<void, std::string> PosixCommandRunner::run(const CommandSpec& command) {
    if (command.argv.empty()) {
        return std::unexpected("Empty command");
    }

    FileDescriptor input(command.stdinFile ? ::open(command.stdinFile->c_str(), O_RDONLY | O_CLOEXEC) : -1);
    if (command.stdinFile && !input.valid()) {
        return std::unexpected("Failed to open input file " + *command.stdinFile + " for " +
                               command.program() + ": " + std::strerror(errno));
    }

    FileDescriptor output(command.stdoutFile
                              ? ::open(command.stdoutFile->c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)
                              : -1);
    if (command.stdoutFile && !output.valid()) {
        return std::unexpected("Failed to open output file " + *command.stdoutFile + " for " +
                               command.program() + ": " + std::strerror(errno));
    }

    std::vector<char*> args;
    args.reserve(command.argv.size() + 1);
    for (const auto& arg : command.argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected("Failed to spawn " + command.program() + ": " + std::strerror(errno));
    }
    if (pid == 0) {
        // Only async-signal-safe calls between fork and exec.
        if (input.valid() && ::dup2(input.get(), STDIN_FILENO) < 0) {
            ::_exit(kExecFailedStatus);
        }
        if (output.valid() && ::dup2(output.get(), STDOUT_FILENO) < 0) {
            ::_exit(kExecFailedStatus);
        }
        ::execvp(args[0], args.data());
        ::_exit(kExecFailedStatus);
    }

    input.reset();
    output.reset();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected("Failed to wait for " + command.program() + ": " + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) {
            return {};
        }
        if (code == kExecFailedStatus) {
            return std::unexpected("Failed to start " + command.program() + " (exit status 127)");
        }
        return std::unexpected(command.program() + " exited with status " + std::to_string(code));
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(command.program() + " terminated by signal " + std::to_string(WTERMSIG(status)));
    }
    return std::unexpected(command.program() + " ended abnormally");
}
