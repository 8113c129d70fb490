#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace snapbucket {

struct SubprocessOptions {
    bool capture_stdout = false;  // parent reads the child's stdout
    bool capture_stderr = false;  // parent reads the child's stderr
    bool pipe_stdin = false;      // parent writes the child's stdin

    // Child stdin from this descriptor (typically the stdout of a previous
    // stage). Ownership passes to the Subprocess, which closes it after fork.
    int stdin_fd = -1;

    // When set, the child changes its root to this directory before exec
    std::filesystem::path root_dir;
};

/// A child process started with fork/exec. Pipes are close-on-exec so
/// stages never inherit each other's descriptors. A Subprocess destroyed
/// before wait() terminates and reaps its child.
class Subprocess {
public:
    // Throws CommandFailed when the pipes cannot be created, fork fails,
    // or the program cannot be executed.
    Subprocess(std::vector<std::string> argv, const SubprocessOptions& options = {});
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Reads up to `n` bytes of the child's stdout; returns 0 at end of stream.
    size_t read(uint8_t* buf, size_t n);

    // Writes all of `data` to the child's stdin. Returns false when the
    // child closed its end (EPIPE).
    bool write(std::span<const uint8_t> data);

    void close_stdin();

    // Hands the stdout pipe to the caller (to chain another stage).
    int release_stdout();

    // Blocks until the child exits. Returns its exit code, or 128 + signal
    // number when it was killed. Idempotent.
    int wait();

    bool finished() const { return reaped_; }
    pid_t pid() const { return pid_; }
    const std::string& command() const { return command_; }

    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

private:
    void close_fd(int& fd);

    std::string command_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
};

struct CommandResult {
    int exit_code = 0;
    std::string output;
    std::string error;
};

// Runs a command to completion, feeding `input` on stdin and collecting
// stdout and stderr.
CommandResult run_command(const std::vector<std::string>& argv,
                          const std::string& input = {},
                          const std::filesystem::path& root_dir = {});

// run_command, throwing CommandFailed on a non-zero exit. Returns stdout.
std::string check_output(const std::vector<std::string>& argv,
                         const std::string& input = {},
                         const std::filesystem::path& root_dir = {});

std::string join_command(const std::vector<std::string>& argv);

}  // namespace snapbucket
