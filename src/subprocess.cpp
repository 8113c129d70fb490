#include "snapbucket/system/subprocess.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace snapbucket {

std::string join_command(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) joined += ' ';
        joined += arg;
    }
    return joined;
}

namespace {

void make_pipe(int fds[2], const std::string& command) {
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw CommandFailed("pipe() failed for " + command + ": " + strerror(errno), command, -1);
    }
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

// Runs in the forked child: only async-signal-safe calls until exec
[[noreturn]] void exec_child(char** argv, int in_fd, int out_fd, int err_fd,
                             const char* root_dir, int report_fd) {
    signal(SIGPIPE, SIG_DFL);
    if (in_fd >= 0) dup2(in_fd, STDIN_FILENO);
    if (out_fd >= 0) dup2(out_fd, STDOUT_FILENO);
    if (err_fd >= 0) dup2(err_fd, STDERR_FILENO);

    if (root_dir && (chroot(root_dir) != 0 || chdir("/") != 0)) {
        int err = errno;
        ssize_t ignored = ::write(report_fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    execvp(argv[0], argv);
    int err = errno;
    ssize_t ignored = ::write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

}  // namespace

Subprocess::Subprocess(std::vector<std::string> argv, const SubprocessOptions& options)
    : command_(join_command(argv)) {
    if (argv.empty()) {
        throw CommandFailed("Empty command", "", -1);
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int report_pipe[2] = {-1, -1};
    int given_stdin = options.stdin_fd;

    try {
        if (options.pipe_stdin) make_pipe(in_pipe, command_);
        if (options.capture_stdout) make_pipe(out_pipe, command_);
        if (options.capture_stderr) make_pipe(err_pipe, command_);
        make_pipe(report_pipe, command_);
    } catch (const CommandFailed&) {
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(report_pipe);
        if (given_stdin >= 0) close(given_stdin);
        throw;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto& arg : argv) {
        cargv.push_back(arg.data());
    }
    cargv.push_back(nullptr);

    std::string root = options.root_dir.string();
    const char* root_dir = options.root_dir.empty() ? nullptr : root.c_str();

    pid_ = fork();
    if (pid_ == 0) {
        int child_in = options.pipe_stdin ? in_pipe[0] : given_stdin;
        exec_child(cargv.data(), child_in, out_pipe[1], err_pipe[1], root_dir, report_pipe[1]);
    }

    int fork_errno = errno;
    if (given_stdin >= 0) close(given_stdin);
    if (in_pipe[0] >= 0) close(in_pipe[0]);
    if (out_pipe[1] >= 0) close(out_pipe[1]);
    if (err_pipe[1] >= 0) close(err_pipe[1]);
    close(report_pipe[1]);
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    if (pid_ < 0) {
        close(report_pipe[0]);
        close_fd(stdin_fd_);
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
        reaped_ = true;
        throw CommandFailed("fork() failed for " + command_ + ": " + strerror(fork_errno),
                            command_, -1);
    }

    // The report pipe closes on a successful exec; data means exec failed
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(report_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(report_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        wait();
        close_fd(stdin_fd_);
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
        throw CommandFailed("Cannot execute " + argv[0] + ": " + strerror(child_errno),
                            command_, 127);
    }

    log_debug(3, "Started [%d] %s", static_cast<int>(pid_), command_.c_str());
}

Subprocess::~Subprocess() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    if (!reaped_ && pid_ > 0) {
        kill(pid_, SIGTERM);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        reaped_ = true;
    }
}

void Subprocess::close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

size_t Subprocess::read(uint8_t* buf, size_t n) {
    if (stdout_fd_ < 0) return 0;
    while (true) {
        ssize_t got = ::read(stdout_fd_, buf, n);
        if (got >= 0) return static_cast<size_t>(got);
        if (errno == EINTR) continue;
        throw CommandFailed("Read from " + command_ + " failed: " + strerror(errno), command_, -1);
    }
}

bool Subprocess::write(std::span<const uint8_t> data) {
    if (stdin_fd_ < 0) return false;
    size_t off = 0;
    while (off < data.size()) {
        ssize_t put = ::write(stdin_fd_, data.data() + off, data.size() - off);
        if (put < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) return false;
            throw CommandFailed("Write to " + command_ + " failed: " + strerror(errno),
                                command_, -1);
        }
        off += static_cast<size_t>(put);
    }
    return true;
}

void Subprocess::close_stdin() {
    close_fd(stdin_fd_);
}

int Subprocess::release_stdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

int Subprocess::wait() {
    if (reaped_) return exit_code_;

    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    reaped_ = true;
    if (r < 0) {
        exit_code_ = -1;
    } else if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    log_debug(3, "[%d] %s exited with %d", static_cast<int>(pid_), command_.c_str(), exit_code_);
    return exit_code_;
}

CommandResult run_command(const std::vector<std::string>& argv,
                          const std::string& input,
                          const std::filesystem::path& root_dir) {
    SubprocessOptions options;
    options.capture_stdout = true;
    options.capture_stderr = true;
    options.pipe_stdin = true;
    options.root_dir = root_dir;

    log_debug(2, "Running: %s", join_command(argv).c_str());
    Subprocess proc(argv, options);

    // Nonblocking stdin so a child that stops reading cannot stall us
    int in_fd = proc.stdin_fd();
    fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
    size_t written = 0;
    if (input.empty()) {
        proc.close_stdin();
    }

    CommandResult result;
    char buffer[8192];
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        pollfd fds[3];
        nfds_t count = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_open) { out_idx = static_cast<int>(count); fds[count++] = {proc.stdout_fd(), POLLIN, 0}; }
        if (err_open) { err_idx = static_cast<int>(count); fds[count++] = {proc.stderr_fd(), POLLIN, 0}; }
        if (proc.stdin_fd() >= 0) { in_idx = static_cast<int>(count); fds[count++] = {proc.stdin_fd(), POLLOUT, 0}; }

        if (poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            throw CommandFailed("poll() failed for " + proc.command() + ": " + strerror(errno),
                                proc.command(), -1);
        }

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t put = ::write(proc.stdin_fd(), input.data() + written, input.size() - written);
            if (put > 0) written += static_cast<size_t>(put);
            if ((put < 0 && errno != EAGAIN && errno != EINTR) || written >= input.size()) {
                proc.close_stdin();
            }
        }
        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t got = ::read(proc.stdout_fd(), buffer, sizeof(buffer));
            if (got > 0) result.output.append(buffer, static_cast<size_t>(got));
            else if (got == 0 || errno != EINTR) out_open = false;
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t got = ::read(proc.stderr_fd(), buffer, sizeof(buffer));
            if (got > 0) result.error.append(buffer, static_cast<size_t>(got));
            else if (got == 0 || errno != EINTR) err_open = false;
        }
    }

    proc.close_stdin();
    result.exit_code = proc.wait();
    return result;
}

std::string check_output(const std::vector<std::string>& argv,
                         const std::string& input,
                         const std::filesystem::path& root_dir) {
    auto result = run_command(argv, input, root_dir);
    if (result.exit_code != 0) {
        std::string command = join_command(argv);
        std::string message = command + " exited with " + std::to_string(result.exit_code);
        if (!result.error.empty()) {
            std::string err = result.error;
            while (!err.empty() && (err.back() == '\n' || err.back() == '\r')) err.pop_back();
            message += ": " + err;
        }
        throw CommandFailed(message, command, result.exit_code);
    }
    return result.output;
}

}  // namespace snapbucket
