#include "process.hpp"
#include "errors.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <mutex>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace toolrelay {

static void ignore_sigpipe_once() {
    // Writes to a dead provider's stdin must surface as EPIPE, not kill us
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

// Inherited environment with the overlay applied on top
static std::vector<std::string> build_environment(const ProviderConfig& config) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (config.env.count(key) > 0) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : config.env) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::unique_ptr<ProcessHandle> ProcessHandle::spawn(const ProviderConfig& config) {
    ignore_sigpipe_once();

    if (config.command.empty()) {
        throw ToolRelayError(ErrorKind::Spawn,
            "No command configured for provider '" + config.name + "'");
    }

    // Everything the child needs is built before fork()
    std::vector<std::string> argv_storage;
    argv_storage.push_back(config.command);
    argv_storage.insert(argv_storage.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(config);
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        throw ToolRelayError(ErrorKind::Spawn,
            std::string("Failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        throw ToolRelayError(ErrorKind::Spawn,
            std::string("Failed to fork process: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process — detach from controlling terminal
        setsid();
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        if (config.cwd && chdir(config.cwd->c_str()) != 0) {
            int report[2] = {0, errno};
            ssize_t n = write(status_pipe[1], report, sizeof(report));
            (void)n;
            _exit(127);
        }
        environ = envp.data();
        execvp(argv[0], argv.data());
        int report[2] = {1, errno};
        ssize_t n = write(status_pipe[1], report, sizeof(report));
        (void)n;
        _exit(127);
    }

    // Parent process
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    // {stage, errno}: stage 0 = chdir, 1 = exec
    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = read(status_pipe[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        // exec (or chdir) failed in the child
        int status = 0;
        waitpid(pid, &status, 0);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(err_pipe[0]);
        std::string what = report[0] == 0
            ? "Failed to enter working directory '" + config.cwd.value_or("") + "': "
            : "Failed to start '" + config.command + "': ";
        throw ToolRelayError(ErrorKind::Spawn, what + std::strerror(report[1]));
    }

    std::unique_ptr<ProcessHandle> handle(new ProcessHandle());
    handle->name_ = config.name;
    handle->pid_ = pid;
    handle->stdin_fd_ = in_pipe[1];
    handle->stdout_fd_ = out_pipe[0];
    handle->stderr_fd_ = err_pipe[0];
    return handle;
}

ProcessHandle::~ProcessHandle() {
    terminate(std::chrono::milliseconds(0));
}

int ProcessHandle::take_stdin() {
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ProcessHandle::take_stdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

bool ProcessHandle::reap(bool block) noexcept {
    if (reaped_) return true;
    if (pid_ <= 0) return true;
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        reaped_ = true;
        status_ = status;
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        // Someone else reaped it; nothing left to wait for
        reaped_ = true;
        return true;
    }
    return false;
}

bool ProcessHandle::is_alive() {
    if (pid_ <= 0) return false;
    return !reap(false);
}

std::optional<int> ProcessHandle::exit_code() const {
    if (!reaped_) return std::nullopt;
    if (WIFEXITED(status_)) return WEXITSTATUS(status_);
    if (WIFSIGNALED(status_)) return 128 + WTERMSIG(status_);
    return std::nullopt;
}

void ProcessHandle::signal_group(int sig) noexcept {
    if (pid_ <= 0 || reaped_) return;
    if (kill(-pid_, sig) != 0) {
        kill(pid_, sig);
    }
}

void ProcessHandle::close_fds() noexcept {
    if (stdin_fd_ >= 0) { close(stdin_fd_); stdin_fd_ = -1; }
    if (stdout_fd_ >= 0) { close(stdout_fd_); stdout_fd_ = -1; }
    if (stderr_fd_ >= 0) { close(stderr_fd_); stderr_fd_ = -1; }
}

void ProcessHandle::terminate(std::chrono::milliseconds grace) noexcept {
    if (pid_ <= 0) {
        close_fds();
        return;
    }

    // EOF on stdin is the polite stop request for stdio servers
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }

    if (!reap(false)) {
        signal_group(SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + grace;
        while (!reap(false) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!reaped_) {
            std::cerr << "[process] " << name_ << " (pid " << pid_
                      << ") ignored SIGTERM, sending SIGKILL\n";
            signal_group(SIGKILL);
            reap(true);
        }
    }

    close_fds();
}

} // namespace toolrelay
