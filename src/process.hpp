#pragma once
#include "config.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace toolrelay {

// Owns one child process and the parent ends of its three standard streams.
// The child runs in its own session so termination reaches its whole
// process group (npx/uvx style launchers fork the real server).
class ProcessHandle {
public:
    // Throws ToolRelayError(ErrorKind::Spawn) when the command cannot be
    // started. Exec failures are reported synchronously via a status pipe.
    static std::unique_ptr<ProcessHandle> spawn(const ProviderConfig& config);

    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const { return pid_; }
    const std::string& name() const { return name_; }

    // Transfer ownership of the parent-side pipe ends (caller closes them)
    int take_stdin();
    int take_stdout();
    int stderr_fd() const { return stderr_fd_; }

    // Non-blocking; reaps the child when it has exited
    bool is_alive();

    // Exit status once reaped (128 + signal for signal deaths)
    std::optional<int> exit_code() const;

    // EOF + SIGTERM, wait up to grace, then SIGKILL. Idempotent.
    void terminate(std::chrono::milliseconds grace) noexcept;

private:
    ProcessHandle() = default;

    bool reap(bool block) noexcept;
    void signal_group(int sig) noexcept;
    void close_fds() noexcept;

    std::string name_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int status_ = 0;
};

} // namespace toolrelay
