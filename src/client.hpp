#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "session.hpp"
#include "tool.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace toolrelay {

// Unconnected -> Connecting -> Ready -> Disposed. Connecting and Ready may
// drop to Failed. Failed and Disposed are terminal; reconnecting needs a
// new client.
enum class ProviderConnectionState { Unconnected, Connecting, Ready, Failed, Disposed };

const char* connection_state_to_string(ProviderConnectionState state);

struct ClientOptions {
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds terminate_grace{5000};
    bool pipelined = false;
};

// One provider process plus its protocol session.
//
// Operations are driven by one thread at a time; only is_alive(), state(),
// pid() and exit_code() may be called concurrently (liveness monitor).
class ToolProviderClient {
public:
    explicit ToolProviderClient(ProviderConfig config, ClientOptions options = {});
    ~ToolProviderClient();

    ToolProviderClient(const ToolProviderClient&) = delete;
    ToolProviderClient& operator=(const ToolProviderClient&) = delete;

    // Spawn + handshake. Throws ToolRelayError; the client is Failed after.
    void connect();

    std::vector<ToolDescriptor> list_tools();
    std::vector<ResourceDescriptor> list_resources();
    ToolResult call_tool(const std::string& name, const nlohmann::json& arguments,
                         std::chrono::milliseconds timeout);

    // Close the session, terminate the process. Safe from any state, twice.
    void dispose() noexcept;

    // Mark Failed, then dispose. For a live provider that cannot be used.
    void abandon(const ToolRelayError& error);

    ProviderConnectionState state() const { return state_.load(); }
    bool is_ready() const { return state() == ProviderConnectionState::Ready; }

    // Reaps the child; a Ready client whose process died becomes Failed
    bool is_alive();

    std::optional<pid_t> pid() const;
    std::optional<int> exit_code() const;

    const std::string& name() const { return config_.name; }
    const ProviderConfig& config() const { return config_; }
    const ServerInfo* server_info() const;

private:
    void require_ready(const char* op) const;
    void mark_failed(const ToolRelayError& error);
    void start_stderr_pump();
    void stop_stderr_pump() noexcept;

    ProviderConfig config_;
    ClientOptions options_;
    std::atomic<ProviderConnectionState> state_{ProviderConnectionState::Unconnected};

    mutable std::mutex process_mutex_; // guards process_
    std::unique_ptr<ProcessHandle> process_;
    std::unique_ptr<ProtocolSession> session_;

    std::thread stderr_thread_;
    std::atomic<bool> stop_stderr_{false};
    bool released_ = false;
};

} // namespace toolrelay
