#pragma once
#include "errors.hpp"
#include "framing.hpp"
#include "tool.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolrelay {

constexpr const char* kProtocolVersion = "2024-11-05";

struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
    std::string instructions;
    nlohmann::json capabilities = nlohmann::json::object();
    bool has_tools = false;
    bool has_resources = false;
};

struct SessionOptions {
    std::string label = "session"; // log prefix, usually the provider name
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds request_timeout{30000};
    // false: one request in flight at a time, callers queue FIFO.
    // true: concurrent requests, responses routed by id.
    bool pipelined = false;
};

// JSON-RPC 2.0 over a newline-delimited byte stream pair.
//
// Whichever caller is waiting reads frames on behalf of all waiters and
// routes responses to their PendingCall by id. Ids of calls that timed out
// are remembered so their late responses are discarded rather than
// misattributed.
class ProtocolSession {
public:
    // Takes ownership of both descriptors
    ProtocolSession(int read_fd, int write_fd, SessionOptions options = {});
    ~ProtocolSession();

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    // initialize request + notifications/initialized.
    // Throws HandshakeTimeout, Malformed, ConnectionClosed or Remote.
    const ServerInfo& initialize();

    // Follows nextCursor until exhausted
    std::vector<ToolDescriptor> list_tools(const std::string& provider = "");
    std::vector<ResourceDescriptor> list_resources(const std::string& provider = "");

    ToolResult call_tool(const std::string& name, const nlohmann::json& arguments,
                         std::chrono::milliseconds timeout);

    // Generic request; returns the "result" member
    nlohmann::json request(const std::string& method, const nlohmann::json& params,
                           std::chrono::milliseconds timeout);
    void notify(const std::string& method,
                const nlohmann::json& params = nlohmann::json::object());

    // Fail all outstanding calls with ConnectionClosed and close the write
    // side. Idempotent.
    void close() noexcept;

    bool is_closed() const;
    bool is_initialized() const { return initialized_; }
    const ServerInfo& server_info() const { return server_info_; }

    size_t pending_count() const;
    size_t abandoned_count() const;

private:
    struct PendingCall {
        std::string method;
        bool done = false;
        nlohmann::json result;
        std::optional<ToolRelayError> error;
    };

    void require_initialized(const char* op) const;
    // partial is set when some but not all bytes of the frame went out
    bool send_frame(const nlohmann::json& frame, int64_t deadline_ms, bool* partial = nullptr);

    // All *_locked helpers expect mutex_ held
    void dispatch_locked(const std::string& line);
    void handle_server_request_locked(const nlohmann::json& msg);
    void fail_all_locked(const ToolRelayError& error);
    void release_ticket_locked();

    SessionOptions options_;
    LineReader reader_;
    int write_fd_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<int64_t, std::shared_ptr<PendingCall>> pending_;
    std::unordered_set<int64_t> abandoned_;
    int64_t next_id_ = 1;
    bool reader_active_ = false;
    bool closed_ = false;

    // FIFO admission for serialized mode
    uint64_t next_ticket_ = 0;
    uint64_t serving_ticket_ = 0;
    std::unordered_set<uint64_t> cancelled_tickets_;

    std::mutex write_mutex_;

    ServerInfo server_info_;
    bool initialized_ = false;
};

} // namespace toolrelay
