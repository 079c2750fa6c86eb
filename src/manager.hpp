#pragma once
#include "client.hpp"
#include "config.hpp"
#include "tool.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>

namespace toolrelay {

class EventBus;

// Per-provider health as reported by get_server_status()
struct StatusRecord {
    bool running = false;
    bool connected = false;
    std::optional<pid_t> pid;
    std::optional<int> exit_code;
    std::string type;  // "on_demand" or "persistent"
    std::string state; // connection_state_to_string(), or "available" on demand
};

struct ManagerOptions {
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds terminate_grace{5000};
    bool pipelined = false;

    static ManagerOptions from_config(const ManagerConfig& cfg);
    ClientOptions client_options() const;
};

// Aggregates every registered provider behind one interface. Tool names are
// either bare ("echo": providers tried in registration order) or qualified
// ("files:read": only that provider).
class ToolManager {
public:
    virtual ~ToolManager() = default;

    // Union of all reachable providers' tools; unreachable ones are logged
    // and skipped
    virtual std::vector<ToolDescriptor> get_available_tools() = 0;
    virtual std::vector<ResourceDescriptor> get_available_resources() = 0;

    // First result wins (an isError result counts). nullopt when no
    // provider could run the tool.
    virtual std::optional<ToolResult> call_tool(const std::string& name,
                                                const nlohmann::json& arguments,
                                                std::chrono::milliseconds timeout) = 0;

    virtual std::map<std::string, StatusRecord> get_server_status() = 0;

    // Release every provider. Idempotent.
    virtual void shutdown() = 0;

    virtual std::string manager_type() const = 0;

    virtual size_t provider_count() const = 0;

    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

protected:
    void emit(const std::string& category, const std::string& message,
              nlohmann::json data = nlohmann::json::object()) const;
    void emit_tool_request(const std::string& provider, const std::string& tool,
                           const nlohmann::json& arguments) const;
    void emit_tool_result(const std::string& provider, const std::string& tool,
                          bool success, int64_t duration_ms) const;
    void emit_provider_failed(const std::string& provider, const ToolRelayError& error) const;

    EventBus* event_bus_ = nullptr;
};

// Build the manager selected by config.manager.mode. A persistent manager
// is returned already started.
std::unique_ptr<ToolManager> create_tool_manager(const Config& config);

} // namespace toolrelay
