#include "manager.hpp"
#include "event_bus.hpp"
#include "managers/on_demand.hpp"
#include "managers/persistent.hpp"

#include <iostream>

namespace toolrelay {

ManagerOptions ManagerOptions::from_config(const ManagerConfig& cfg) {
    ManagerOptions opts;
    opts.handshake_timeout = std::chrono::milliseconds(cfg.handshake_timeout_ms);
    opts.request_timeout = std::chrono::milliseconds(cfg.tool_timeout_ms);
    opts.terminate_grace = std::chrono::milliseconds(cfg.terminate_grace_ms);
    opts.pipelined = cfg.pipelined;
    return opts;
}

ClientOptions ManagerOptions::client_options() const {
    ClientOptions opts;
    opts.handshake_timeout = handshake_timeout;
    opts.request_timeout = request_timeout;
    opts.terminate_grace = terminate_grace;
    opts.pipelined = pipelined;
    return opts;
}

void ToolManager::emit(const std::string& category, const std::string& message,
                       nlohmann::json data) const {
    publish_debug(event_bus_, category, message, std::move(data));
}

void ToolManager::emit_tool_request(const std::string& provider, const std::string& tool,
                                    const nlohmann::json& arguments) const {
    if (!event_bus_) return;
    ToolCallRequestEvent ev;
    ev.provider = provider;
    ev.tool_name = tool;
    ev.arguments = arguments;
    event_bus_->publish(ev);
}

void ToolManager::emit_tool_result(const std::string& provider, const std::string& tool,
                                   bool success, int64_t duration_ms) const {
    if (!event_bus_) return;
    ToolCallResultEvent ev;
    ev.provider = provider;
    ev.tool_name = tool;
    ev.success = success;
    ev.duration_ms = duration_ms;
    event_bus_->publish(ev);
}

void ToolManager::emit_provider_failed(const std::string& provider,
                                       const ToolRelayError& error) const {
    if (!event_bus_) return;
    ProviderFailedEvent ev;
    ev.provider = provider;
    ev.kind = error_kind_to_string(error.kind());
    ev.message = error.what();
    event_bus_->publish(ev);
}

std::unique_ptr<ToolManager> create_tool_manager(const Config& config) {
    ManagerOptions opts = ManagerOptions::from_config(config.manager);
    if (config.manager.mode == ManagerMode::Persistent) {
        auto manager = std::make_unique<PersistentToolManager>(config.servers, opts);
        size_t started = manager->start();
        std::cerr << "[manager] Started " << started << "/" << config.servers.size()
                  << " persistent MCP servers\n";
        return manager;
    }
    return std::make_unique<OnDemandToolManager>(config.servers, opts);
}

} // namespace toolrelay
