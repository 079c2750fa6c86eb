#include "persistent.hpp"
#include "../catalog.hpp"
#include "../event.hpp"
#include "../util.hpp"

#include <iostream>

namespace toolrelay {

static constexpr auto kMonitorInterval = std::chrono::seconds(1);

PersistentToolManager::PersistentToolManager(std::vector<ProviderConfig> providers,
                                             ManagerOptions options)
    : options_(options) {
    for (auto& config : providers) {
        auto r = std::make_unique<Resident>();
        r->config = std::move(config);
        residents_.push_back(std::move(r));
    }
}

PersistentToolManager::~PersistentToolManager() {
    shutdown();
}

size_t PersistentToolManager::start() {
    size_t started = 0;
    for (auto& r : residents_) {
        std::lock_guard<std::mutex> lock(r->op_mutex);
        if (ensure_ready(*r)) started++;
    }

    std::lock_guard<std::mutex> lock(monitor_mutex_);
    if (!monitor_.joinable() && !stopping_) {
        monitor_ = std::thread([this]() { monitor_loop(); });
    }
    return started;
}

bool PersistentToolManager::ensure_ready(Resident& r) {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        if (stopping_) return false;
    }
    if (r.client && r.client->is_ready() && r.client->is_alive()) return true;

    if (r.client) {
        std::cerr << "[manager] Restarting MCP server " << r.config.name << "\n";
        r.client->dispose();
        r.client.reset();
        r.tools.clear();
        r.resources.clear();
    }

    auto client = std::make_unique<ToolProviderClient>(r.config, options_.client_options());
    try {
        client->connect();
        r.tools = client->list_tools();
        r.resources = client->list_resources();
    } catch (const ToolRelayError& e) {
        std::cerr << "[manager] Failed to start MCP server " << r.config.name << ": "
                  << e.what() << "\n";
        emit_provider_failed(r.config.name, e);
        r.tools.clear();
        r.resources.clear();
        // A live process with no catalog would be served empty forever; stop
        // it so the next use reconnects. The handle stays for status.
        client->abandon(e);
        r.client = std::move(client);
        return false;
    }

    r.connects++;
    r.client = std::move(client);
    if (auto pid = r.client->pid()) {
        std::cerr << "[manager] Started persistent MCP server " << r.config.name
                  << " (PID: " << *pid << ")\n";
    }
    return true;
}

void PersistentToolManager::monitor_loop() {
    std::unique_lock<std::mutex> lock(monitor_mutex_);
    while (!stopping_) {
        monitor_cv_.wait_for(lock, kMonitorInterval, [this]() { return stopping_; });
        if (stopping_) break;
        lock.unlock();
        for (auto& r : residents_) {
            // Busy residents are checked on the next tick
            std::unique_lock<std::mutex> op(r->op_mutex, std::try_to_lock);
            if (!op.owns_lock() || !r->client || !r->client->is_ready()) continue;
            if (!r->client->is_alive()) {
                emit(debug_category::Agent, "MCP server " + r->config.name + " stopped",
                     {{"provider", r->config.name}, {"exit_code", r->client->exit_code().value_or(-1)}});
            }
        }
        lock.lock();
    }
}

std::vector<ToolDescriptor> PersistentToolManager::get_available_tools() {
    std::vector<ToolDescriptor> tools;
    for (auto& r : residents_) {
        std::lock_guard<std::mutex> lock(r->op_mutex);
        if (!ensure_ready(*r)) continue;
        tools.insert(tools.end(), r->tools.begin(), r->tools.end());
    }
    return tools;
}

std::vector<ResourceDescriptor> PersistentToolManager::get_available_resources() {
    std::vector<ResourceDescriptor> resources;
    for (auto& r : residents_) {
        std::lock_guard<std::mutex> lock(r->op_mutex);
        if (!ensure_ready(*r)) continue;
        resources.insert(resources.end(), r->resources.begin(), r->resources.end());
    }
    return resources;
}

std::optional<ToolResult> PersistentToolManager::call_tool(const std::string& name,
                                                           const nlohmann::json& arguments,
                                                           std::chrono::milliseconds timeout) {
    std::vector<std::string> names;
    for (const auto& r : residents_) names.push_back(r->config.name);
    ToolAddress address = resolve_tool_address(name, names);

    for (auto& r : residents_) {
        if (!address.provider.empty() && r->config.name != address.provider) continue;

        std::lock_guard<std::mutex> lock(r->op_mutex);
        if (!ensure_ready(*r)) continue;

        ToolCatalog catalog(r->tools);
        const ToolDescriptor* tool = catalog.find(address.tool);
        if (!tool) continue;
        std::string tool_name = tool->name;

        emit(debug_category::AgentMcp, "Calling tool " + tool_name + " on " + r->config.name,
             {{"provider", r->config.name}, {"tool", tool_name}, {"arguments", arguments}});
        emit_tool_request(r->config.name, tool_name, arguments);

        int64_t started = monotonic_millis();
        try {
            ToolResult result = r->client->call_tool(tool_name, arguments, timeout);
            int64_t elapsed = monotonic_millis() - started;
            emit(debug_category::McpAgent, "Tool " + tool_name + " returned from " + r->config.name,
                 {{"provider", r->config.name}, {"tool", tool_name},
                  {"is_error", result.is_error}, {"result", truncate(result.text, 500)},
                  {"duration_ms", elapsed}});
            emit_tool_result(r->config.name, tool_name, !result.is_error, elapsed);
            return result;
        } catch (const ToolRelayError& e) {
            std::cerr << "[manager] Tool " << tool_name << " failed on "
                      << r->config.name << ": " << e.what() << "\n";
            emit_provider_failed(r->config.name, e);
            emit_tool_result(r->config.name, tool_name, false, monotonic_millis() - started);
        } catch (const std::exception& e) {
            // An unreadable reply counts as no result from this provider
            std::cerr << "[manager] Tool " << tool_name << " failed on "
                      << r->config.name << ": " << e.what() << "\n";
            emit_provider_failed(r->config.name, ToolRelayError(ErrorKind::Malformed, e.what()));
            emit_tool_result(r->config.name, tool_name, false, monotonic_millis() - started);
        }
    }

    std::cerr << "[manager] Tool " << name << " not found on any server\n";
    return std::nullopt;
}

std::map<std::string, StatusRecord> PersistentToolManager::get_server_status() {
    std::map<std::string, StatusRecord> status;
    for (auto& r : residents_) {
        StatusRecord record;
        record.type = manager_type();
        std::lock_guard<std::mutex> lock(r->op_mutex);
        if (r->client) {
            record.running = r->client->is_alive();
            record.connected = r->client->is_ready();
            record.pid = r->client->pid();
            record.exit_code = r->client->exit_code();
            record.state = connection_state_to_string(r->client->state());
        } else {
            record.state = connection_state_to_string(ProviderConnectionState::Unconnected);
        }
        status[r->config.name] = record;
    }
    return status;
}

int PersistentToolManager::restart_count(const std::string& provider) const {
    for (const auto& r : residents_) {
        if (r->config.name == provider) return r->connects > 0 ? r->connects - 1 : 0;
    }
    return 0;
}

void PersistentToolManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        if (stopped_) return;
        stopped_ = true;
        stopping_ = true;
    }
    monitor_cv_.notify_all();
    if (monitor_.joinable()) monitor_.join();

    for (auto& r : residents_) {
        std::lock_guard<std::mutex> lock(r->op_mutex);
        if (r->client) {
            r->client->dispose();
            std::cerr << "[manager] Stopped MCP server " << r->config.name << "\n";
        }
    }
    std::cerr << "[manager] All persistent MCP servers shut down\n";
}

} // namespace toolrelay
