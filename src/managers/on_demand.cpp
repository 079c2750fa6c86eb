#include "on_demand.hpp"
#include "../catalog.hpp"
#include "../event.hpp"
#include "../util.hpp"

#include <future>
#include <iostream>

namespace toolrelay {

OnDemandToolManager::OnDemandToolManager(std::vector<ProviderConfig> providers,
                                         ManagerOptions options)
    : providers_(std::move(providers)), options_(options) {}

OnDemandToolManager::~OnDemandToolManager() {
    shutdown();
}

std::vector<ToolDescriptor> OnDemandToolManager::get_available_tools() {
    ClientOptions client_opts = options_.client_options();

    std::vector<std::future<std::vector<ToolDescriptor>>> futures;
    futures.reserve(providers_.size());
    for (const auto& provider : providers_) {
        futures.push_back(std::async(std::launch::async, [&provider, client_opts]() {
            ToolProviderClient client(provider, client_opts);
            client.connect();
            return client.list_tools();
        }));
    }

    // Results are merged in registration order regardless of finish order
    std::vector<ToolDescriptor> tools;
    for (size_t i = 0; i < futures.size(); i++) {
        const auto& name = providers_[i].name;
        try {
            auto provider_tools = futures[i].get();
            std::cerr << "[manager] " << name << ": " << provider_tools.size() << " tools\n";
            tools.insert(tools.end(), provider_tools.begin(), provider_tools.end());
        } catch (const ToolRelayError& e) {
            std::cerr << "[manager] Failed to get tools from " << name << ": "
                      << e.what() << "\n";
            emit_provider_failed(name, e);
        } catch (const std::exception& e) {
            std::cerr << "[manager] Failed to get tools from " << name << ": "
                      << e.what() << "\n";
        }
    }
    return tools;
}

std::vector<ResourceDescriptor> OnDemandToolManager::get_available_resources() {
    ClientOptions client_opts = options_.client_options();

    std::vector<std::future<std::vector<ResourceDescriptor>>> futures;
    futures.reserve(providers_.size());
    for (const auto& provider : providers_) {
        futures.push_back(std::async(std::launch::async, [&provider, client_opts]() {
            ToolProviderClient client(provider, client_opts);
            client.connect();
            return client.list_resources();
        }));
    }

    std::vector<ResourceDescriptor> resources;
    for (size_t i = 0; i < futures.size(); i++) {
        const auto& name = providers_[i].name;
        try {
            auto provider_resources = futures[i].get();
            resources.insert(resources.end(), provider_resources.begin(),
                             provider_resources.end());
        } catch (const ToolRelayError& e) {
            std::cerr << "[manager] Failed to get resources from " << name << ": "
                      << e.what() << "\n";
            emit_provider_failed(name, e);
        } catch (const std::exception& e) {
            std::cerr << "[manager] Failed to get resources from " << name << ": "
                      << e.what() << "\n";
        }
    }
    return resources;
}

std::optional<ToolResult> OnDemandToolManager::call_tool(const std::string& name,
                                                         const nlohmann::json& arguments,
                                                         std::chrono::milliseconds timeout) {
    std::vector<std::string> names;
    for (const auto& p : providers_) names.push_back(p.name);
    ToolAddress address = resolve_tool_address(name, names);

    for (const auto& provider : providers_) {
        if (!address.provider.empty() && provider.name != address.provider) continue;

        try {
            ToolProviderClient client(provider, options_.client_options());
            client.connect();

            // Only providers that advertise the tool get the call
            ToolCatalog catalog(client.list_tools());
            const ToolDescriptor* tool = catalog.find(address.tool);
            if (!tool) continue;

            emit(debug_category::AgentMcp, "Calling tool " + tool->name + " on " + provider.name,
                 {{"provider", provider.name}, {"tool", tool->name}, {"arguments", arguments}});
            emit_tool_request(provider.name, tool->name, arguments);

            int64_t started = monotonic_millis();
            ToolResult result = client.call_tool(tool->name, arguments, timeout);
            int64_t elapsed = monotonic_millis() - started;

            emit(debug_category::McpAgent, "Tool " + tool->name + " returned from " + provider.name,
                 {{"provider", provider.name}, {"tool", tool->name},
                  {"is_error", result.is_error}, {"result", truncate(result.text, 500)},
                  {"duration_ms", elapsed}});
            emit_tool_result(provider.name, tool->name, !result.is_error, elapsed);
            return result;
        } catch (const ToolRelayError& e) {
            std::cerr << "[manager] Tool " << address.tool << " failed on "
                      << provider.name << ": " << e.what() << "\n";
            emit_provider_failed(provider.name, e);
            emit_tool_result(provider.name, address.tool, false, 0);
        } catch (const std::exception& e) {
            // An unreadable reply counts as no result from this provider
            std::cerr << "[manager] Tool " << address.tool << " failed on "
                      << provider.name << ": " << e.what() << "\n";
            emit_provider_failed(provider.name, ToolRelayError(ErrorKind::Malformed, e.what()));
            emit_tool_result(provider.name, address.tool, false, 0);
        }
    }

    std::cerr << "[manager] Tool " << name << " not found on any server\n";
    return std::nullopt;
}

std::map<std::string, StatusRecord> OnDemandToolManager::get_server_status() {
    std::map<std::string, StatusRecord> status;
    for (const auto& provider : providers_) {
        // Spawned per request, so always reported as available
        StatusRecord record;
        record.running = true;
        record.connected = true;
        record.type = manager_type();
        record.state = "available";
        status[provider.name] = record;
    }
    return status;
}

void OnDemandToolManager::shutdown() {
    // Clients live only for the duration of a single operation
}

} // namespace toolrelay
