#pragma once
#include "../manager.hpp"

namespace toolrelay {

// Spawns a fresh provider process for every operation and disposes it
// before returning. Nothing survives between calls.
class OnDemandToolManager : public ToolManager {
public:
    OnDemandToolManager(std::vector<ProviderConfig> providers, ManagerOptions options = {});
    ~OnDemandToolManager() override;

    // Providers are queried concurrently
    std::vector<ToolDescriptor> get_available_tools() override;
    std::vector<ResourceDescriptor> get_available_resources() override;

    std::optional<ToolResult> call_tool(const std::string& name,
                                        const nlohmann::json& arguments,
                                        std::chrono::milliseconds timeout) override;

    std::map<std::string, StatusRecord> get_server_status() override;
    void shutdown() override;
    std::string manager_type() const override { return "on_demand"; }
    size_t provider_count() const override { return providers_.size(); }

private:
    std::vector<ProviderConfig> providers_;
    ManagerOptions options_;
};

} // namespace toolrelay
