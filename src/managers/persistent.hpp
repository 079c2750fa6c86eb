#pragma once
#include "../manager.hpp"
#include <condition_variable>
#include <mutex>
#include <thread>

namespace toolrelay {

// Keeps one client per provider alive for the manager's lifetime. A monitor
// thread polls liveness once a second; dead providers are respawned lazily
// on their next use.
class PersistentToolManager : public ToolManager {
public:
    PersistentToolManager(std::vector<ProviderConfig> providers, ManagerOptions options = {});
    ~PersistentToolManager() override;

    // Connect every provider and start the monitor. Returns how many came up.
    size_t start();

    std::vector<ToolDescriptor> get_available_tools() override;
    std::vector<ResourceDescriptor> get_available_resources() override;

    std::optional<ToolResult> call_tool(const std::string& name,
                                        const nlohmann::json& arguments,
                                        std::chrono::milliseconds timeout) override;

    std::map<std::string, StatusRecord> get_server_status() override;
    void shutdown() override;
    std::string manager_type() const override { return "persistent"; }
    size_t provider_count() const override { return residents_.size(); }

    // Number of times provider has been respawned after a failure
    int restart_count(const std::string& provider) const;

private:
    struct Resident {
        ProviderConfig config;
        std::mutex op_mutex; // serializes use of client
        std::unique_ptr<ToolProviderClient> client;
        std::vector<ToolDescriptor> tools;
        std::vector<ResourceDescriptor> resources;
        int connects = 0;
    };

    // Caller holds r.op_mutex
    bool ensure_ready(Resident& r);
    void monitor_loop();

    ManagerOptions options_;
    std::vector<std::unique_ptr<Resident>> residents_;

    std::thread monitor_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool stopping_ = false;
    bool stopped_ = false;
};

} // namespace toolrelay
