#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace toolrelay {

// Launch configuration of one tool provider process. Read-only after load;
// shared freely between concurrently spawned clients.
struct ProviderConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // overlay, wins over inherited env
    std::optional<std::string> cwd;
};

enum class ManagerMode { OnDemand, Persistent };

struct OllamaConfig {
    std::string host = "http://localhost:11434";
    std::string model = "mistral";
    uint32_t timeout = 30; // seconds
};

struct ManagerConfig {
    ManagerMode mode = ManagerMode::OnDemand;
    uint32_t handshake_timeout_ms = 10000;
    uint32_t tool_timeout_ms = 30000;
    uint32_t terminate_grace_ms = 5000;
    bool pipelined = false;
};

struct DebugConfig {
    uint32_t max_events = 1000;
};

struct Config {
    OllamaConfig ollama;
    ManagerConfig manager;
    DebugConfig debug;

    // Registration order == order of appearance in mcpServers
    std::vector<ProviderConfig> servers;

    // Load from path (default ./config.json) + env vars
    static Config load(const std::string& path = "config.json");

    // Parse an already-decoded document (no env overrides)
    static Config from_json(const nlohmann::ordered_json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::ordered_json defaults_json();

    // Lookup by provider name, nullptr if absent
    const ProviderConfig* find_server(const std::string& name) const;
};

const char* manager_mode_to_string(ManagerMode mode);

} // namespace toolrelay
