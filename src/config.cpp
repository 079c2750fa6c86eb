#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace toolrelay {

using ojson = nlohmann::ordered_json;

const char* manager_mode_to_string(ManagerMode mode) {
    switch (mode) {
        case ManagerMode::OnDemand: return "on_demand";
        case ManagerMode::Persistent: return "persistent";
    }
    return "on_demand";
}

ojson Config::defaults_json() {
    return {
        {"ollama", {
            {"host", "http://localhost:11434"},
            {"model", "mistral"},
            {"timeout", 30}
        }},
        {"manager", {
            {"mode", "on_demand"},
            {"handshake_timeout_ms", 10000},
            {"tool_timeout_ms", 30000},
            {"terminate_grace_ms", 5000},
            {"pipelined", false}
        }},
        {"debug", {
            {"max_events", 1000}
        }},
        {"mcpServers", ojson::object()}
    };
}

static ojson merge_defaults(const ojson& existing, const ojson& defaults) {
    ojson merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static constexpr uint64_t kU32Max = std::numeric_limits<uint32_t>::max();

// Accepts integer literals of either signedness. Negative or wrongly typed
// values keep the current value; values beyond uint32 are clamped.
static bool read_u32(const ojson& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key)) return false;
    const auto& value = obj[key];
    if (!value.is_number_integer()) {
        std::cerr << "[config] Ignoring " << key << ": expected a non-negative integer, got "
                  << value.dump() << "\n";
        return false;
    }
    uint64_t v;
    if (value.is_number_unsigned()) {
        v = value.get<uint64_t>();
    } else {
        int64_t signed_value = value.get<int64_t>();
        if (signed_value < 0) {
            std::cerr << "[config] Ignoring negative " << key << ": " << signed_value << "\n";
            return false;
        }
        v = static_cast<uint64_t>(signed_value);
    }
    if (v > kU32Max) {
        std::cerr << "[config] Clamping " << key << " to " << kU32Max << "\n";
        v = kU32Max;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static ProviderConfig parse_server(const std::string& name, const ojson& obj) {
    ProviderConfig server;
    server.name = name;
    if (obj.contains("command") && obj["command"].is_string())
        server.command = obj["command"].get<std::string>();
    if (obj.contains("args") && obj["args"].is_array()) {
        for (const auto& arg : obj["args"]) {
            if (arg.is_string()) server.args.push_back(arg.get<std::string>());
        }
    }
    if (obj.contains("env") && obj["env"].is_object()) {
        for (auto& [key, value] : obj["env"].items()) {
            if (value.is_string()) {
                server.env[key] = value.get<std::string>();
            } else if (!value.is_null()) {
                server.env[key] = value.dump();
            }
        }
    }
    if (obj.contains("cwd") && obj["cwd"].is_string())
        server.cwd = expand_home(obj["cwd"].get<std::string>());
    return server;
}

Config Config::from_json(const ojson& doc) {
    Config cfg;
    ojson j = merge_defaults(doc.is_object() ? doc : ojson::object(), defaults_json());

    auto& o = j["ollama"];
    if (o.is_object()) {
        if (o.contains("host") && o["host"].is_string())
            cfg.ollama.host = o["host"].get<std::string>();
        if (o.contains("model") && o["model"].is_string())
            cfg.ollama.model = o["model"].get<std::string>();
        read_u32(o, "timeout", cfg.ollama.timeout);
    }

    auto& m = j["manager"];
    if (m.is_object()) {
        if (m.contains("mode") && m["mode"].is_string()) {
            std::string mode = to_lower(m["mode"].get<std::string>());
            if (mode == "persistent" || mode == "resident") {
                cfg.manager.mode = ManagerMode::Persistent;
            } else if (mode != "on_demand" && mode != "on-demand") {
                std::cerr << "[config] Unknown manager mode '" << mode
                          << "', using on_demand\n";
            }
        }
        read_u32(m, "handshake_timeout_ms", cfg.manager.handshake_timeout_ms);
        read_u32(m, "tool_timeout_ms", cfg.manager.tool_timeout_ms);
        read_u32(m, "terminate_grace_ms", cfg.manager.terminate_grace_ms);
        if (m.contains("pipelined") && m["pipelined"].is_boolean())
            cfg.manager.pipelined = m["pipelined"].get<bool>();
    }

    auto& d = j["debug"];
    if (d.is_object()) read_u32(d, "max_events", cfg.debug.max_events);

    auto& servers = j["mcpServers"];
    if (servers.is_object()) {
        for (auto& [name, obj] : servers.items()) {
            if (!obj.is_object()) continue;
            ProviderConfig server = parse_server(name, obj);
            if (server.command.empty()) {
                std::cerr << "[config] Skipping server '" << name << "': no command\n";
                continue;
            }
            cfg.servers.push_back(std::move(server));
        }
    }

    return cfg;
}

Config Config::load(const std::string& path) {
    ojson j = defaults_json();

    std::string config_path = expand_home(path);
    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = ojson::parse(file);
        } catch (const std::exception& e) {
            // Config file is malformed — fall back to defaults
            std::cerr << "[config] Failed to parse " << config_path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        std::cerr << "[config] " << config_path
                  << " not found, using empty configuration\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("OLLAMA_HOST"))
        cfg.ollama.host = v;
    if (const char* v = std::getenv("OLLAMA_MODEL"))
        cfg.ollama.model = v;
    if (const char* v = std::getenv("TOOLRELAY_TOOL_TIMEOUT")) {
        // Reuse the JSON path so the env value gets the same checks
        ojson parsed = ojson::parse(v, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_number_integer()) {
            std::cerr << "[config] Ignoring invalid TOOLRELAY_TOOL_TIMEOUT: " << v << "\n";
        } else {
            read_u32(ojson{{"tool_timeout_ms", parsed}}, "tool_timeout_ms",
                     cfg.manager.tool_timeout_ms);
        }
    }

    for (const auto& server : cfg.servers) {
        std::cerr << "[config] Loaded MCP server config: " << server.name << "\n";
    }
    return cfg;
}

const ProviderConfig* Config::find_server(const std::string& name) const {
    for (const auto& server : servers) {
        if (server.name == name) return &server;
    }
    return nullptr;
}

} // namespace toolrelay
