#include <catch2/catch.hpp>
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace toolrelay;
using ojson = nlohmann::ordered_json;

namespace {

struct TempConfigFile {
    std::string path;

    explicit TempConfigFile(const std::string& content) {
        path = (std::filesystem::temp_directory_path() /
                ("toolrelay_cfg_" + std::to_string(getpid()) + ".json")).string();
        std::ofstream out(path);
        out << content;
    }
    ~TempConfigFile() { std::filesystem::remove(path); }
};

struct EnvGuard {
    std::string name;
    EnvGuard(const std::string& n, const std::string& value) : name(n) {
        setenv(name.c_str(), value.c_str(), 1);
    }
    ~EnvGuard() { unsetenv(name.c_str()); }
};

} // namespace

// ── Defaults ─────────────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.ollama.host == "http://localhost:11434");
    REQUIRE(cfg.ollama.model == "mistral");
    REQUIRE(cfg.ollama.timeout == 30);
    REQUIRE(cfg.manager.mode == ManagerMode::OnDemand);
    REQUIRE(cfg.manager.handshake_timeout_ms == 10000);
    REQUIRE(cfg.manager.tool_timeout_ms == 30000);
    REQUIRE(cfg.manager.terminate_grace_ms == 5000);
    REQUIRE_FALSE(cfg.manager.pipelined);
    REQUIRE(cfg.debug.max_events == 1000);
    REQUIRE(cfg.servers.empty());
}

TEST_CASE("Config::from_json: empty document gives defaults", "[config]") {
    Config cfg = Config::from_json(ojson::object());
    REQUIRE(cfg.ollama.model == "mistral");
    REQUIRE(cfg.servers.empty());
}

TEST_CASE("Config::from_json: non-object document gives defaults", "[config]") {
    Config cfg = Config::from_json(ojson::array());
    REQUIRE(cfg.manager.tool_timeout_ms == 30000);
}

// ── Sections ─────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads ollama and manager sections", "[config]") {
    ojson j = {
        {"ollama", {{"host", "http://gpu:11434"}, {"model", "llama3"}, {"timeout", 90}}},
        {"manager", {{"mode", "persistent"}, {"tool_timeout_ms", 500},
                     {"handshake_timeout_ms", 2000}, {"terminate_grace_ms", 100},
                     {"pipelined", true}}},
        {"debug", {{"max_events", 50}}}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.ollama.host == "http://gpu:11434");
    REQUIRE(cfg.ollama.model == "llama3");
    REQUIRE(cfg.ollama.timeout == 90);
    REQUIRE(cfg.manager.mode == ManagerMode::Persistent);
    REQUIRE(cfg.manager.tool_timeout_ms == 500);
    REQUIRE(cfg.manager.handshake_timeout_ms == 2000);
    REQUIRE(cfg.manager.terminate_grace_ms == 100);
    REQUIRE(cfg.manager.pipelined);
    REQUIRE(cfg.debug.max_events == 50);
}

TEST_CASE("Config::from_json: unknown mode falls back to on_demand", "[config]") {
    ojson j = {{"manager", {{"mode", "sometimes"}}}};
    REQUIRE(Config::from_json(j).manager.mode == ManagerMode::OnDemand);
}

TEST_CASE("Config::from_json: negative or wrongly typed numbers ignored", "[config]") {
    ojson j = {{"manager", {{"tool_timeout_ms", -5}, {"handshake_timeout_ms", "fast"}}}};
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.manager.tool_timeout_ms == 30000);
    REQUIRE(cfg.manager.handshake_timeout_ms == 10000);
}

TEST_CASE("Config::from_json: values beyond 32 bits are clamped", "[config]") {
    ojson j = {{"manager", {{"tool_timeout_ms", 5000000000LL}}},
               {"debug", {{"max_events", 18446744073709551615ULL}}}};
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.manager.tool_timeout_ms == 4294967295u);
    REQUIRE(cfg.debug.max_events == 4294967295u);
}

// ── mcpServers ───────────────────────────────────────────────────

TEST_CASE("Config::from_json: servers keep document order", "[config]") {
    ojson j = ojson::parse(R"({
        "mcpServers": {
            "zeta":  {"command": "z"},
            "alpha": {"command": "a"},
            "mid":   {"command": "m"}
        }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.servers.size() == 3);
    REQUIRE(cfg.servers[0].name == "zeta");
    REQUIRE(cfg.servers[1].name == "alpha");
    REQUIRE(cfg.servers[2].name == "mid");
}

TEST_CASE("Config::from_json: server fields parsed", "[config]") {
    ojson j = ojson::parse(R"({
        "mcpServers": {
            "weather": {
                "command": "node",
                "args": ["server.js", "--port", 7],
                "env": {"API_KEY": "secret", "RETRIES": 3, "UNSET": null},
                "cwd": "/srv/weather"
            }
        }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.servers.size() == 1);
    const auto& s = cfg.servers[0];
    REQUIRE(s.command == "node");
    REQUIRE(s.args.size() == 2);
    REQUIRE(s.args[0] == "server.js");
    REQUIRE(s.args[1] == "--port");
    REQUIRE(s.env.at("API_KEY") == "secret");
    REQUIRE(s.env.at("RETRIES") == "3");
    REQUIRE(s.env.count("UNSET") == 0);
    REQUIRE(s.cwd.has_value());
    REQUIRE(*s.cwd == "/srv/weather");
}

TEST_CASE("Config::from_json: server without command is skipped", "[config]") {
    ojson j = ojson::parse(R"({
        "mcpServers": {
            "broken": {"args": ["x"]},
            "ok": {"command": "ok-server"},
            "junk": 42
        }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.servers.size() == 1);
    REQUIRE(cfg.servers[0].name == "ok");
}

TEST_CASE("Config::find_server: lookup by name", "[config]") {
    ojson j = ojson::parse(R"({"mcpServers": {"a": {"command": "x"}}})");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.find_server("a") != nullptr);
    REQUIRE(cfg.find_server("a")->command == "x");
    REQUIRE(cfg.find_server("b") == nullptr);
}

// ── load ─────────────────────────────────────────────────────────

TEST_CASE("Config::load: missing file gives empty configuration", "[config]") {
    Config cfg = Config::load("/nonexistent/toolrelay/config.json");
    REQUIRE(cfg.servers.empty());
    REQUIRE(cfg.manager.mode == ManagerMode::OnDemand);
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    TempConfigFile file("{ not json");
    Config cfg = Config::load(file.path);
    REQUIRE(cfg.servers.empty());
    REQUIRE(cfg.ollama.model == "mistral");
}

TEST_CASE("Config::load: reads servers from file", "[config]") {
    TempConfigFile file(R"({"mcpServers": {"files": {"command": "mcp-files", "args": ["/tmp"]}}})");
    Config cfg = Config::load(file.path);
    REQUIRE(cfg.servers.size() == 1);
    REQUIRE(cfg.servers[0].name == "files");
    REQUIRE(cfg.servers[0].args[0] == "/tmp");
}

TEST_CASE("Config::load: environment overrides file", "[config]") {
    TempConfigFile file(R"({"ollama": {"host": "http://file:1", "model": "file-model"}})");
    EnvGuard host("OLLAMA_HOST", "http://env:2");
    EnvGuard model("OLLAMA_MODEL", "env-model");
    EnvGuard timeout("TOOLRELAY_TOOL_TIMEOUT", "1234");
    Config cfg = Config::load(file.path);
    REQUIRE(cfg.ollama.host == "http://env:2");
    REQUIRE(cfg.ollama.model == "env-model");
    REQUIRE(cfg.manager.tool_timeout_ms == 1234);
}

TEST_CASE("Config::load: invalid timeout override ignored", "[config]") {
    EnvGuard timeout("TOOLRELAY_TOOL_TIMEOUT", "soon");
    Config cfg = Config::load("/nonexistent/toolrelay/config.json");
    REQUIRE(cfg.manager.tool_timeout_ms == 30000);
}

TEST_CASE("Config::load: negative timeout override ignored", "[config]") {
    EnvGuard timeout("TOOLRELAY_TOOL_TIMEOUT", "-5");
    Config cfg = Config::load("/nonexistent/toolrelay/config.json");
    REQUIRE(cfg.manager.tool_timeout_ms == 30000);
}

TEST_CASE("Config::load: oversized timeout override clamped", "[config]") {
    EnvGuard timeout("TOOLRELAY_TOOL_TIMEOUT", "99999999999");
    Config cfg = Config::load("/nonexistent/toolrelay/config.json");
    REQUIRE(cfg.manager.tool_timeout_ms == 4294967295u);
}

TEST_CASE("manager_mode_to_string: names both modes", "[config]") {
    REQUIRE(std::string(manager_mode_to_string(ManagerMode::OnDemand)) == "on_demand");
    REQUIRE(std::string(manager_mode_to_string(ManagerMode::Persistent)) == "persistent");
}
