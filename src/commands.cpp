#include "commands.hpp"
#include "agent.hpp"
#include "debug_log.hpp"
#include "manager.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>

namespace toolrelay {

static constexpr size_t kDefaultDebugCount = 20;

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

static std::string format_events(const std::vector<DebugEvent>& events) {
    if (events.empty()) return "No debug events recorded.\n";
    std::string out;
    for (const auto& ev : events) {
        out += ev.timestamp + " [" + ev.category + "] " + ev.message + "\n";
    }
    return out;
}

std::string cmd_tools(ToolManager& manager) {
    auto tools = manager.get_available_tools();
    if (tools.empty()) return "No tools available.\n";
    std::string out = "Available tools (" + std::to_string(tools.size()) + "):\n";
    for (const auto& t : tools) {
        out += "  " + t.qualified_name() + "  " + t.description + "\n";
    }
    return out;
}

std::string cmd_resources(ToolManager& manager) {
    auto resources = manager.get_available_resources();
    if (resources.empty()) return "No resources available.\n";
    std::string out = "Available resources (" + std::to_string(resources.size()) + "):\n";
    for (const auto& r : resources) {
        out += "  " + r.name + " (" + r.provider + ")  " + r.uri + "\n";
    }
    return out;
}

std::string cmd_status(ToolManager& manager, const std::string& model_name) {
    std::string out = "Model: " + model_name + "\n"
        + "Manager: " + manager.manager_type() + "\n";
    auto status = manager.get_server_status();
    if (status.empty()) return out + "No MCP servers configured.\n";
    for (const auto& [name, s] : status) {
        out += "  " + name + ": " + s.state;
        if (s.running && s.pid) out += " (PID " + std::to_string(*s.pid) + ")";
        if (!s.running && s.exit_code) out += " (exit code " + std::to_string(*s.exit_code) + ")";
        out += "\n";
    }
    return out;
}

std::string cmd_debug(DebugLog& log, const std::string& args) {
    std::string arg = trim(args);
    if (arg.empty()) return format_events(log.recent(kDefaultDebugCount));
    if (arg == "clear") {
        log.clear();
        return "Debug log cleared.\n";
    }
    if (arg == "json") return log.to_json().dump(2) + "\n";
    if (all_digits(arg)) {
        if (arg.size() > 9) return format_events(log.snapshot());
        return format_events(log.recent(std::stoul(arg)));
    }
    return format_events(log.by_category(to_lower(arg)));
}

std::string cmd_timeout(Agent& agent, const std::string& args) {
    std::string arg = trim(args);
    if (arg.empty()) {
        return "Tool timeout: " + std::to_string(agent.tool_timeout().count()) + " ms\n";
    }
    if (!all_digits(arg) || arg.size() > 9 || std::stoul(arg) == 0) {
        return "Usage: /timeout [MS]  (a positive number of milliseconds)\n";
    }
    agent.set_tool_timeout(std::chrono::milliseconds(std::stoul(arg)));
    return "Tool timeout set to " + arg + " ms\n";
}

} // namespace toolrelay
