#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace toolrelay {

// Tag-based event dispatch — no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* Debug            = "Debug";
    constexpr const char* ToolCallRequest  = "ToolCallRequest";
    constexpr const char* ToolCallResult   = "ToolCallResult";
    constexpr const char* ProviderFailed   = "ProviderFailed";
} // namespace event_tags

// Debug categories used across the core
namespace debug_category {
    constexpr const char* Agent    = "agent";
    constexpr const char* AgentLlm = "agent-llm";
    constexpr const char* LlmAgent = "llm-agent";
    constexpr const char* AgentMcp = "agent-mcp";
    constexpr const char* McpAgent = "mcp-agent";
} // namespace debug_category

// ── Event structs ───────────────────────────────────────────────

// Timestamped record of an agent/model/provider interaction
struct DebugEvent : Event {
    static constexpr const char* TAG = event_tags::Debug;
    std::string timestamp;
    std::string category;
    std::string message;
    nlohmann::json data = nlohmann::json::object();

    DebugEvent() { type_tag = TAG; }
};

struct ToolCallRequestEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallRequest;
    std::string provider;
    std::string tool_name;
    nlohmann::json arguments;

    ToolCallRequestEvent() { type_tag = TAG; }
};

struct ToolCallResultEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallResult;
    std::string provider;
    std::string tool_name;
    bool success = false;
    int64_t duration_ms = 0;

    ToolCallResultEvent() { type_tag = TAG; }
};

struct ProviderFailedEvent : Event {
    static constexpr const char* TAG = event_tags::ProviderFailed;
    std::string provider;
    std::string kind; // error_kind_to_string()
    std::string message;

    ProviderFailedEvent() { type_tag = TAG; }
};

} // namespace toolrelay
