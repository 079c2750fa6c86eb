#pragma once
#include "catalog.hpp"
#include "manager.hpp"
#include "model.hpp"
#include "tool.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace toolrelay {

class EventBus; // forward declaration

struct AgentOptions {
    std::chrono::milliseconds tool_timeout{30000};
};

// Outcome of scanning one model reply for tool directives
struct ToolCallOutcome {
    size_t recognized = 0;
    std::vector<std::string> result_lines;
};

// Fixed user-facing texts
extern const char* const kNoResponseMessage;
extern const char* const kNoBackendMessage;
extern const char* const kSynthesisFallbackPrefix;
extern const char* const kErrorMessagePrefix;

// Two-phase orchestration: choose resources and tools, let the model answer
// or emit tool directives, run them, then synthesize a final answer.
class Agent {
public:
    Agent(LanguageModel& model, ToolManager& tools, AgentOptions options = {});

    // Never throws; faults become an apology message
    std::string process_request(const std::string& query);

    // Phase 1. No model call when resources is empty.
    std::vector<std::string> determine_needed_resources(
        const std::string& query, const std::vector<ResourceDescriptor>& resources);

    // Phase 2. No model call when catalog is empty.
    std::vector<std::string> determine_needed_tools(
        const std::string& query, const std::vector<std::string>& needed_resources,
        const ToolCatalog& catalog);

    // Execute every directive found in response through the ToolManager
    ToolCallOutcome process_tool_calls(const std::string& response);

    std::string generate_final_response(const std::string& query,
                                        const std::string& tool_results);

    // Optional event bus integration (nullptr = disabled)
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    void set_tool_timeout(std::chrono::milliseconds timeout) { options_.tool_timeout = timeout; }
    std::chrono::milliseconds tool_timeout() const { return options_.tool_timeout; }

private:
    std::optional<std::string> ask_model(const std::string& phase, const std::string& prompt);
    void emit(const std::string& category, const std::string& message,
              nlohmann::json data = nlohmann::json::object()) const;

    LanguageModel& model_;
    ToolManager& tools_;
    AgentOptions options_;
    EventBus* event_bus_ = nullptr;
};

} // namespace toolrelay
