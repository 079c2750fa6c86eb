#include "agent.hpp"
#include "directive.hpp"
#include "event_bus.hpp"
#include "prompt.hpp"
#include "util.hpp"
#include <iostream>
#include <sstream>

namespace toolrelay {

const char* const kNoResponseMessage = "I couldn't generate a response for your request.";
const char* const kNoBackendMessage =
    "No tools or language model are available right now. "
    "Check that Ollama is running and that MCP servers are configured.";
const char* const kSynthesisFallbackPrefix =
    "I executed the requested tools but couldn't generate a final response. "
    "Here are the tool results:\n\n";
const char* const kErrorMessagePrefix =
    "I encountered an error while processing your request: ";

Agent::Agent(LanguageModel& model, ToolManager& tools, AgentOptions options)
    : model_(model), tools_(tools), options_(options) {}

void Agent::emit(const std::string& category, const std::string& message,
                 nlohmann::json data) const {
    publish_debug(event_bus_, category, message, std::move(data));
}

std::optional<std::string> Agent::ask_model(const std::string& phase, const std::string& prompt) {
    emit(debug_category::AgentLlm, "Sending " + phase + " prompt",
         {{"phase", phase}, {"prompt", prompt}, {"model", model_.model_name()}});

    std::optional<std::string> reply = model_.generate(prompt);

    if (reply) {
        emit(debug_category::LlmAgent, "Received " + phase + " reply",
             {{"phase", phase}, {"response", *reply}});
    } else {
        emit(debug_category::LlmAgent, "No " + phase + " reply", {{"phase", phase}});
    }
    return reply;
}

std::vector<std::string> Agent::determine_needed_resources(
    const std::string& query, const std::vector<ResourceDescriptor>& resources) {
    if (resources.empty()) return {};

    auto reply = ask_model("resource selection",
                           build_resource_selection_prompt(query, resources));
    if (!reply) return {};

    auto selected = parse_selection(*reply, "no resources");
    emit(debug_category::Agent, "Determined needed resources", {{"resources", selected}});
    return selected;
}

std::vector<std::string> Agent::determine_needed_tools(
    const std::string& query, const std::vector<std::string>& needed_resources,
    const ToolCatalog& catalog) {
    if (catalog.empty()) return {};

    auto reply = ask_model("tool selection",
                           build_tool_selection_prompt(query, needed_resources, catalog.tools()));
    if (!reply) return {};

    auto selected = parse_selection(*reply, "no tools");
    emit(debug_category::Agent, "Determined needed tools", {{"tools", selected}});
    return selected;
}

ToolCallOutcome Agent::process_tool_calls(const std::string& response) {
    ToolCallOutcome outcome;
    auto directives = parse_tool_directives(response);
    outcome.recognized = directives.size();

    for (const auto& directive : directives) {
        const std::string& name = directive.tool_name;
        if (!directive.arguments) {
            std::cerr << "[agent] Could not parse parameters for " << name << ": "
                      << truncate(directive.raw_parameters, 200) << "\n";
            outcome.result_lines.push_back(format_parameters_unparsable(name));
            continue;
        }

        try {
            auto result = tools_.call_tool(name, *directive.arguments, options_.tool_timeout);
            if (result) {
                outcome.result_lines.push_back(format_tool_result(name, result->text));
            } else {
                outcome.result_lines.push_back(format_tool_failed(name));
            }
        } catch (const std::exception& e) {
            std::cerr << "[agent] Tool " << name << " execution failed: " << e.what() << "\n";
            outcome.result_lines.push_back(format_tool_error(name, e.what()));
        }
    }
    return outcome;
}

std::string Agent::generate_final_response(const std::string& query,
                                           const std::string& tool_results) {
    auto reply = ask_model("synthesis", build_synthesis_prompt(query, tool_results));
    if (!reply) return kSynthesisFallbackPrefix + tool_results;
    return *reply;
}

std::string Agent::process_request(const std::string& query) {
    emit(debug_category::Agent, "Processing request", {{"query", query}});

    try {
        // One catalog per request, shared by every phase
        std::vector<ResourceDescriptor> resources;
        ToolCatalog catalog;
        if (tools_.provider_count() > 0) {
            resources = tools_.get_available_resources();
            catalog = ToolCatalog(tools_.get_available_tools());
        }
        emit(debug_category::Agent, "Catalog ready",
             {{"tools", catalog.size()}, {"resources", resources.size()}});

        auto needed_resources = determine_needed_resources(query, resources);
        auto tool_names = determine_needed_tools(query, needed_resources, catalog);
        auto relevant = catalog.select(tool_names);

        auto response = ask_model("execution", build_execution_prompt(query, relevant));
        if (!response) {
            if (tools_.provider_count() == 0) return kNoBackendMessage;
            return kNoResponseMessage;
        }

        if (catalog.empty()) return *response;

        ToolCallOutcome outcome = process_tool_calls(*response);
        if (outcome.recognized == 0) return *response;

        std::ostringstream results;
        for (size_t i = 0; i < outcome.result_lines.size(); i++) {
            if (i > 0) results << "\n";
            results << outcome.result_lines[i];
        }
        emit(debug_category::Agent, "Tool calls processed",
             {{"count", outcome.recognized}, {"results", outcome.result_lines}});

        return generate_final_response(query, results.str());
    } catch (const std::exception& e) {
        std::cerr << "[agent] Request failed: " << e.what() << "\n";
        emit(debug_category::Agent, "Request failed", {{"error", e.what()}});
        return std::string(kErrorMessagePrefix) + e.what();
    }
}

} // namespace toolrelay
