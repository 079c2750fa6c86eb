#include "prompt.hpp"
#include <sstream>

namespace toolrelay {

std::string format_resources(const std::vector<ResourceDescriptor>& resources) {
    if (resources.empty()) return "No resources available";

    std::ostringstream ss;
    for (size_t i = 0; i < resources.size(); i++) {
        const auto& r = resources[i];
        if (i > 0) ss << "\n";
        ss << "- " << r.name << ": "
           << (r.description.empty() ? "No description" : r.description);
    }
    return ss.str();
}

std::string format_tools(const std::vector<ToolDescriptor>& tools, bool include_parameters) {
    if (tools.empty()) return "No tools available";

    std::ostringstream ss;
    for (size_t i = 0; i < tools.size(); i++) {
        const auto& t = tools[i];
        if (i > 0) ss << "\n";
        ss << "- " << t.name << " (" << (t.provider.empty() ? "unknown" : t.provider) << "): "
           << t.description;
        if (include_parameters) {
            ss << "\n  Parameters: " << t.input_schema.dump();
        }
    }
    return ss.str();
}

std::string build_resource_selection_prompt(const std::string& query,
                                            const std::vector<ResourceDescriptor>& resources) {
    std::ostringstream ss;
    ss << "User request: " << query << "\n\n"
       << "Available resources:\n"
       << format_resources(resources) << "\n\n"
       << "Which of these resources do you need to fulfill this request?\n"
       << "Respond with a list of resource names separated by commas, "
       << "or 'none' if no resources are needed.\n\n"
       << "Only respond with the resource names, nothing else.\n";
    return ss.str();
}

std::string build_tool_selection_prompt(const std::string& query,
                                        const std::vector<std::string>& needed_resources,
                                        const std::vector<ToolDescriptor>& tools) {
    std::ostringstream ss;
    ss << "User request: " << query << "\n\n"
       << "Resources that will be available: ";
    if (needed_resources.empty()) {
        ss << "None";
    } else {
        for (size_t i = 0; i < needed_resources.size(); i++) {
            if (i > 0) ss << ", ";
            ss << needed_resources[i];
        }
    }
    ss << "\n\n"
       << "Available tools:\n"
       << format_tools(tools) << "\n\n"
       << "Which of these tools do you need to fulfill this request?\n"
       << "Respond with a list of tool names separated by commas, "
       << "or 'none' if no tools are needed.\n\n"
       << "Only respond with the tool names, nothing else.\n";
    return ss.str();
}

std::string build_execution_prompt(const std::string& query,
                                   const std::vector<ToolDescriptor>& tools) {
    std::ostringstream ss;
    ss << "User request: " << query << "\n\n";

    if (tools.empty()) {
        ss << "Provide a helpful response that addresses the user's request.\n";
        return ss.str();
    }

    ss << "Available tools for this request:\n"
       << format_tools(tools, true) << "\n\n"
       << "What should I do to fulfill this request? Use the available tools if needed.\n\n"
       << "IMPORTANT: If you need to call a tool, format your response EXACTLY like this:\n"
       << "TOOL_CALL: tool_name\n"
       << "PARAMETERS: {\"param1\": \"value1\", \"param2\": \"value2\"}\n\n"
       << "Rules:\n"
       << "1. Use the exact tool names from the available tools list\n"
       << "2. Provide valid JSON parameters (no extra text after the closing brace)\n"
       << "3. If no tools are needed, just provide a helpful response\n"
       << "4. Only call one tool at a time\n\n"
       << "Provide a helpful response that addresses the user's request.\n";
    return ss.str();
}

std::string build_synthesis_prompt(const std::string& query, const std::string& tool_results) {
    std::ostringstream ss;
    ss << "User request: " << query << "\n\n"
       << "Tool execution results:\n"
       << tool_results << "\n\n"
       << "Based on the tool results above, provide a helpful and complete response "
       << "to the user's request.\n"
       << "Summarize the key information from the tool results and answer their "
       << "question directly.\n";
    return ss.str();
}

} // namespace toolrelay
