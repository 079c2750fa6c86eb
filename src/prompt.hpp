#pragma once
#include "tool.hpp"
#include <string>
#include <vector>

namespace toolrelay {

// "- name: description" per resource, or "No resources available"
std::string format_resources(const std::vector<ResourceDescriptor>& resources);

// "- name (provider): description" per tool, or "No tools available".
// With parameters, each tool is followed by its input schema.
std::string format_tools(const std::vector<ToolDescriptor>& tools,
                         bool include_parameters = false);

// Phase 1: ask for a comma-separated subset of resources or "none"
std::string build_resource_selection_prompt(const std::string& query,
                                            const std::vector<ResourceDescriptor>& resources);

// Phase 2: same for tools, mentioning the resources chosen in phase 1
std::string build_tool_selection_prompt(const std::string& query,
                                        const std::vector<std::string>& needed_resources,
                                        const std::vector<ToolDescriptor>& tools);

// Phase 3: answer directly or emit TOOL_CALL/PARAMETERS directives
std::string build_execution_prompt(const std::string& query,
                                   const std::vector<ToolDescriptor>& tools);

// Final call over the accumulated tool result lines
std::string build_synthesis_prompt(const std::string& query,
                                   const std::string& tool_results);

} // namespace toolrelay
