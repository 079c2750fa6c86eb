#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolrelay {

// A tool advertised by a provider's tools/list
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
    std::string provider; // name of the provider that advertised it

    // "provider:tool", accepted by ToolManager::call_tool
    std::string qualified_name() const {
        return provider.empty() ? name : provider + ":" + name;
    }
};

// A resource advertised by a provider's resources/list
struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
    std::string provider;
};

// Outcome of tools/call. A provider-reported failure (isError) is still a
// result; transport failures are thrown instead.
struct ToolResult {
    std::string text;
    bool is_error = false;
    nlohmann::json raw; // the untouched "result" object
};

// Flatten a tools/call result's content array into text
ToolResult tool_result_from_json(const nlohmann::json& result);

ToolDescriptor tool_descriptor_from_json(const nlohmann::json& j, const std::string& provider);
ResourceDescriptor resource_descriptor_from_json(const nlohmann::json& j, const std::string& provider);

} // namespace toolrelay
