#include "catalog.hpp"
#include "util.hpp"

#include <algorithm>

namespace toolrelay {

ToolCatalog::ToolCatalog(std::vector<ToolDescriptor> tools)
    : tools_(std::move(tools)) {}

const ToolDescriptor* ToolCatalog::find(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name || tool.qualified_name() == name) return &tool;
    }
    std::string lowered = to_lower(name);
    for (const auto& tool : tools_) {
        if (to_lower(tool.name) == lowered || to_lower(tool.qualified_name()) == lowered)
            return &tool;
    }
    return nullptr;
}

std::vector<ToolDescriptor> ToolCatalog::select(const std::vector<std::string>& names) const {
    std::vector<ToolDescriptor> out;
    for (const auto& tool : tools_) {
        std::string bare = to_lower(tool.name);
        std::string qualified = to_lower(tool.qualified_name());
        bool wanted = std::any_of(names.begin(), names.end(), [&](const std::string& n) {
            std::string lowered = to_lower(trim(n));
            return lowered == bare || lowered == qualified;
        });
        if (!wanted) continue;
        bool seen = std::any_of(out.begin(), out.end(), [&](const ToolDescriptor& t) {
            return t.name == tool.name;
        });
        if (!seen) out.push_back(tool);
    }
    return out;
}

ToolAddress resolve_tool_address(const std::string& name,
                                 const std::vector<std::string>& provider_names) {
    auto colon = name.find(':');
    if (colon != std::string::npos && colon > 0 && colon + 1 < name.size()) {
        std::string provider = name.substr(0, colon);
        if (std::find(provider_names.begin(), provider_names.end(), provider) !=
            provider_names.end()) {
            return ToolAddress{provider, name.substr(colon + 1)};
        }
    }
    return ToolAddress{"", name};
}

} // namespace toolrelay
