#pragma once
#include "tool.hpp"
#include <string>
#include <vector>

namespace toolrelay {

// Snapshot of the tools available for one request. Names may repeat across
// providers; lookups by bare name return the first registered owner.
class ToolCatalog {
public:
    ToolCatalog() = default;
    explicit ToolCatalog(std::vector<ToolDescriptor> tools);

    // Accepts "tool" or "provider:tool"; falls back to a case-insensitive
    // match on the bare name. nullptr when absent.
    const ToolDescriptor* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Descriptors whose name matches any entry of names, catalog order,
    // no duplicates
    std::vector<ToolDescriptor> select(const std::vector<std::string>& names) const;

    const std::vector<ToolDescriptor>& tools() const { return tools_; }
    size_t size() const { return tools_.size(); }
    bool empty() const { return tools_.empty(); }

private:
    std::vector<ToolDescriptor> tools_;
};

// Split "provider:tool" when provider names a registered provider;
// otherwise the whole string is the tool name and provider is empty.
struct ToolAddress {
    std::string provider;
    std::string tool;
};

ToolAddress resolve_tool_address(const std::string& name,
                                 const std::vector<std::string>& provider_names);

} // namespace toolrelay
