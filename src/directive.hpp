#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolrelay {

// One "TOOL_CALL: <name>" / "PARAMETERS: {...}" pair found in model output
struct ToolDirective {
    std::string tool_name;
    std::string raw_parameters;             // text handed to the JSON parser
    std::optional<nlohmann::json> arguments; // object, or nullopt if unparsable
    size_t begin = 0;                        // span of the directive in the text
    size_t end = 0;
};

// All directives in order of appearance. Tool names are [A-Za-z0-9_:.-]+.
// A directive whose PARAMETERS payload is missing, unbalanced or not a JSON
// object is still returned, with arguments unset.
std::vector<ToolDirective> parse_tool_directives(const std::string& text);

// Shortest balanced {...} starting at the first '{' at or after start.
// Braces inside JSON string literals do not count.
std::optional<std::string> extract_balanced_object(const std::string& text,
                                                   size_t start = 0);

// Drop trailing commas before } or ], the one repair we trust on model JSON
std::string repair_json(const std::string& json_str);

// Interpret a selection reply: lower-cased, trimmed, comma separated.
// Mentioning "none" or negative_phrase (e.g. "no tools") selects nothing.
std::vector<std::string> parse_selection(const std::string& reply,
                                         const std::string& negative_phrase);

// Fixed texts the agent feeds back into synthesis
std::string format_tool_result(const std::string& tool_name, const std::string& text);
std::string format_tool_failed(const std::string& tool_name);
std::string format_tool_error(const std::string& tool_name, const std::string& cause);
std::string format_parameters_unparsable(const std::string& tool_name);

} // namespace toolrelay
