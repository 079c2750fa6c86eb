#include "directive.hpp"
#include "util.hpp"
#include <cctype>

namespace toolrelay {

static const std::string kToolMarker = "TOOL_CALL:";
static const std::string kParamsMarker = "PARAMETERS:";

static bool is_tool_name_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == ':' || c == '.' || c == '-';
}

static size_t skip_whitespace(const std::string& s, size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
    return pos;
}

std::optional<std::string> extract_balanced_object(const std::string& text, size_t start) {
    size_t open = text.find('{', start);
    if (open == std::string::npos) return std::nullopt;

    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (size_t i = open; i < text.size(); i++) {
        char c = text[i];
        if (in_string) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            depth++;
        } else if (c == '}') {
            depth--;
            if (depth == 0) return text.substr(open, i - open + 1);
        }
    }
    return std::nullopt;
}

std::string repair_json(const std::string& json_str) {
    std::string result;
    result.reserve(json_str.size());
    bool in_string = false;
    bool escaped = false;
    for (size_t i = 0; i < json_str.size(); i++) {
        char c = json_str[i];
        if (in_string) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') in_string = false;
        } else if (c == '"') {
            in_string = true;
        } else if (c == ',') {
            // Look ahead past whitespace for } or ]
            size_t j = skip_whitespace(json_str, i + 1);
            if (j < json_str.size() && (json_str[j] == '}' || json_str[j] == ']')) {
                continue;
            }
        }
        result += c;
    }
    return result;
}

static std::optional<nlohmann::json> parse_arguments(const std::string& raw) {
    for (const std::string& candidate : {raw, repair_json(raw)}) {
        try {
            auto j = nlohmann::json::parse(candidate);
            if (j.is_object()) return j;
            return std::nullopt;
        } catch (const nlohmann::json::parse_error&) { // NOLINT(bugprone-empty-catch)
            // try the repaired form next
        }
    }
    return std::nullopt;
}

std::vector<ToolDirective> parse_tool_directives(const std::string& text) {
    std::vector<ToolDirective> directives;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t marker = text.find(kToolMarker, pos);
        if (marker == std::string::npos) break;

        size_t name_start = marker + kToolMarker.size();
        while (name_start < text.size() && (text[name_start] == ' ' || text[name_start] == '\t'))
            name_start++;
        size_t name_end = name_start;
        while (name_end < text.size() && is_tool_name_char(text[name_end])) name_end++;

        if (name_end == name_start) {
            pos = name_start;
            continue;
        }

        // PARAMETERS: must follow, separated only by whitespace
        size_t params = skip_whitespace(text, name_end);
        if (text.compare(params, kParamsMarker.size(), kParamsMarker) != 0) {
            pos = name_end;
            continue;
        }

        ToolDirective directive;
        directive.tool_name = text.substr(name_start, name_end - name_start);
        directive.begin = marker;

        size_t payload = skip_whitespace(text, params + kParamsMarker.size());
        if (payload < text.size() && text[payload] == '{') {
            auto object = extract_balanced_object(text, payload);
            if (object) {
                directive.raw_parameters = *object;
                directive.arguments = parse_arguments(*object);
                directive.end = payload + object->size();
            } else {
                // Unbalanced: the payload runs to the end of its line
                size_t eol = text.find('\n', payload);
                if (eol == std::string::npos) eol = text.size();
                directive.raw_parameters = text.substr(payload, eol - payload);
                directive.end = eol;
            }
        } else {
            size_t eol = text.find('\n', params);
            if (eol == std::string::npos) eol = text.size();
            size_t value = params + kParamsMarker.size();
            directive.raw_parameters = trim(text.substr(value, eol - value));
            directive.end = eol;
        }

        pos = directive.end > marker ? directive.end : name_end;
        directives.push_back(std::move(directive));
    }

    return directives;
}

std::vector<std::string> parse_selection(const std::string& reply,
                                         const std::string& negative_phrase) {
    std::vector<std::string> selected;
    std::string lowered = to_lower(trim(reply));
    if (lowered.empty()) return selected;
    if (lowered.find("none") != std::string::npos ||
        (!negative_phrase.empty() && lowered.find(to_lower(negative_phrase)) != std::string::npos)) {
        return selected;
    }
    for (const auto& part : split(lowered, ',')) {
        std::string item = trim(part);
        if (!item.empty()) selected.push_back(item);
    }
    return selected;
}

std::string format_tool_result(const std::string& tool_name, const std::string& text) {
    return "Tool '" + tool_name + "' result: " + text;
}

std::string format_tool_failed(const std::string& tool_name) {
    return "Tool '" + tool_name + "' failed to execute";
}

std::string format_tool_error(const std::string& tool_name, const std::string& cause) {
    return "Tool '" + tool_name + "' execution failed: " + cause;
}

std::string format_parameters_unparsable(const std::string& tool_name) {
    return "Tool '" + tool_name + "' parameters could not be parsed";
}

} // namespace toolrelay
