#include "tool.hpp"

namespace toolrelay {

ToolDescriptor tool_descriptor_from_json(const nlohmann::json& j, const std::string& provider) {
    ToolDescriptor tool;
    tool.provider = provider;
    if (j.contains("name") && j["name"].is_string())
        tool.name = j["name"].get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        tool.description = j["description"].get<std::string>();
    if (j.contains("inputSchema") && j["inputSchema"].is_object())
        tool.input_schema = j["inputSchema"];
    else
        tool.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    return tool;
}

ResourceDescriptor resource_descriptor_from_json(const nlohmann::json& j, const std::string& provider) {
    ResourceDescriptor res;
    res.provider = provider;
    if (j.contains("uri") && j["uri"].is_string())
        res.uri = j["uri"].get<std::string>();
    if (j.contains("name") && j["name"].is_string())
        res.name = j["name"].get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        res.description = j["description"].get<std::string>();
    if (j.contains("mimeType") && j["mimeType"].is_string())
        res.mime_type = j["mimeType"].get<std::string>();
    if (res.name.empty()) res.name = res.uri;
    return res;
}

// Member as a string, or fallback when absent or of another type
static std::string string_field(const nlohmann::json& obj, const char* key,
                                const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

static std::string dump_lenient(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

static std::string content_item_text(const nlohmann::json& item) {
    if (!item.is_object()) return dump_lenient(item);
    std::string type = string_field(item, "type", "");
    if (type == "text" && item.contains("text") && item["text"].is_string()) {
        return item["text"].get<std::string>();
    }
    if (type == "image" || type == "audio") {
        return "[" + type + ": " + string_field(item, "mimeType", "unknown") + "]";
    }
    if (type == "resource" && item.contains("resource") && item["resource"].is_object()) {
        const auto& res = item["resource"];
        if (res.contains("text") && res["text"].is_string())
            return res["text"].get<std::string>();
        return "[resource: " + string_field(res, "uri", "") + "]";
    }
    return dump_lenient(item);
}

ToolResult tool_result_from_json(const nlohmann::json& result) {
    ToolResult out;
    out.raw = result;
    if (!result.is_object()) {
        out.text = result.is_string() ? result.get<std::string>() : dump_lenient(result);
        return out;
    }

    if (result.contains("isError") && result["isError"].is_boolean())
        out.is_error = result["isError"].get<bool>();

    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& item : result["content"]) {
            std::string text = content_item_text(item);
            if (text.empty()) continue;
            if (!out.text.empty()) out.text += "\n";
            out.text += text;
        }
    }

    if (out.text.empty() && result.contains("structuredContent"))
        out.text = dump_lenient(result["structuredContent"]);
    if (out.text.empty())
        out.text = "Tool executed successfully";
    return out;
}

} // namespace toolrelay
