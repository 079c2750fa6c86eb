#include "ollama.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace toolrelay {

OllamaModel::OllamaModel(HttpClient& http, const std::string& base_url,
                         const std::string& model, long timeout_seconds)
    : http_(http), base_url_(base_url), model_(model), timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::optional<std::string> OllamaModel::generate(const std::string& prompt) {
    json request;
    request["model"] = model_;
    request["prompt"] = prompt;
    request["stream"] = false;

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(base_url_ + "/api/generate",
                               request.dump(-1, ' ', false, json::error_handler_t::replace),
                               headers, timeout_seconds_);

    if (response.status_code == 0) {
        std::cerr << "[ollama] Request failed: "
                  << (response.error.empty() ? "no response" : response.error) << "\n";
        return std::nullopt;
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        std::cerr << "[ollama] API error (HTTP " << response.status_code << "): "
                  << truncate(response.body, 200) << "\n";
        return std::nullopt;
    }

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::parse_error& e) {
        std::cerr << "[ollama] Invalid JSON response: " << e.what() << "\n";
        return std::nullopt;
    }

    if (!resp.is_object() || !resp.contains("response") || !resp["response"].is_string()) {
        std::cerr << "[ollama] Response has no text\n";
        return std::nullopt;
    }
    std::string text = resp["response"].get<std::string>();
    if (trim(text).empty()) return std::nullopt;
    return text;
}

std::vector<std::string> OllamaModel::list_models() {
    auto response = http_.get(base_url_ + "/api/tags", {}, timeout_seconds_);
    if (response.status_code != 200) {
        std::string why = response.status_code == 0
            ? response.error
            : "HTTP " + std::to_string(response.status_code);
        throw ToolRelayError(ErrorKind::ModelUnavailable,
            "Cannot reach Ollama at " + base_url_ + ": " + why);
    }

    std::vector<std::string> names;
    try {
        auto resp = json::parse(response.body);
        if (resp.contains("models") && resp["models"].is_array()) {
            for (const auto& m : resp["models"]) {
                if (m.contains("name") && m["name"].is_string())
                    names.push_back(m["name"].get<std::string>());
            }
        }
    } catch (const json::parse_error& e) {
        throw ToolRelayError(ErrorKind::ModelUnavailable,
            std::string("Invalid /api/tags response: ") + e.what());
    }
    return names;
}

bool OllamaModel::setup() {
    std::vector<std::string> models;
    try {
        models = list_models();
    } catch (const ToolRelayError& e) {
        std::cerr << "[ollama] " << e.what() << "\n";
        return false;
    }

    if (models.empty()) {
        std::cerr << "[ollama] No models installed. Run: ollama pull " << model_ << "\n";
        return false;
    }

    // "mistral" matches "mistral:latest"
    bool found = std::any_of(models.begin(), models.end(), [this](const std::string& m) {
        return m == model_ || m == model_ + ":latest";
    });
    if (!found) {
        std::cerr << "[ollama] Model " << model_ << " not found, using " << models.front() << "\n";
        model_ = models.front();
    }
    return true;
}

} // namespace toolrelay
