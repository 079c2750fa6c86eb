#pragma once
#include "../model.hpp"
#include "../http.hpp"
#include <string>
#include <vector>

namespace toolrelay {

// Ollama's non-streaming /api/generate endpoint
class OllamaModel : public LanguageModel {
public:
    OllamaModel(HttpClient& http,
                const std::string& base_url = "http://localhost:11434",
                const std::string& model = "mistral",
                long timeout_seconds = 30);

    std::optional<std::string> generate(const std::string& prompt) override;
    std::string model_name() const override { return model_; }

    void set_model(const std::string& model) { model_ = model; }

    // Names from /api/tags. Throws ToolRelayError(ModelUnavailable) when the
    // service cannot be reached.
    std::vector<std::string> list_models();

    // Verify the service and the configured model. Falls back to the first
    // installed model when the configured one is missing. Returns false when
    // no model is usable.
    bool setup();

private:
    HttpClient& http_;
    std::string base_url_;
    std::string model_;
    long timeout_seconds_;
};

} // namespace toolrelay
