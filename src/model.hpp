#pragma once
#include <optional>
#include <string>

namespace toolrelay {

// Text-completion backend driving the agent. nullopt means "no usable
// reply" (unreachable service, HTTP error, empty completion).
class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    virtual std::optional<std::string> generate(const std::string& prompt) = 0;

    virtual std::string model_name() const = 0;
};

} // namespace toolrelay
