#pragma once
#include <string>
#include <memory>

namespace memoria {

class HttpClient; // forward declare
struct Config;    // forward declare

// Abstract base class for LLM providers.
// Only single-shot completions are needed: fact extraction and summarization.
class Provider {
public:
    virtual ~Provider() = default;

    // Throws CollaboratorUnavailable on transport or HTTP errors.
    virtual std::string chat_simple(const std::string& system_prompt,
                                    const std::string& message,
                                    const std::string& model,
                                    double temperature) = 0;

    virtual std::string provider_name() const = 0;
};

// Create the configured LLM provider. Returns nullptr when no API key is
// available for it (fact extraction and summarization are then disabled).
std::unique_ptr<Provider> create_provider(const Config& config, HttpClient& http);

} // namespace memoria
