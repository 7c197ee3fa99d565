#pragma once
#include "openai.hpp"
#include <string>

namespace memoria {

// OpenRouter speaks the OpenAI protocol with attribution headers.
class OpenRouterProvider : public OpenAIProvider {
public:
    OpenRouterProvider(const std::string& api_key, HttpClient& http,
                       const std::string& base_url = "", long timeout_seconds = 60);

    std::string provider_name() const override { return "openrouter"; }

protected:
    std::vector<Header> build_headers() const override;
};

} // namespace memoria
