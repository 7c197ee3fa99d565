#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <string>
#include <vector>

namespace memoria {

// OpenAI-compatible /chat/completions client.
class OpenAIProvider : public Provider {
public:
    OpenAIProvider(const std::string& api_key, HttpClient& http,
                   const std::string& base_url = "", long timeout_seconds = 60);

    std::string chat_simple(const std::string& system_prompt,
                            const std::string& message,
                            const std::string& model,
                            double temperature) override;

    std::string provider_name() const override { return "openai"; }

protected:
    virtual std::vector<Header> build_headers() const;

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
};

} // namespace memoria
