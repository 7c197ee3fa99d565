#include "openrouter.hpp"
#include "../plugin.hpp"

static memoria::ProviderRegistrar reg_openrouter("openrouter",
    [](const std::string& key, memoria::HttpClient& http, const std::string& base_url,
       long timeout_seconds) {
        return std::make_unique<memoria::OpenRouterProvider>(key, http, base_url,
                                                             timeout_seconds);
    });

namespace memoria {

OpenRouterProvider::OpenRouterProvider(const std::string& api_key, HttpClient& http,
                                       const std::string& base_url, long timeout_seconds)
    : OpenAIProvider(api_key, http,
                     base_url.empty() ? "https://openrouter.ai/api/v1" : base_url,
                     timeout_seconds) {}

std::vector<Header> OpenRouterProvider::build_headers() const {
    auto headers = OpenAIProvider::build_headers();
    headers.emplace_back("X-Title", "Memoria Memory Consolidation");
    return headers;
}

} // namespace memoria
