#include "openai.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

static memoria::ProviderRegistrar reg_openai("openai",
    [](const std::string& key, memoria::HttpClient& http, const std::string& base_url,
       long timeout_seconds) {
        return std::make_unique<memoria::OpenAIProvider>(key, http, base_url, timeout_seconds);
    });

using json = nlohmann::json;

namespace memoria {

OpenAIProvider::OpenAIProvider(const std::string& api_key, HttpClient& http,
                               const std::string& base_url, long timeout_seconds)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url),
      timeout_seconds_(timeout_seconds) {}

std::vector<Header> OpenAIProvider::build_headers() const {
    return {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"}
    };
}

std::string OpenAIProvider::chat_simple(const std::string& system_prompt,
                                         const std::string& message,
                                         const std::string& model,
                                         double temperature) {
    json request;
    request["model"] = model;
    request["temperature"] = temperature;

    json msgs = json::array();
    if (!system_prompt.empty()) {
        msgs.push_back({{"role", "system"}, {"content", system_prompt}});
    }
    msgs.push_back({{"role", "user"}, {"content", message}});
    request["messages"] = msgs;

    std::string url = base_url_ + "/chat/completions";
    auto response = http_.post(url, request.dump(-1, ' ', false, json::error_handler_t::replace),
                               build_headers(), timeout_seconds_);

    if (response.status_code == 0) {
        throw CollaboratorUnavailable(provider_name(), "no response from " + url);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw CollaboratorUnavailable(provider_name(), "HTTP " +
            std::to_string(response.status_code) + ": " + response.body);
    }

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw CollaboratorUnavailable(provider_name(),
                                      std::string("unparseable response: ") + e.what());
    }

    if (resp.contains("choices") && resp["choices"].is_array() && !resp["choices"].empty()) {
        const auto& choice = resp["choices"][0];
        if (choice.contains("message") && choice["message"].contains("content") &&
            choice["message"]["content"].is_string()) {
            return choice["message"]["content"].get<std::string>();
        }
    }

    return "";
}

} // namespace memoria
