#include "provider.hpp"
#include "config.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include <iostream>

namespace memoria {

std::unique_ptr<Provider> create_provider(const Config& config, HttpClient& http) {
    const auto& name = config.llm.provider;
    if (name.empty()) return nullptr;

    auto& registry = PluginRegistry::instance();
    if (!registry.has_provider(name)) {
        std::cerr << "[provider] Unknown LLM provider: " << name << "\n";
        return nullptr;
    }

    std::string key = config.api_key_for(name);
    if (key.empty()) {
        std::cerr << "[provider] No API key for " << name
                  << ", fact extraction and summarization disabled\n";
        return nullptr;
    }

    return registry.create_provider(name, key, http, config.base_url_for(name),
                                    static_cast<long>(config.llm.timeout_seconds));
}

} // namespace memoria
