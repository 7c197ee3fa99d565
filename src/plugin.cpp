#include "plugin.hpp"
#include "memory.hpp"
#include "provider.hpp"
#include <stdexcept>
#include <algorithm>

namespace memoria {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_store(const std::string& name, StoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    stores_[name] = std::move(factory);
}

void PluginRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

std::unique_ptr<MemoryStore> PluginRegistry::create_store(const std::string& name,
                                                          const Config& config) const {
    StoreFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stores_.find(name);
        if (it == stores_.end()) {
            throw std::invalid_argument("Unknown store backend: " + name);
        }
        factory = it->second;
    }
    // Opening a store does I/O; do it outside the registry lock
    return factory(config);
}

std::unique_ptr<Provider> PluginRegistry::create_provider(const std::string& name,
                                                           const std::string& api_key,
                                                           HttpClient& http,
                                                           const std::string& base_url,
                                                           long timeout_seconds) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(name);
    if (it == providers_.end()) {
        throw std::invalid_argument("Unknown provider: " + name);
    }
    return it->second(api_key, http, base_url, timeout_seconds);
}

template <typename Map>
static std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& [name, _] : map) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(stores_);
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(providers_);
}

bool PluginRegistry::has_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.count(name) > 0;
}

bool PluginRegistry::has_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(name) > 0;
}

} // namespace memoria
