#pragma once
#include "config.hpp"
#include "http.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace memoria {

class MemoryStore; // forward declaration
class Provider;    // forward declaration

// Factory function types
using StoreFactory = std::function<std::unique_ptr<MemoryStore>(const Config& config)>;

using ProviderFactory = std::function<std::unique_ptr<Provider>(
    const std::string& api_key, HttpClient& http, const std::string& base_url,
    long timeout_seconds)>;

// Central registry for self-registering backends.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_store(const std::string& name, StoreFactory factory);
    void register_provider(const std::string& name, ProviderFactory factory);

    // Creation. Both throw std::invalid_argument for unknown names.
    std::unique_ptr<MemoryStore> create_store(const std::string& name,
                                              const Config& config) const;

    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              const std::string& api_key,
                                              HttpClient& http,
                                              const std::string& base_url,
                                              long timeout_seconds) const;

    // Query
    std::vector<std::string> store_names() const;
    std::vector<std::string> provider_names() const;
    bool has_store(const std::string& name) const;
    bool has_provider(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoreFactory> stores_;
    std::unordered_map<std::string, ProviderFactory> providers_;
};

// ── Self-registrar helpers (used at file scope in each backend .cpp) ──

struct StoreRegistrar {
    StoreRegistrar(const std::string& name, StoreFactory factory) {
        PluginRegistry::instance().register_store(name, std::move(factory));
    }
};

struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

} // namespace memoria
