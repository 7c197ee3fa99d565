#include "memory.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include <algorithm>
#include <stdexcept>

namespace memoria {

double clamp_salience(double value) {
    return std::clamp(value, 0.0, 1.0);
}

std::string kind_to_string(MemoryKind kind) {
    switch (kind) {
        case MemoryKind::Preference: return "preference";
        case MemoryKind::Project:    return "project";
        case MemoryKind::Fact:       return "fact";
        case MemoryKind::Profile:    return "profile";
    }
    return "fact";
}

MemoryKind kind_from_string(const std::string& s) {
    if (s == "preference") return MemoryKind::Preference;
    if (s == "project")    return MemoryKind::Project;
    if (s == "profile")    return MemoryKind::Profile;
    return MemoryKind::Fact;
}

bool is_known_kind(const std::string& s) {
    return s == "preference" || s == "project" || s == "fact" || s == "profile";
}

std::unique_ptr<MemoryStore> create_memory_store(const Config& config) {
    const auto& backend = config.store.backend;
    auto& registry = PluginRegistry::instance();

    if (!registry.has_store(backend)) {
        throw std::invalid_argument("Unknown memory store backend: " + backend);
    }
    return registry.create_store(backend, config);
}

} // namespace memoria
