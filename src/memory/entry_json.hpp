#pragma once
#include "../memory.hpp"
#include <nlohmann/json.hpp>

namespace memoria {

// Shared JSON <-> Memory conversion used by JsonStore (whole records) and
// SqliteStore (tags and source columns).

inline nlohmann::json source_to_json(const MemorySource& source) {
    nlohmann::json j = {{"origin", source.origin}};
    if (!source.reference_id.empty()) j["reference_id"] = source.reference_id;
    if (source.extracted_at != 0) j["extracted_at"] = source.extracted_at;
    return j;
}

inline MemorySource source_from_json(const nlohmann::json& j) {
    MemorySource source;
    if (!j.is_object()) return source;
    source.origin = j.value("origin", "");
    source.reference_id = j.value("reference_id", "");
    source.extracted_at = j.value("extracted_at", uint64_t{0});
    return source;
}

inline std::vector<std::string> tags_from_json(const nlohmann::json& j) {
    std::vector<std::string> tags;
    if (!j.is_array()) return tags;
    for (const auto& t : j) {
        if (t.is_string()) tags.push_back(t.get<std::string>());
    }
    return tags;
}

inline Memory memory_from_json(const nlohmann::json& item) {
    Memory m;
    m.id = item.value("id", "");
    m.owner = item.value("owner", "");
    m.content = item.value("content", "");
    m.kind = kind_from_string(item.value("kind", "fact"));
    if (item.contains("tags")) m.tags = tags_from_json(item["tags"]);
    if (item.contains("embedding") && item["embedding"].is_array()) {
        for (const auto& v : item["embedding"]) {
            if (v.is_number()) m.embedding.push_back(v.get<float>());
        }
    }
    m.salience = clamp_salience(item.value("salience", kDefaultSalience));
    if (item.contains("decay_at") && item["decay_at"].is_number_unsigned()) {
        m.decay_at = item["decay_at"].get<uint64_t>();
    }
    m.created_at = item.value("created_at", uint64_t{0});
    m.updated_at = item.value("updated_at", uint64_t{0});
    if (item.contains("source")) m.source = source_from_json(item["source"]);
    return m;
}

inline nlohmann::json memory_to_json(const Memory& m) {
    nlohmann::json item = {
        {"id", m.id},
        {"owner", m.owner},
        {"content", m.content},
        {"kind", kind_to_string(m.kind)},
        {"tags", m.tags},
        {"embedding", m.embedding},
        {"salience", m.salience},
        {"created_at", m.created_at},
        {"updated_at", m.updated_at},
        {"source", source_to_json(m.source)}
    };
    if (m.decay_at) item["decay_at"] = *m.decay_at;
    return item;
}

} // namespace memoria
