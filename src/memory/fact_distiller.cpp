#include "fact_distiller.hpp"
#include "../util.hpp"
#include <iostream>
#include <regex>
#include <utility>

namespace memoria {

const std::vector<std::string>& transient_patterns() {
    static const std::vector<std::string> patterns = {
        R"(\b(today|tomorrow|yesterday|this week|next week)\b)",
        R"(\b(help me|can you|what is|how do)\b)",
        R"(\b(right now|currently)\b)",
    };
    return patterns;
}

static const std::vector<std::regex>& compiled_transient_patterns() {
    static const std::vector<std::regex> compiled = [] {
        std::vector<std::regex> out;
        for (const auto& p : transient_patterns()) {
            out.emplace_back(p, std::regex::ECMAScript | std::regex::icase);
        }
        return out;
    }();
    return compiled;
}

bool is_transient(const std::string& text) {
    for (const auto& re : compiled_transient_patterns()) {
        if (std::regex_search(text, re)) return true;
    }
    return false;
}

std::string render_transcript(const std::vector<Turn>& turns, size_t max_turns) {
    size_t start = turns.size() > max_turns ? turns.size() - max_turns : 0;
    std::string out;
    for (size_t i = start; i < turns.size(); ++i) {
        if (!out.empty()) out += '\n';
        out += turns[i].role + ": " + turns[i].content;
    }
    return out;
}

FactDistiller::FactDistiller(FactExtractor& extractor,
                             DistillOptions options,
                             NoiseFilter noise_filter)
    : extractor_(extractor),
      options_(options),
      noise_filter_(std::move(noise_filter)) {}

bool FactDistiller::admit(const RawFact& fact) const {
    if (!fact.content || !fact.salience) return false;

    std::string content = trim(*fact.content);
    if (utf8_length(content) < options_.min_content_chars) return false;
    if (*fact.salience < options_.min_salience) return false;
    if (is_transient(content)) return false;
    if (noise_filter_ && noise_filter_(content)) return false;
    return true;
}

std::vector<DistilledFact> FactDistiller::distill_from_turns(
    const std::vector<Turn>& turns, const std::string& conversation_id) const {
    if (turns.empty()) return {};

    auto raw = extractor_.extract(render_transcript(turns, options_.max_turns));
    if (!raw) {
        std::cerr << "[distill] extraction unavailable, no facts\n";
        return {};
    }

    uint64_t now = epoch_seconds();
    std::vector<DistilledFact> admitted;
    for (const auto& fact : *raw) {
        if (!admit(fact)) continue;

        DistilledFact d;
        d.kind = kind_from_string(fact.kind.value_or("fact"));
        d.content = trim(*fact.content);
        d.tags = fact.tags;
        d.salience = clamp_salience(*fact.salience);
        d.source.origin = "conversation";
        d.source.reference_id = conversation_id;
        d.source.extracted_at = now;
        admitted.push_back(std::move(d));
    }
    return admitted;
}

} // namespace memoria
