#include "fact_extractor.hpp"
#include "../errors.hpp"
#include "../prompt.hpp"
#include "../provider.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <utility>

namespace memoria {

// Remove a ```json ... ``` (or bare ```) wrapper if present.
static std::string strip_code_fence(const std::string& text) {
    std::string s = trim(text);
    if (s.compare(0, 3, "```") != 0) return s;

    auto first_newline = s.find('\n');
    if (first_newline == std::string::npos) return s;
    auto closing = s.rfind("```");
    if (closing == std::string::npos || closing <= first_newline) return s;

    return trim(s.substr(first_newline + 1, closing - first_newline - 1));
}

std::vector<RawFact> parse_raw_facts(const std::string& text) {
    auto j = nlohmann::json::parse(strip_code_fence(text), nullptr, false);
    if (j.is_discarded()) {
        throw ExtractionParseFailure("extraction output is not valid JSON");
    }
    if (!j.is_array()) {
        throw ExtractionParseFailure("extraction output is not a JSON array");
    }

    std::vector<RawFact> facts;
    for (const auto& item : j) {
        if (!item.is_object()) continue;

        RawFact fact;
        if (item.contains("kind") && item["kind"].is_string()) {
            fact.kind = item["kind"].get<std::string>();
        }
        if (item.contains("content") && item["content"].is_string()) {
            fact.content = item["content"].get<std::string>();
        }
        if (item.contains("tags") && item["tags"].is_array()) {
            for (const auto& t : item["tags"]) {
                if (t.is_string()) fact.tags.push_back(t.get<std::string>());
            }
        }
        if (item.contains("salience") && item["salience"].is_number()) {
            fact.salience = item["salience"].get<double>();
        }
        facts.push_back(std::move(fact));
    }
    return facts;
}

LlmFactExtractor::LlmFactExtractor(Provider& provider, std::string model, double temperature)
    : provider_(provider), model_(std::move(model)), temperature_(temperature) {}

std::optional<std::vector<RawFact>> LlmFactExtractor::extract(const std::string& transcript) {
    std::string reply;
    try {
        reply = provider_.chat_simple(build_extraction_system_prompt(),
                                      build_extraction_prompt(transcript),
                                      model_, temperature_);
    } catch (const CollaboratorUnavailable& e) {
        std::cerr << "[extract] " << e.what() << "\n";
        return std::nullopt;
    }

    try {
        return parse_raw_facts(reply);
    } catch (const ExtractionParseFailure& e) {
        std::cerr << "[extract] " << e.what() << "\n";
        return std::nullopt;
    }
}

} // namespace memoria
