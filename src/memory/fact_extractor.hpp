#pragma once
#include <optional>
#include <string>
#include <vector>

namespace memoria {

class Provider; // forward declare

// One candidate fact as returned by the extraction service. Every field is
// optional: the payload is free-form JSON and is validated downstream.
struct RawFact {
    std::optional<std::string> kind;
    std::optional<std::string> content;
    std::vector<std::string> tags;
    std::optional<double> salience;
};

// `extractFacts(transcript) -> list<RawFact> | null`
class FactExtractor {
public:
    virtual ~FactExtractor() = default;

    // std::nullopt when the call or the parse failed.
    virtual std::optional<std::vector<RawFact>> extract(const std::string& transcript) = 0;
};

// Parse the extractor's reply. Tolerates surrounding whitespace and a
// Markdown code fence. Throws ExtractionParseFailure unless the text is a
// JSON array; non-object elements are dropped and wrong-typed fields are
// left empty.
std::vector<RawFact> parse_raw_facts(const std::string& text);

// Extraction through a chat-completion provider.
class LlmFactExtractor : public FactExtractor {
public:
    LlmFactExtractor(Provider& provider, std::string model, double temperature = 0.2);

    std::optional<std::vector<RawFact>> extract(const std::string& transcript) override;

private:
    Provider& provider_;
    std::string model_;
    double temperature_;
};

} // namespace memoria
