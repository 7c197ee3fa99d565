#pragma once
#include <cstddef>
#include <string>

namespace memoria {

class Provider; // forward declare

// Reduces text to a character budget (`summarize(text, budget) -> text`).
class Summarizer {
public:
    virtual ~Summarizer() = default;

    // Throws CollaboratorUnavailable when the backing service fails.
    // The result may exceed the budget; callers enforce it.
    virtual std::string summarize(const std::string& text, size_t budget_chars) = 0;

    virtual std::string summarizer_name() const = 0;
};

// Cuts the text at the budget without splitting a UTF-8 sequence.
class TruncatingSummarizer : public Summarizer {
public:
    std::string summarize(const std::string& text, size_t budget_chars) override;
    std::string summarizer_name() const override { return "truncate"; }
};

// Asks an LLM to condense the text.
class LlmSummarizer : public Summarizer {
public:
    LlmSummarizer(Provider& provider, std::string model, double temperature = 0.3);

    std::string summarize(const std::string& text, size_t budget_chars) override;
    std::string summarizer_name() const override { return "llm"; }

private:
    Provider& provider_;
    std::string model_;
    double temperature_;
};

} // namespace memoria
