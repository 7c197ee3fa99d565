#pragma once
#include "fact_extractor.hpp"
#include "../memory.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace memoria {

// One conversation turn ("user", "assistant", ...).
struct Turn {
    std::string role;
    std::string content;
};

// A fact that passed every admission filter, ready for embedding and upsert.
struct DistilledFact {
    MemoryKind kind = MemoryKind::Fact;
    std::string content;
    std::vector<std::string> tags;
    double salience = 0.0;
    MemorySource source;
};

// Returns true when the text is noise that must not be stored.
using NoiseFilter = std::function<bool(const std::string& content)>;

struct DistillOptions {
    size_t max_turns = 12;
    size_t min_content_chars = 15;   // UTF-8 code points
    double min_salience = 0.6;
};

// Case-insensitive regular expressions matching time-bound or
// conversational-request phrasing.
const std::vector<std::string>& transient_patterns();

// True if any transient pattern matches.
bool is_transient(const std::string& text);

// "role: content" lines for the last `max_turns` turns, oldest first.
std::string render_transcript(const std::vector<Turn>& turns, size_t max_turns);

// Turns a conversation window into admissible facts.
class FactDistiller {
public:
    explicit FactDistiller(FactExtractor& extractor,
                           DistillOptions options = {},
                           NoiseFilter noise_filter = nullptr);

    // Extract and filter. Extraction failure yields an empty list.
    std::vector<DistilledFact> distill_from_turns(const std::vector<Turn>& turns,
                                                  const std::string& conversation_id = "") const;

    // Apply the admission filters to one candidate. Content is trimmed;
    // unknown kinds become fact.
    bool admit(const RawFact& fact) const;

    const DistillOptions& options() const { return options_; }

private:
    FactExtractor& extractor_;
    DistillOptions options_;
    NoiseFilter noise_filter_;
};

} // namespace memoria
