#include "summarizer.hpp"
#include "../prompt.hpp"
#include "../provider.hpp"
#include "../util.hpp"
#include <utility>

namespace memoria {

std::string TruncatingSummarizer::summarize(const std::string& text, size_t budget_chars) {
    return utf8_truncate(text, budget_chars);
}

LlmSummarizer::LlmSummarizer(Provider& provider, std::string model, double temperature)
    : provider_(provider), model_(std::move(model)), temperature_(temperature) {}

std::string LlmSummarizer::summarize(const std::string& text, size_t budget_chars) {
    std::string result = provider_.chat_simple(
        "You condense user memory notes.",
        build_summary_prompt(text, budget_chars), model_, temperature_);
    return trim(result);
}

} // namespace memoria
