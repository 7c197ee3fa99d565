#include "context_compressor.hpp"
#include "summarizer.hpp"
#include "../errors.hpp"
#include "../prompt.hpp"
#include "../util.hpp"
#include <iostream>

namespace memoria {

std::string ContextCompressor::compress(const std::vector<Memory>& selected,
                                        size_t budget_chars) const {
    if (selected.empty()) return "";

    std::string joined;
    for (const auto& m : selected) {
        if (!joined.empty()) joined += '\n';
        joined += m.content;
    }

    if (utf8_length(joined) <= budget_chars) {
        return format_memory_block(joined);
    }

    std::string reduced;
    if (summarizer_) {
        try {
            reduced = summarizer_->summarize(joined, budget_chars);
        } catch (const CollaboratorUnavailable& e) {
            std::cerr << "[compressor] summarizer failed, truncating: " << e.what() << "\n";
        }
        size_t reduced_chars = utf8_length(reduced);
        if (reduced_chars > budget_chars) {
            std::cerr << "[compressor] summary over budget (" << reduced_chars
                      << " > " << budget_chars << "), truncating\n";
            reduced = utf8_truncate(reduced, budget_chars);
        }
    }
    if (reduced.empty()) {
        reduced = utf8_truncate(joined, budget_chars);
    }

    return format_memory_block(reduced);
}

} // namespace memoria
