#pragma once
#include "../memory.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace memoria {

class Summarizer; // forward declare

// Joins selected memories into one text block and keeps it within a
// character budget (UTF-8 code points).
class ContextCompressor {
public:
    // `summarizer` may be null; over-budget text is then truncated.
    explicit ContextCompressor(Summarizer* summarizer) : summarizer_(summarizer) {}

    // Newline-joined contents in selection order, reduced to budget_chars
    // when longer, then wrapped with format_memory_block. Empty selection
    // yields an empty string.
    std::string compress(const std::vector<Memory>& selected, size_t budget_chars) const;

private:
    Summarizer* summarizer_;
};

} // namespace memoria
