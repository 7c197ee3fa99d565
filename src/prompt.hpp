#pragma once
#include <string>

namespace memoria {

// System + user prompts for the fact-extraction LLM call.
// `transcript` is the role-labeled dialog produced by render_transcript.
std::string build_extraction_system_prompt();
std::string build_extraction_prompt(const std::string& transcript);

// Prompt asking the LLM to condense a memory block to at most
// `budget_chars` characters.
std::string build_summary_prompt(const std::string& text, size_t budget_chars);

// Wrap compressed memory text in the block handed to the downstream
// generation call. Empty input yields an empty string.
std::string format_memory_block(const std::string& content);

} // namespace memoria
