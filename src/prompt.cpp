#include "prompt.hpp"
#include <sstream>

namespace memoria {

std::string build_extraction_system_prompt() {
    return "You are a knowledge extraction assistant. "
           "You output only JSON.";
}

std::string build_extraction_prompt(const std::string& transcript) {
    std::ostringstream ss;

    ss << "Extract durable user facts from this dialog.\n\n"
       << "Rules:\n"
       << "- Focus on stable preferences, identity, long-term projects, and skills.\n"
       << "- Avoid transient requests or time-bound details.\n"
       << "- Each fact should be one clear factual statement about the user.\n"
       << "- kind must be one of \"preference\", \"project\", \"fact\", \"profile\".\n"
       << "- salience is a number between 0.0 and 1.0 rating how useful the fact\n"
       << "  is for future conversations.\n"
       << "- Prefer fewer high-quality facts over many trivial ones.\n\n"
       << "Output a JSON array: [{\"kind\":\"preference|project|fact|profile\","
       << "\"content\":\"clear factual statement\",\"tags\":[\"tag1\"],\"salience\":0.0}]\n"
       << "Output ONLY the JSON array, no other text. Output [] if nothing qualifies.\n\n"
       << "Dialog:\n"
       << transcript;

    return ss.str();
}

std::string build_summary_prompt(const std::string& text, size_t budget_chars) {
    std::ostringstream ss;

    ss << "Summarize this user memory context into key facts. "
       << "Keep the result under " << budget_chars << " characters. "
       << "Focus on preferences, projects, and stable traits. "
       << "Output only the summary.\n\n"
       << text;

    return ss.str();
}

std::string format_memory_block(const std::string& content) {
    if (content.empty()) return "";

    std::ostringstream ss;
    ss << "<memory_context>\n"
       << "Guidelines:\n"
       << "- Use these facts only if relevant\n"
       << "- Do NOT invent details not present\n\n"
       << content << "\n"
       << "</memory_context>";
    return ss.str();
}

} // namespace memoria
