#include "prompt.hpp"
#include "util.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace chatrelay {

const char* const kSystemPrompt = R"(## AI Chat Assistant Guidelines

You are a **helpful, expert AI assistant** that writes answers in clear, structured Markdown.
Your goal is to provide **clear, structured, and human-like explanations** to help users.

---

### Answer Structure
- Use **headers** (`##`, `###`) to create logical sections.
- Use **callouts** (`>`) for notes, insights, or warnings.
- Include **code blocks** and **tables** for technical explanations.
- Separate major sections with horizontal rules (`---`).
- Keep paragraphs **short and scannable** (1-3 sentences per paragraph).

Typical layout:
1. **Concise summary sentence**: direct answer or conclusion.
2. **Explanation block**: clear, progressive reasoning or steps.
3. **Examples / code snippets**: minimal, runnable, or conceptual.
4. **Related insights**: additional helpful information when relevant.
5. **Closing prompt**: invite follow-up when appropriate.

---

### Tone and Style
- Be **precise yet approachable**, like explaining to a smart colleague.
- Avoid robotic phrasing or bullet-only answers.
- Encourage learning and clarity over brevity.
)";

const char* const kChatInstructions =
    "### Task\n"
    "- Follow the system guidelines above.\n"
    "- Use the conversation history for additional context when crafting your response.";

std::string format_history(const std::vector<ProviderMessage>& messages) {
    std::string out;
    for (const auto& msg : messages) {
        if (!out.empty()) out += '\n';
        out += role_to_string(msg.role);
        out += ": ";
        out += msg.content;
    }
    return out;
}

std::string build_user_prompt(const std::string& question,
                              const std::string& history,
                              const std::string& instructions) {
    std::vector<std::string> sections;
    std::string instr = trim(instructions);
    if (!instr.empty()) sections.push_back(instr);

    std::string hist = trim(history);
    if (!hist.empty()) sections.push_back("## Conversation History\n" + hist);

    std::string q = trim(question);
    if (!q.empty()) sections.push_back("## User Question\n" + q);

    std::string out;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) out += "\n\n---\n\n";
        out += sections[i];
    }
    return out;
}

std::vector<ProviderMessage> build_provider_messages(const std::string& question,
                                                     const std::string& history,
                                                     const std::string& instructions,
                                                     const std::string& system_prompt) {
    std::string system = trim(system_prompt.empty() ? std::string(kSystemPrompt) : system_prompt);
    return {
        {Role::System, system},
        {Role::User, build_user_prompt(question, history, instructions)}
    };
}

// Cut at most `limit` bytes without splitting a UTF-8 sequence.
static std::string preview_of(const std::string& text, int limit) {
    if (limit <= 0 || text.size() <= static_cast<size_t>(limit)) return text;
    size_t cut = static_cast<size_t>(limit);
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + "\xE2\x80\xA6";
}

std::string format_prompt_trace(const std::string& label,
                                const std::string& request_id,
                                const std::vector<ProviderMessage>& messages,
                                int preview_length) {
    nlohmann::json entries = nlohmann::json::array();
    for (size_t i = 0; i < messages.size(); ++i) {
        entries.push_back({
            {"index", i},
            {"role", role_to_string(messages[i].role)},
            {"length", messages[i].content.size()},
            {"preview", preview_of(messages[i].content, preview_length)}
        });
    }
    nlohmann::json record = {
        {"type", "prompt_trace"},
        {"label", label},
        {"requestId", request_id},
        {"timestamp", timestamp_now()},
        {"messages", entries}
    };
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void trace_prompt(bool enabled,
                  const std::string& label,
                  const std::string& request_id,
                  const std::vector<ProviderMessage>& messages,
                  int preview_length) {
    if (!enabled) return;
    std::cerr << "[prompt] " << format_prompt_trace(label, request_id, messages, preview_length)
              << '\n';
}

} // namespace chatrelay
