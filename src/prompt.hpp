#pragma once
#include "provider.hpp"
#include <string>
#include <vector>

namespace chatrelay {

// System prompt sent ahead of every chat turn.
extern const char* const kSystemPrompt;

// Task instructions placed at the top of every chat user prompt.
extern const char* const kChatInstructions;

// Format prior turns as "role: content" lines joined by '\n'.
std::string format_history(const std::vector<ProviderMessage>& messages);

// Join the non-blank sections (instructions, "## Conversation History",
// "## User Question") with "\n\n---\n\n". Every section is trimmed.
std::string build_user_prompt(const std::string& question,
                              const std::string& history = "",
                              const std::string& instructions = "");

// [system(system_prompt), user(build_user_prompt(...))]. The system prompt
// defaults to kSystemPrompt and is trimmed.
std::vector<ProviderMessage> build_provider_messages(const std::string& question,
                                                     const std::string& history = "",
                                                     const std::string& instructions = "",
                                                     const std::string& system_prompt = "");

// Single-line JSON trace record {"type":"prompt_trace",...}. Previews longer
// than preview_length are cut and suffixed with "…"; preview_length <= 0
// keeps the full text.
std::string format_prompt_trace(const std::string& label,
                                const std::string& request_id,
                                const std::vector<ProviderMessage>& messages,
                                int preview_length);

// Write the trace record to stderr when enabled.
void trace_prompt(bool enabled,
                  const std::string& label,
                  const std::string& request_id,
                  const std::vector<ProviderMessage>& messages,
                  int preview_length);

} // namespace chatrelay
