#pragma once
#include "generator.hpp"
#include "graph/types.hpp"
#include "provider.hpp"
#include <string>
#include <vector>
#include <optional>

namespace graphmem {

// Token a simulated speaker appends when the discussion has run its course.
constexpr const char* kCompletionMarker = "[END]";

// System prompt for consolidating a transcript into one knowledge text.
std::string build_summary_system_prompt();

// User message carrying the transcript (and optional operator note) to summarize.
std::string build_summary_prompt(const std::vector<DialogueTurn>& transcript,
                                 const std::optional<std::string>& note);

// Prompt instructing `speaker` to produce the next turn of a simulation.
std::string build_turn_prompt(const Participant& speaker,
                              const std::vector<Participant>& participants,
                              const std::vector<DialogueTurn>& transcript,
                              const std::string& seed_context);

// Chat-reply request: system prompt followed by the short-term history.
std::vector<ChatMessage> build_chat_messages(const std::vector<ShortTermMessage>& history);

} // namespace graphmem
