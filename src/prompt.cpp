#include "prompt.hpp"
#include <sstream>

namespace graphmem {

std::string build_summary_system_prompt() {
    return "You consolidate conversations into long-term memory.\n"
           "Summarize the conversation focusing on stable knowledge: facts, decisions, "
           "preferences and open questions that will still matter later.\n"
           "Leave out greetings, small talk and meta-conversation.\n"
           "Answer with the summary text only.";
}

std::string build_summary_prompt(const std::vector<DialogueTurn>& transcript,
                                 const std::optional<std::string>& note) {
    std::ostringstream ss;
    if (note && !note->empty()) {
        ss << "Operator note: " << *note << "\n\n";
    }
    ss << "Conversation:\n";
    for (const auto& turn : transcript) {
        ss << turn.speaker << ": " << turn.content << "\n";
    }
    return ss.str();
}

std::string build_turn_prompt(const Participant& speaker,
                              const std::vector<Participant>& participants,
                              const std::vector<DialogueTurn>& transcript,
                              const std::string& seed_context) {
    std::ostringstream ss;

    ss << "You are " << speaker.role
       << ", participating in a round-table discussion with other expert agents";
    bool first = true;
    for (const auto& p : participants) {
        if (p.role == speaker.role) continue;
        ss << (first ? " (" : ", ") << p.role;
        first = false;
    }
    ss << (first ? ".\n" : ").\n");

    if (!speaker.persona.empty()) {
        ss << "Persona guidance: " << speaker.persona << "\n";
    }
    ss << "Respond with a single, well-formed message that reflects your expertise "
       << "and advances the conversation.\n"
       << "Do not narrate actions or mention that you are an AI model.\n"
       << "If the discussion has reached a natural conclusion, end your message with "
       << kCompletionMarker << ".\n\n";

    ss << "Conversation so far:\n";
    if (!seed_context.empty()) {
        ss << "Scenario: " << seed_context << "\n";
    }
    if (transcript.empty() && seed_context.empty()) {
        ss << "(no previous dialogue)\n";
    }
    for (const auto& turn : transcript) {
        ss << turn.speaker << ": " << turn.content << "\n";
    }
    ss << "\n" << speaker.role << ":";
    return ss.str();
}

std::vector<ChatMessage> build_chat_messages(const std::vector<ShortTermMessage>& history) {
    std::vector<ChatMessage> messages;
    messages.reserve(history.size() + 1);
    messages.push_back({Role::System,
        "You are a helpful assistant with a conversational memory. "
        "Use the earlier turns of this session as context and answer the latest user message."});
    for (const auto& m : history) {
        Role role = (m.role == "assistant") ? Role::Assistant
                  : (m.role == "system")    ? Role::System
                                            : Role::User;
        messages.push_back({role, m.content});
    }
    return messages;
}

} // namespace graphmem
