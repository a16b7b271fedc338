#include "generator.hpp"
#include "prompt.hpp"
#include "util.hpp"

namespace graphmem {

bool strip_completion_marker(std::string& text) {
    const std::string marker = kCompletionMarker;
    auto pos = text.rfind(marker);
    if (pos == std::string::npos) return false;
    text.erase(pos, marker.size());
    text = trim(text);
    return true;
}

ProviderSummarizer::ProviderSummarizer(Provider& provider, std::string model, double temperature)
    : provider_(provider), model_(std::move(model)), temperature_(temperature) {}

std::string ProviderSummarizer::summarize(const std::vector<DialogueTurn>& transcript,
                                          const std::optional<std::string>& note) {
    std::string summary = provider_.chat_simple(build_summary_system_prompt(),
                                                build_summary_prompt(transcript, note),
                                                model_, temperature_);
    return trim(summary);
}

ProviderDialogueGenerator::ProviderDialogueGenerator(Provider& provider, std::string model,
                                                     double temperature)
    : provider_(provider), model_(std::move(model)), temperature_(temperature) {}

GeneratedTurn ProviderDialogueGenerator::next_turn(const Participant& speaker,
                                                   const std::vector<Participant>& participants,
                                                   const std::vector<DialogueTurn>& transcript,
                                                   const std::string& seed_context) {
    std::string prompt = build_turn_prompt(speaker, participants, transcript, seed_context);
    GeneratedTurn turn;
    turn.content = trim(provider_.chat_simple("", prompt, model_, temperature_));
    turn.finished = strip_completion_marker(turn.content);
    return turn;
}

} // namespace graphmem
