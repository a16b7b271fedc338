#pragma once
#include "provider.hpp"
#include <string>
#include <vector>
#include <optional>

namespace graphmem {

struct Participant {
    std::string role;
    std::string persona;   // optional persona hint
};

struct DialogueTurn {
    std::string speaker;
    std::string content;
};

struct GeneratedTurn {
    std::string content;
    bool finished = false;  // the speaker signalled the dialogue is complete
};

// Condenses a dialogue into a knowledge text.
// Throws GeneratorError on failure.
class Summarizer {
public:
    virtual ~Summarizer() = default;
    virtual std::string summarize(const std::vector<DialogueTurn>& transcript,
                                  const std::optional<std::string>& note) = 0;
};

// Produces the next turn of a simulated dialogue.
// Throws GeneratorError on failure.
class DialogueGenerator {
public:
    virtual ~DialogueGenerator() = default;
    virtual GeneratedTurn next_turn(const Participant& speaker,
                                    const std::vector<Participant>& participants,
                                    const std::vector<DialogueTurn>& transcript,
                                    const std::string& seed_context) = 0;
};

// ── Provider-backed implementations ────────────────────────────

class ProviderSummarizer : public Summarizer {
public:
    ProviderSummarizer(Provider& provider, std::string model, double temperature);

    std::string summarize(const std::vector<DialogueTurn>& transcript,
                          const std::optional<std::string>& note) override;

private:
    Provider& provider_;
    std::string model_;
    double temperature_;
};

class ProviderDialogueGenerator : public DialogueGenerator {
public:
    ProviderDialogueGenerator(Provider& provider, std::string model, double temperature);

    GeneratedTurn next_turn(const Participant& speaker,
                            const std::vector<Participant>& participants,
                            const std::vector<DialogueTurn>& transcript,
                            const std::string& seed_context) override;

private:
    Provider& provider_;
    std::string model_;
    double temperature_;
};

// Strip the completion marker from a generated reply. Returns true if found.
bool strip_completion_marker(std::string& text);

} // namespace graphmem
