#pragma once
#include "../provider.hpp"
#include <string>
#include <vector>
#include <memory>
#include <utility>

namespace graphmem {

// Wraps multiple providers with retry/fallback logic.
// Permanent GeneratorErrors are rethrown at once; transient ones are retried
// up to max_retries times per provider before moving to the next provider.
class ReliableProvider : public Provider {
public:
    explicit ReliableProvider(std::vector<std::unique_ptr<Provider>> providers,
                              uint32_t max_retries = 3);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      double temperature) override;

    std::string chat_simple(const std::string& system_prompt,
                            const std::string& message,
                            const std::string& model,
                            double temperature) override;

    bool reachable() override;
    std::string provider_name() const override;

private:
    template <typename Fn>
    auto with_retries(Fn&& fn) -> decltype(fn(std::declval<Provider&>()));

    std::vector<std::unique_ptr<Provider>> providers_;
    uint32_t max_retries_;
};

} // namespace graphmem
