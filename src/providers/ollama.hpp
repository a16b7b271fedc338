#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <string>

namespace graphmem {

class OllamaProvider : public Provider {
public:
    OllamaProvider(HttpClient& http,
                   const std::string& base_url = "http://localhost:11434",
                   long timeout_seconds = 60);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      double temperature) override;

    std::string chat_simple(const std::string& system_prompt,
                            const std::string& message,
                            const std::string& model,
                            double temperature) override;

    // GET /api/tags
    bool reachable() override;

    std::string provider_name() const override { return "ollama"; }

private:
    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
};

} // namespace graphmem
