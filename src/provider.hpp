#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

namespace graphmem {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

struct ChatMessage {
    Role role;
    std::string content;
};

struct ChatResponse {
    std::optional<std::string> content;
    std::string model;
};

// Abstract base class for text-completion providers.
// Failures are reported as GeneratorError (see errors.hpp).
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::string& model,
                              double temperature) = 0;

    virtual std::string chat_simple(const std::string& system_prompt,
                                    const std::string& message,
                                    const std::string& model,
                                    double temperature) = 0;

    // Cheap liveness check; providers without one report true.
    virtual bool reachable() { return true; }

    virtual std::string provider_name() const = 0;
};

class HttpClient; // forward declaration
struct ProviderConfig;

// Factory: create the configured provider, wrapped in a ReliableProvider
// when max_retries > 1.
std::unique_ptr<Provider> create_provider(const ProviderConfig& config,
                                          HttpClient& http);

} // namespace graphmem
