#include "ollama.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../http.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

static graphmem::ProviderRegistrar reg_ollama("ollama",
    [](graphmem::HttpClient& http, const graphmem::ProviderConfig& cfg) {
        std::string url = cfg.base_url.empty() ? "http://localhost:11434" : cfg.base_url;
        return std::make_unique<graphmem::OllamaProvider>(
            http, url, static_cast<long>(cfg.timeout_seconds));
    });

using json = nlohmann::json;

namespace graphmem {

OllamaProvider::OllamaProvider(HttpClient& http, const std::string& base_url,
                               long timeout_seconds)
    : http_(http), base_url_(base_url), timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

ChatResponse OllamaProvider::chat(const std::vector<ChatMessage>& messages,
                                   const std::string& model,
                                   double temperature) {
    json request;
    request["model"] = model;
    request["stream"] = false;
    request["options"] = {{"temperature", temperature}};

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;

    std::string url = base_url_ + "/api/chat";
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(url, request.dump(), headers, timeout_seconds_);

    if (response.status_code == 0) {
        throw GeneratorError("Ollama unreachable at " + base_url_, true);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        // Overload and server-side failures may clear up; bad requests and
        // unknown models will not.
        bool transient = response.status_code >= 500 || response.status_code == 429;
        throw GeneratorError("Ollama API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body, transient);
    }

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw GeneratorError(std::string("Ollama returned invalid JSON: ") + e.what(), false);
    }

    ChatResponse result;
    result.model = resp.value("model", model);

    if (resp.contains("message") && resp["message"].is_object() &&
        resp["message"].contains("content") && resp["message"]["content"].is_string()) {
        result.content = resp["message"]["content"].get<std::string>();
    }

    return result;
}

std::string OllamaProvider::chat_simple(const std::string& system_prompt,
                                         const std::string& message,
                                         const std::string& model,
                                         double temperature) {
    std::vector<ChatMessage> messages;
    if (!system_prompt.empty()) {
        messages.push_back({Role::System, system_prompt});
    }
    messages.push_back({Role::User, message});

    auto result = chat(messages, model, temperature);
    return result.content.value_or("");
}

bool OllamaProvider::reachable() {
    auto response = http_.get(base_url_ + "/api/tags", {}, 5);
    return response.status_code >= 200 && response.status_code < 300;
}

} // namespace graphmem
