#include <catch2/catch.hpp>
#include "mock_http_client.hpp"
#include "errors.hpp"
#include "providers/ollama.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace graphmem;

// ── Helper: find header value ───────────────────────────────────

static std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

// ════════════════════════════════════════════════════════════════
// Ollama Provider
// ════════════════════════════════════════════════════════════════

TEST_CASE("OllamaProvider: chat sends correct request", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({
        "model": "gpt-oss-20b",
        "message": {"role": "assistant", "content": "Hello!"},
        "prompt_eval_count": 12,
        "eval_count": 4
    })"};

    OllamaProvider provider(mock, "http://localhost:11434", 45);

    std::vector<ChatMessage> messages = {
        {Role::System, "Be brief."},
        {Role::User, "Hi"},
        {Role::Assistant, "Hello"},
    };
    auto result = provider.chat(messages, "gpt-oss-20b", 0.3);

    REQUIRE(mock.last_url == "http://localhost:11434/api/chat");
    REQUIRE(find_header(mock.last_headers, "Content-Type") == "application/json");
    REQUIRE(mock.last_timeout == 45);

    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "gpt-oss-20b");
    REQUIRE(body["stream"] == false);
    REQUIRE(body["options"]["temperature"] == 0.3);
    REQUIRE(body["messages"].size() == 3);
    REQUIRE(body["messages"][0]["role"] == "system");
    REQUIRE(body["messages"][1]["role"] == "user");
    REQUIRE(body["messages"][1]["content"] == "Hi");
    REQUIRE(body["messages"][2]["role"] == "assistant");

    REQUIRE(result.content.value_or("") == "Hello!");
    REQUIRE(result.model == "gpt-oss-20b");
}

TEST_CASE("OllamaProvider: trailing slashes are trimmed from base URL", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"message":{"content":"ok"}})"};

    OllamaProvider provider(mock, "http://gpu-box:11434//");
    provider.chat({{Role::User, "ping"}}, "llama3", 0.0);

    REQUIRE(mock.last_url == "http://gpu-box:11434/api/chat");
}

TEST_CASE("OllamaProvider: chat_simple builds system and user messages", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"message":{"content":"four"}})"};

    OllamaProvider provider(mock);
    auto reply = provider.chat_simple("You count.", "two plus two", "llama3", 0.1);
    REQUIRE(reply == "four");

    auto body = json::parse(mock.last_body);
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0]["content"] == "You count.");
    REQUIRE(body["messages"][1]["content"] == "two plus two");
}

TEST_CASE("OllamaProvider: chat_simple omits empty system prompt", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"message":{"content":"x"}})"};

    OllamaProvider provider(mock);
    provider.chat_simple("", "hello", "llama3", 0.1);

    auto body = json::parse(mock.last_body);
    REQUIRE(body["messages"].size() == 1);
    REQUIRE(body["messages"][0]["role"] == "user");
}

TEST_CASE("OllamaProvider: missing message content yields no content", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"done": true})"};

    OllamaProvider provider(mock);
    auto result = provider.chat({{Role::User, "hi"}}, "llama3", 0.0);
    REQUIRE_FALSE(result.content.has_value());
    REQUIRE(result.model == "llama3");
    REQUIRE(provider.chat_simple("", "hi", "llama3", 0.0).empty());
}

// ── Error classification ────────────────────────────────────────

static GeneratorError chat_error(MockHttpClient& mock) {
    OllamaProvider provider(mock);
    try {
        provider.chat({{Role::User, "hi"}}, "llama3", 0.0);
    } catch (const GeneratorError& e) {
        return e;
    }
    FAIL("expected GeneratorError");
    return GeneratorError("unreachable", false);
}

TEST_CASE("OllamaProvider: transport failure is transient", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {0, ""};

    auto err = chat_error(mock);
    REQUIRE(err.transient());
    REQUIRE(std::string(err.what()).find("unreachable") != std::string::npos);
}

TEST_CASE("OllamaProvider: server errors and rate limits are transient", "[providers][ollama]") {
    MockHttpClient mock;

    mock.next_response = {503, "model is loading"};
    auto err = chat_error(mock);
    REQUIRE(err.transient());
    REQUIRE(std::string(err.what()).find("HTTP 503") != std::string::npos);

    mock.next_response = {429, "slow down"};
    REQUIRE(chat_error(mock).transient());
}

TEST_CASE("OllamaProvider: client errors are permanent", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {404, R"({"error":"model 'nope' not found"})"};

    auto err = chat_error(mock);
    REQUIRE_FALSE(err.transient());
    REQUIRE(std::string(err.what()).find("not found") != std::string::npos);

    mock.next_response = {400, "bad request"};
    REQUIRE_FALSE(chat_error(mock).transient());
}

TEST_CASE("OllamaProvider: malformed JSON is permanent", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, "<html>proxy error</html>"};

    auto err = chat_error(mock);
    REQUIRE_FALSE(err.transient());
    REQUIRE(std::string(err.what()).find("invalid JSON") != std::string::npos);
}

// ── Reachability ────────────────────────────────────────────────

TEST_CASE("OllamaProvider: reachable queries the tags endpoint", "[providers][ollama]") {
    MockHttpClient mock;
    OllamaProvider provider(mock, "http://localhost:11434/");

    mock.get_response = {200, R"({"models":[]})"};
    REQUIRE(provider.reachable());
    REQUIRE(mock.last_url == "http://localhost:11434/api/tags");
    REQUIRE(mock.get_count == 1);

    mock.get_response = {0, ""};
    REQUIRE_FALSE(provider.reachable());

    mock.get_response = {500, "oops"};
    REQUIRE_FALSE(provider.reachable());
}

TEST_CASE("OllamaProvider: provider_name", "[providers][ollama]") {
    MockHttpClient mock;
    OllamaProvider provider(mock);
    REQUIRE(provider.provider_name() == "ollama");
}
