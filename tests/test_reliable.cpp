#include <catch2/catch.hpp>
#include "providers/reliable.hpp"
#include "errors.hpp"
#include <stdexcept>

using namespace graphmem;

// ── Mock provider for testing retry logic ────────────────────────

class FlakyProvider : public Provider {
public:
    int fail_count;     // how many calls should throw before succeeding
    int call_count = 0;
    bool transient = true;
    bool up = true;
    std::string name;

    FlakyProvider(const std::string& name, int fail_count)
        : fail_count(fail_count), name(name) {}

    ChatResponse chat(const std::vector<ChatMessage>&,
                      const std::string&,
                      double) override {
        call_count++;
        if (call_count <= fail_count) {
            throw GeneratorError(name + " failed attempt " + std::to_string(call_count),
                                 transient);
        }
        ChatResponse resp;
        resp.content = "response from " + name;
        return resp;
    }

    std::string chat_simple(const std::string&,
                            const std::string&,
                            const std::string&,
                            double) override {
        call_count++;
        if (call_count <= fail_count) {
            throw GeneratorError(name + " simple failed", transient);
        }
        return "simple from " + name;
    }

    bool reachable() override { return up; }
    std::string provider_name() const override { return name; }
};

// ── Constructor ──────────────────────────────────────────────────

TEST_CASE("ReliableProvider: requires at least one provider", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> empty;
    REQUIRE_THROWS_AS(
        ReliableProvider(std::move(empty)),
        std::invalid_argument
    );
}

// ── Successful first try ─────────────────────────────────────────

TEST_CASE("ReliableProvider: succeeds on first try", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p = std::make_unique<FlakyProvider>("p1", 0);
    auto* ptr = p.get();
    providers.push_back(std::move(p));

    ReliableProvider reliable(std::move(providers), 3);
    auto resp = reliable.chat({}, "model", 0.5);

    REQUIRE(resp.content == "response from p1");
    REQUIRE(ptr->call_count == 1);
}

// ── Retry within same provider ───────────────────────────────────

TEST_CASE("ReliableProvider: retries transient failure then succeeds", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p = std::make_unique<FlakyProvider>("p1", 2);
    auto* ptr = p.get();
    providers.push_back(std::move(p));

    ReliableProvider reliable(std::move(providers), 3);
    auto resp = reliable.chat({}, "model", 0.5);

    REQUIRE(resp.content == "response from p1");
    REQUIRE(ptr->call_count == 3);
}

TEST_CASE("ReliableProvider: permanent failure is not retried", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p1 = std::make_unique<FlakyProvider>("p1", 100);
    p1->transient = false;
    auto p2 = std::make_unique<FlakyProvider>("p2", 0);
    auto* ptr1 = p1.get();
    auto* ptr2 = p2.get();
    providers.push_back(std::move(p1));
    providers.push_back(std::move(p2));

    ReliableProvider reliable(std::move(providers), 3);
    try {
        reliable.chat({}, "model", 0.5);
        FAIL("expected GeneratorError");
    } catch (const GeneratorError& e) {
        REQUIRE_FALSE(e.transient());
        REQUIRE(std::string(e.what()).find("p1 failed attempt 1") != std::string::npos);
    }
    REQUIRE(ptr1->call_count == 1);
    REQUIRE(ptr2->call_count == 0);
}

// ── Fallback to second provider ──────────────────────────────────

TEST_CASE("ReliableProvider: falls back to second provider", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p1 = std::make_unique<FlakyProvider>("p1", 100); // always fails
    auto p2 = std::make_unique<FlakyProvider>("p2", 0);   // always succeeds
    auto* ptr1 = p1.get();
    auto* ptr2 = p2.get();
    providers.push_back(std::move(p1));
    providers.push_back(std::move(p2));

    ReliableProvider reliable(std::move(providers), 2);
    auto resp = reliable.chat({}, "model", 0.5);

    REQUIRE(resp.content == "response from p2");
    REQUIRE(ptr1->call_count == 2);
    REQUIRE(ptr2->call_count == 1);
}

// ── All providers fail ───────────────────────────────────────────

TEST_CASE("ReliableProvider: exhausted retries raise transient GeneratorError", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(std::make_unique<FlakyProvider>("only", 100));

    ReliableProvider reliable(std::move(providers), 2);
    try {
        reliable.chat({}, "model", 0.5);
        FAIL("expected GeneratorError");
    } catch (const GeneratorError& e) {
        std::string msg = e.what();
        REQUIRE(e.transient());
        REQUIRE(msg.find("All providers failed") != std::string::npos);
        REQUIRE(msg.find("only failed attempt 2") != std::string::npos);
    }
}

TEST_CASE("ReliableProvider: zero retries still makes one attempt", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p = std::make_unique<FlakyProvider>("p1", 0);
    auto* ptr = p.get();
    providers.push_back(std::move(p));

    ReliableProvider reliable(std::move(providers), 0);
    REQUIRE(reliable.chat({}, "model", 0.5).content == "response from p1");
    REQUIRE(ptr->call_count == 1);
}

// ── chat_simple retry logic ──────────────────────────────────────

TEST_CASE("ReliableProvider: chat_simple retries and succeeds", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(std::make_unique<FlakyProvider>("p1", 1));

    ReliableProvider reliable(std::move(providers), 3);
    REQUIRE(reliable.chat_simple("system", "msg", "model", 0.5) == "simple from p1");
}

TEST_CASE("ReliableProvider: chat_simple throws when all fail", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(std::make_unique<FlakyProvider>("p1", 100));

    ReliableProvider reliable(std::move(providers), 2);
    REQUIRE_THROWS_AS(reliable.chat_simple("s", "m", "model", 0.5), GeneratorError);
}

// ── Delegation ───────────────────────────────────────────────────

TEST_CASE("ReliableProvider: reachable if any provider is", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p1 = std::make_unique<FlakyProvider>("p1", 0);
    auto p2 = std::make_unique<FlakyProvider>("p2", 0);
    auto* ptr1 = p1.get();
    auto* ptr2 = p2.get();
    providers.push_back(std::move(p1));
    providers.push_back(std::move(p2));

    ReliableProvider reliable(std::move(providers));
    ptr1->up = false;
    REQUIRE(reliable.reachable());
    ptr2->up = false;
    REQUIRE_FALSE(reliable.reachable());
}

TEST_CASE("ReliableProvider: provider_name is the primary provider", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(std::make_unique<FlakyProvider>("p1", 0));
    providers.push_back(std::make_unique<FlakyProvider>("p2", 0));

    ReliableProvider reliable(std::move(providers));
    REQUIRE(reliable.provider_name() == "p1");
}
