#include <catch2/catch.hpp>
#include "mock_http_client.hpp"
#include "plugin.hpp"
#include "graph/graph_store.hpp"
#include "test_support.hpp"
#include <algorithm>

using namespace graphmem;

// Tests use unique prefixed names to avoid colliding with real registrations.
// We never call clear() on the global singleton since it would destroy
// the static registrations from the provider and store .cpp files.

// ── Helpers ─────────────────────────────────────────────────────

class PluginTestProvider : public Provider {
public:
    std::string name_;
    explicit PluginTestProvider(const std::string& name) : name_(name) {}
    ChatResponse chat(const std::vector<ChatMessage>&, const std::string&, double) override {
        return {};
    }
    std::string chat_simple(const std::string&, const std::string&,
                            const std::string&, double) override { return ""; }
    std::string provider_name() const override { return name_; }
};

class PluginTestStore : public GraphStore {
public:
    std::string path;
    explicit PluginTestStore(const std::string& p) : path(p) {}
    std::string backend_name() const override { return "_test_store"; }
    bool probe() override { return true; }
    uint64_t write(const std::string&, const nlohmann::json&) override { return 0; }
    uint64_t write_batch(const std::vector<Statement>&) override { return 0; }
    std::vector<nlohmann::json> read(const std::string&, const nlohmann::json&) override {
        return {};
    }
};

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// ── Built-in static registrations ───────────────────────────────

TEST_CASE("PluginRegistry: ollama provider is registered", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    REQUIRE(reg.has_provider("ollama"));
    REQUIRE(contains(reg.provider_names(), "ollama"));
}

TEST_CASE("PluginRegistry: sqlite graph store is registered", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    REQUIRE(reg.has_graph_store("sqlite"));
    REQUIRE(contains(reg.graph_store_names(), "sqlite"));
}

TEST_CASE("PluginRegistry: creates ollama provider from config", "[plugin]") {
    MockHttpClient http;
    ProviderConfig cfg;
    cfg.base_url = "http://gpu-box:11434/";

    auto provider = PluginRegistry::instance().create_provider("ollama", http, cfg);
    REQUIRE(provider);
    REQUIRE(provider->provider_name() == "ollama");

    provider->reachable();
    REQUIRE(http.last_url == "http://gpu-box:11434/api/tags");
}

TEST_CASE("PluginRegistry: creates sqlite store at configured path", "[plugin]") {
    std::string path = graph_test_path("plugin_sqlite");
    StoreConfig cfg;
    cfg.path = path;

    {
        auto store = PluginRegistry::instance().create_graph_store("sqlite", cfg);
        REQUIRE(store->backend_name() == "sqlite");
        REQUIRE(store->probe());
    }
    remove_db_files(path);
}

// ── Custom registration ─────────────────────────────────────────

TEST_CASE("PluginRegistry: register and create custom provider", "[plugin]") {
    auto& reg = PluginRegistry::instance();

    reg.register_provider("_test_prov", [](HttpClient&, const ProviderConfig& cfg) {
        return std::make_unique<PluginTestProvider>("_test_prov:" + cfg.model);
    });

    REQUIRE(reg.has_provider("_test_prov"));

    MockHttpClient http;
    ProviderConfig cfg;
    cfg.model = "tiny";
    auto p = reg.create_provider("_test_prov", http, cfg);
    REQUIRE(p->provider_name() == "_test_prov:tiny");
}

TEST_CASE("PluginRegistry: register and create custom graph store", "[plugin]") {
    auto& reg = PluginRegistry::instance();

    reg.register_graph_store("_test_store", [](const StoreConfig& cfg) {
        return std::make_unique<PluginTestStore>(cfg.path);
    });

    StoreConfig cfg;
    cfg.path = "/nowhere";
    auto store = reg.create_graph_store("_test_store", cfg);
    REQUIRE(store->backend_name() == "_test_store");
    REQUIRE(static_cast<PluginTestStore&>(*store).path == "/nowhere");
}

TEST_CASE("PluginRegistry: re-registering replaces the factory", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    MockHttpClient http;
    ProviderConfig cfg;

    reg.register_provider("_test_replace", [](HttpClient&, const ProviderConfig&) {
        return std::make_unique<PluginTestProvider>("first");
    });
    reg.register_provider("_test_replace", [](HttpClient&, const ProviderConfig&) {
        return std::make_unique<PluginTestProvider>("second");
    });

    REQUIRE(reg.create_provider("_test_replace", http, cfg)->provider_name() == "second");
}

TEST_CASE("PluginRegistry: names are sorted", "[plugin]") {
    auto names = PluginRegistry::instance().provider_names();
    REQUIRE(std::is_sorted(names.begin(), names.end()));
}

// ── Unknown names ───────────────────────────────────────────────

TEST_CASE("PluginRegistry: unknown provider throws", "[plugin]") {
    MockHttpClient http;
    ProviderConfig cfg;
    REQUIRE_THROWS_AS(
        PluginRegistry::instance().create_provider("_no_such_provider", http, cfg),
        std::invalid_argument);
}

TEST_CASE("PluginRegistry: unknown graph store throws", "[plugin]") {
    StoreConfig cfg;
    REQUIRE_THROWS_AS(
        PluginRegistry::instance().create_graph_store("neo4j", cfg),
        std::invalid_argument);
}

// ── create_provider wrapping ────────────────────────────────────

TEST_CASE("create_provider: wraps in reliable provider when retrying", "[plugin]") {
    MockHttpClient http;
    http.response_queue.push_back({503, "busy"});
    http.response_queue.push_back({200, R"({"message":{"role":"assistant","content":"ok"}})"});

    ProviderConfig cfg;
    cfg.max_retries = 2;
    auto provider = create_provider(cfg, http);

    REQUIRE(provider->provider_name() == "ollama");
    auto resp = provider->chat({{Role::User, "hi"}}, cfg.model, 0.0);
    REQUIRE(resp.content == "ok");
    REQUIRE(http.call_count == 2);
}

TEST_CASE("create_provider: single attempt without retries", "[plugin]") {
    MockHttpClient http;
    http.next_response = {503, "busy"};

    ProviderConfig cfg;
    cfg.max_retries = 1;
    auto provider = create_provider(cfg, http);

    REQUIRE_THROWS_AS(provider->chat({{Role::User, "hi"}}, cfg.model, 0.0), GeneratorError);
    REQUIRE(http.call_count == 1);
}
