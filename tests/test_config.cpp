#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace graphmem;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.provider.name == "ollama");
    REQUIRE(cfg.provider.base_url == "http://localhost:11434");
    REQUIRE(cfg.provider.temperature == 0.7);
    REQUIRE(cfg.store.backend == "sqlite");
    REQUIRE(cfg.memory.short_term_ttl_minutes == 60);
    REQUIRE(cfg.simulation.timeout_seconds == 0);
    REQUIRE(cfg.simulation.max_turns == 50);
    REQUIRE(cfg.server.listen == "127.0.0.1:8000");
}

TEST_CASE("Config::from_json: defaults_json matches struct defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.provider.model == plain.provider.model);
    REQUIRE(cfg.provider.max_retries == plain.provider.max_retries);
    REQUIRE(cfg.store.retry_backoff_ms == plain.store.retry_backoff_ms);
    REQUIRE(cfg.memory.fallback_max_entries == plain.memory.fallback_max_entries);
    REQUIRE(cfg.simulation.delta_snapshot_interval == plain.simulation.delta_snapshot_interval);
    REQUIRE(cfg.server.max_body == plain.server.max_body);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "provider": {"model": 42, "temperature": "hot"},
        "memory": {"short_term_ttl_minutes": -5},
        "server": "nope"
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.provider.model == "gpt-oss-20b");
    REQUIRE(cfg.provider.temperature == 0.7);
    REQUIRE(cfg.memory.short_term_ttl_minutes == 60);
    REQUIRE(cfg.server.listen == "127.0.0.1:8000");
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "graphmem_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static const char* kEnvVars[] = {
    "OLLAMA_BASE_URL", "OLLAMA_MODEL", "GRAPHMEM_STORE_PATH",
    "SHORT_TERM_TTL_MINUTES", "SIMULATION_TIMEOUT_SECONDS", "GRAPHMEM_LISTEN",
};

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        for (const char* name : kEnvVars) unsetenv(name);
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        for (const char* name : kEnvVars) unsetenv(name);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.graphmem/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.graphmem");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "provider": {"base_url": "http://gpu-box:11434", "model": "llama3", "max_retries": 4},
        "store": {"path": "/var/lib/graphmem/graph.db", "retry_backoff_ms": 250},
        "memory": {"short_term_ttl_minutes": 15},
        "simulation": {"max_turns": 12, "timeout_seconds": 90},
        "server": {"listen": "0.0.0.0:9000"}
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.provider.base_url == "http://gpu-box:11434");
    REQUIRE(cfg.provider.model == "llama3");
    REQUIRE(cfg.provider.max_retries == 4);
    REQUIRE(cfg.store.path == "/var/lib/graphmem/graph.db");
    REQUIRE(cfg.store.retry_backoff_ms == 250);
    REQUIRE(cfg.memory.short_term_ttl_minutes == 15);
    REQUIRE(cfg.simulation.max_turns == 12);
    REQUIRE(cfg.simulation.timeout_seconds == 90);
    REQUIRE(cfg.server.listen == "0.0.0.0:9000");
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"provider": {"model": "from-file"}})");

    setenv("OLLAMA_BASE_URL", "http://env:1234", 1);
    setenv("OLLAMA_MODEL", "from-env", 1);
    setenv("GRAPHMEM_STORE_PATH", "/tmp/env.db", 1);
    setenv("SHORT_TERM_TTL_MINUTES", "5", 1);
    setenv("SIMULATION_TIMEOUT_SECONDS", "30", 1);
    setenv("GRAPHMEM_LISTEN", "127.0.0.1:7000", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.provider.base_url == "http://env:1234");
    REQUIRE(cfg.provider.model == "from-env");
    REQUIRE(cfg.store.path == "/tmp/env.db");
    REQUIRE(cfg.memory.short_term_ttl_minutes == 5);
    REQUIRE(cfg.simulation.timeout_seconds == 30);
    REQUIRE(cfg.server.listen == "127.0.0.1:7000");
}

TEST_CASE("Config::load: non-numeric env var is ignored", "[config]") {
    ConfigTestGuard g;
    setenv("SHORT_TERM_TTL_MINUTES", "soon", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.memory.short_term_ttl_minutes == 60);
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{not json");

    Config cfg = Config::load();
    REQUIRE(cfg.provider.model == "gpt-oss-20b");
    REQUIRE(cfg.server.listen == "127.0.0.1:8000");
}

TEST_CASE("Config::load: store path is expanded", "[config]") {
    ConfigTestGuard g;

    Config cfg = Config::load();
    REQUIRE(cfg.store.path == g.dir + "/.graphmem/graph.db");
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j["provider"]["name"] == "ollama");
    REQUIRE(j["store"]["backend"] == "sqlite");
    REQUIRE(j["memory"].contains("short_term_ttl_minutes"));
    REQUIRE(j["simulation"].contains("max_turns"));
    REQUIRE(j["server"].contains("listen"));
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"provider": {"model": "mistral"}, "custom": true})");

    Config cfg = Config::load();
    REQUIRE(cfg.provider.model == "mistral");

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j["provider"]["model"] == "mistral");
    REQUIRE(j["provider"]["name"] == "ollama");
    REQUIRE(j["custom"] == true);
    REQUIRE(j.contains("simulation"));
    REQUIRE(j["simulation"]["max_turns"] == 50);
}

TEST_CASE("Config::load_from: explicit path", "[config]") {
    ConfigTestGuard g;
    std::string path = g.dir + "/custom/graphmem.json";

    Config cfg = Config::load_from(path);
    REQUIRE(std::filesystem::exists(path));
    REQUIRE(cfg.provider.name == "ollama");
}
