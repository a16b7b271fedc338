#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace graphmem {

struct ProviderConfig {
    std::string name = "ollama";
    std::string base_url = "http://localhost:11434";
    std::string model = "gpt-oss-20b";
    double temperature = 0.7;
    uint32_t max_retries = 2;
    uint32_t timeout_seconds = 60;
};

struct StoreConfig {
    std::string backend = "sqlite";
    std::string path = "~/.graphmem/graph.db";
    uint32_t retry_backoff_ms = 1000;       // min gap between store attempts while degraded
    uint32_t probe_interval_seconds = 15;
};

struct MemoryConfig {
    uint32_t short_term_ttl_minutes = 60;
    uint32_t fallback_max_entries = 1000;
    uint32_t hygiene_interval_seconds = 300; // 0 = never purge
};

struct SimulationConfig {
    uint32_t max_turns = 50;
    uint32_t timeout_seconds = 0;            // 0 = no timeout
    uint32_t delta_snapshot_interval = 1;    // attach a delta every N turns, 0 = never
    uint32_t max_retained_jobs = 100;
};

struct ServerConfig {
    std::string listen = "127.0.0.1:8000";
    uint32_t max_body = 1048576;
    uint32_t max_connections = 16;
};

struct Config {
    ProviderConfig provider;
    StoreConfig store;
    MemoryConfig memory;
    SimulationConfig simulation;
    ServerConfig server;

    // Load from ~/.graphmem/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults if missing) + env vars
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a (defaults-merged) JSON object. Unknown or mistyped keys keep defaults.
    static Config from_json(const nlohmann::json& j);

    // Environment variables always win over the file
    void apply_env_overrides();
};

} // namespace graphmem
