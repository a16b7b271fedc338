#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace graphmem {

nlohmann::json Config::defaults_json() {
    return {
        {"provider", {
            {"name", "ollama"},
            {"base_url", "http://localhost:11434"},
            {"model", "gpt-oss-20b"},
            {"temperature", 0.7},
            {"max_retries", 2},
            {"timeout_seconds", 60}
        }},
        {"store", {
            {"backend", "sqlite"},
            {"path", "~/.graphmem/graph.db"},
            {"retry_backoff_ms", 1000},
            {"probe_interval_seconds", 15}
        }},
        {"memory", {
            {"short_term_ttl_minutes", 60},
            {"fallback_max_entries", 1000},
            {"hygiene_interval_seconds", 300}
        }},
        {"simulation", {
            {"max_turns", 50},
            {"timeout_seconds", 0},
            {"delta_snapshot_interval", 1},
            {"max_retained_jobs", 100}
        }},
        {"server", {
            {"listen", "127.0.0.1:8000"},
            {"max_body", 1048576},
            {"max_connections", 16}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("provider") && j["provider"].is_object()) {
        auto& p = j["provider"];
        read_string(p, "name", cfg.provider.name);
        read_string(p, "base_url", cfg.provider.base_url);
        read_string(p, "model", cfg.provider.model);
        if (p.contains("temperature") && p["temperature"].is_number())
            cfg.provider.temperature = p["temperature"].get<double>();
        read_u32(p, "max_retries", cfg.provider.max_retries);
        read_u32(p, "timeout_seconds", cfg.provider.timeout_seconds);
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        read_string(s, "backend", cfg.store.backend);
        read_string(s, "path", cfg.store.path);
        read_u32(s, "retry_backoff_ms", cfg.store.retry_backoff_ms);
        read_u32(s, "probe_interval_seconds", cfg.store.probe_interval_seconds);
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        read_u32(m, "short_term_ttl_minutes", cfg.memory.short_term_ttl_minutes);
        read_u32(m, "fallback_max_entries", cfg.memory.fallback_max_entries);
        read_u32(m, "hygiene_interval_seconds", cfg.memory.hygiene_interval_seconds);
    }

    if (j.contains("simulation") && j["simulation"].is_object()) {
        auto& s = j["simulation"];
        read_u32(s, "max_turns", cfg.simulation.max_turns);
        read_u32(s, "timeout_seconds", cfg.simulation.timeout_seconds);
        read_u32(s, "delta_snapshot_interval", cfg.simulation.delta_snapshot_interval);
        read_u32(s, "max_retained_jobs", cfg.simulation.max_retained_jobs);
    }

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        read_string(s, "listen", cfg.server.listen);
        read_u32(s, "max_body", cfg.server.max_body);
        read_u32(s, "max_connections", cfg.server.max_connections);
    }

    return cfg;
}

// Parse an unsigned env var; leaves out untouched if unset or not a number.
static void env_u32(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v) return;
    try {
        unsigned long parsed = std::stoul(v);
        out = static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring non-numeric " << name << "=" << v << "\n";
    }
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        provider.base_url = v;
    if (const char* v = std::getenv("OLLAMA_MODEL"))
        provider.model = v;
    if (const char* v = std::getenv("GRAPHMEM_STORE_PATH"))
        store.path = v;
    if (const char* v = std::getenv("GRAPHMEM_LISTEN"))
        server.listen = v;
    env_u32("SHORT_TERM_TTL_MINUTES", memory.short_term_ttl_minutes);
    env_u32("SIMULATION_TIMEOUT_SECONDS", simulation.timeout_seconds);
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    cfg.store.path = expand_home(cfg.store.path);
    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.graphmem/config.json"));
}

} // namespace graphmem
