#include "config.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "generator.hpp"
#include "graph/graph_store.hpp"
#include "http.hpp"
#include "memory/fallback_cache.hpp"
#include "memory/graph_memory.hpp"
#include "plugin.hpp"
#include "provider.hpp"
#include "server/api.hpp"
#include "server/http_server.hpp"
#include "simulation/coordinator.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: graphmem [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Config file (default: ~/.graphmem/config.json)\n"
              << "  --listen ADDR        Listen address host:port\n"
              << "  --model NAME         Use specific model\n"
              << "  --store PATH         Graph database path\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OLLAMA_BASE_URL          Base URL for Ollama (default: http://localhost:11434)\n"
              << "  OLLAMA_MODEL             Model used for replies, summaries and simulations\n"
              << "  GRAPHMEM_STORE_PATH      Graph database path\n"
              << "  SHORT_TERM_TTL_MINUTES   Lifetime of short-term messages\n"
              << "  SIMULATION_TIMEOUT_SECONDS  Fail simulations running longer (0 = never)\n"
              << "  GRAPHMEM_LISTEN          Listen address host:port\n";
}

static void subscribe_logging(graphmem::EventBus& bus) {
    graphmem::subscribe<graphmem::StoreHealthChangedEvent>(bus,
        [](const graphmem::StoreHealthChangedEvent& ev) {
            if (ev.reachable) {
                std::cerr << "[store] Reachable again, " << ev.pending
                          << " cached messages to reconcile\n";
            } else {
                std::cerr << "[store] Unreachable (" << ev.reason
                          << "), caching messages in memory\n";
            }
        });

    graphmem::subscribe<graphmem::KnowledgeCreatedEvent>(bus,
        [](const graphmem::KnowledgeCreatedEvent& ev) {
            std::cerr << "[memory] " << ev.knowledge_id << " consolidated from "
                      << ev.source_count << " messages of session " << ev.session_id << "\n";
        });

    graphmem::subscribe<graphmem::JobStatusChangedEvent>(bus,
        [](const graphmem::JobStatusChangedEvent& ev) {
            if (ev.status == "running") {
                std::cerr << "[simulation] Job " << ev.job_id << " running\n";
            }
        });
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string listen;
    std::string model_name;
    std::string store_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--store") == 0 && i + 1 < argc) {
            store_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    graphmem::http_init();
    auto config = config_path.empty() ? graphmem::Config::load()
                                      : graphmem::Config::load_from(config_path);

    // Override config with CLI args
    if (!listen.empty()) config.server.listen = listen;
    if (!model_name.empty()) config.provider.model = model_name;
    if (!store_path.empty()) config.store.path = store_path;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    graphmem::http_set_abort_flag(&g_shutdown);

    graphmem::PlatformHttpClient http_client;
    std::unique_ptr<graphmem::Provider> provider;
    std::unique_ptr<graphmem::GraphStore> store;
    try {
        provider = graphmem::create_provider(config.provider, http_client);
        store = graphmem::PluginRegistry::instance().create_graph_store(
            config.store.backend, config.store);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        graphmem::http_cleanup();
        return 1;
    }

    graphmem::EventBus bus;
    subscribe_logging(bus);

    graphmem::FallbackCache cache(config.memory.fallback_max_entries);
    graphmem::ProviderSummarizer summarizer(*provider, config.provider.model,
                                            config.provider.temperature);
    graphmem::ProviderDialogueGenerator generator(*provider, config.provider.model,
                                                  config.provider.temperature);
    graphmem::GraphMemoryService memory(*store, cache, summarizer,
                                        config.memory, config.store, &bus);
    graphmem::SimulationCoordinator simulations(generator, summarizer, memory,
                                                config.simulation, &bus);
    graphmem::ApiRouter router(memory, simulations, *provider, config.provider);

    graphmem::HttpServer server(config.server.listen, config.server.max_body,
                                config.server.max_connections,
                                [&router](const graphmem::ApiRequest& req) {
                                    return router.handle(req);
                                });
    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        graphmem::http_cleanup();
        return 1;
    }

    auto initial = memory.health();
    std::cerr << "[server] Store " << initial.backend << " is " << initial.state
              << ", provider " << provider->provider_name()
              << " model " << config.provider.model << "\n";

    // Periodic probe (reconciles the fallback cache on recovery) and expiry hygiene.
    using clock = std::chrono::steady_clock;
    auto next_probe = clock::now() + std::chrono::seconds(config.store.probe_interval_seconds);
    auto next_purge = clock::now() + std::chrono::seconds(config.memory.hygiene_interval_seconds);
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto now = clock::now();
        if (config.store.probe_interval_seconds > 0 && now >= next_probe) {
            memory.health();
            next_probe = now + std::chrono::seconds(config.store.probe_interval_seconds);
        }
        if (config.memory.hygiene_interval_seconds > 0 && now >= next_purge) {
            try {
                memory.purge_expired();
            } catch (const std::exception& e) {
                std::cerr << "[memory] Purge failed: " << e.what() << "\n";
            }
            next_purge = now + std::chrono::seconds(config.memory.hygiene_interval_seconds);
        }
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    simulations.shutdown();
    graphmem::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
