#pragma once
#include "provider.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace graphmem { class GraphStore; } // forward declaration

namespace graphmem {

// Factory function types
using ProviderFactory = std::function<std::unique_ptr<Provider>(
    HttpClient& http, const ProviderConfig& config)>;

using GraphStoreFactory = std::function<std::unique_ptr<GraphStore>(
    const StoreConfig& config)>;

// Central registry for self-registering plugins.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_provider(const std::string& name, ProviderFactory factory);
    void register_graph_store(const std::string& name, GraphStoreFactory factory);

    // Creation
    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              HttpClient& http,
                                              const ProviderConfig& config) const;

    std::unique_ptr<GraphStore> create_graph_store(const std::string& name,
                                                    const StoreConfig& config) const;

    // Query
    std::vector<std::string> provider_names() const;
    std::vector<std::string> graph_store_names() const;
    bool has_provider(const std::string& name) const;
    bool has_graph_store(const std::string& name) const;

    // Testing support
    void clear();

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
    std::unordered_map<std::string, GraphStoreFactory> graph_stores_;
};

// ── Self-registrar helpers (used at file scope in each plugin .cpp) ──

struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

struct GraphStoreRegistrar {
    GraphStoreRegistrar(const std::string& name, GraphStoreFactory factory) {
        PluginRegistry::instance().register_graph_store(name, std::move(factory));
    }
};

} // namespace graphmem
