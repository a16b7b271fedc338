#include "plugin.hpp"
#include "graph/graph_store.hpp"
#include <stdexcept>
#include <algorithm>

namespace graphmem {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

void PluginRegistry::register_graph_store(const std::string& name, GraphStoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    graph_stores_[name] = std::move(factory);
}

std::unique_ptr<Provider> PluginRegistry::create_provider(const std::string& name,
                                                           HttpClient& http,
                                                           const ProviderConfig& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(name);
    if (it == providers_.end()) {
        throw std::invalid_argument("Unknown provider: " + name);
    }
    return it->second(http, config);
}

std::unique_ptr<GraphStore> PluginRegistry::create_graph_store(const std::string& name,
                                                                const StoreConfig& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = graph_stores_.find(name);
    if (it == graph_stores_.end()) {
        throw std::invalid_argument("Unknown graph store backend: " + name);
    }
    return it->second(config);
}

template <typename Map>
static std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& [name, _] : map) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(providers_);
}

std::vector<std::string> PluginRegistry::graph_store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(graph_stores_);
}

bool PluginRegistry::has_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(name) > 0;
}

bool PluginRegistry::has_graph_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_stores_.count(name) > 0;
}

void PluginRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_.clear();
    graph_stores_.clear();
}

} // namespace graphmem
