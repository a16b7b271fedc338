#include "provider.hpp"
#include "plugin.hpp"
#include "config.hpp"
#include "providers/reliable.hpp"

namespace graphmem {

std::unique_ptr<Provider> create_provider(const ProviderConfig& config,
                                           HttpClient& http) {
    auto base = PluginRegistry::instance().create_provider(config.name, http, config);
    if (config.max_retries <= 1) return base;

    std::vector<std::unique_ptr<Provider>> chain;
    chain.push_back(std::move(base));
    return std::make_unique<ReliableProvider>(std::move(chain), config.max_retries);
}

} // namespace graphmem
