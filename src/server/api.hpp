#pragma once
#include "http_server.hpp"
#include <string>
#include <vector>

namespace graphmem {

class GraphMemoryService;
class SimulationCoordinator;
class Provider;
struct ProviderConfig;

// Maps HTTP requests under /api onto the memory service, the simulation
// coordinator and the chat provider. Errors are returned as {"error": ...}
// with the status matching the failure kind.
class ApiRouter {
public:
    ApiRouter(GraphMemoryService& memory,
              SimulationCoordinator& simulations,
              Provider& provider,
              const ProviderConfig& provider_config);

    ApiResponse handle(const ApiRequest& request);

private:
    ApiResponse route(const ApiRequest& request, const std::vector<std::string>& parts);

    ApiResponse health();
    ApiResponse chat(const ApiRequest& request);
    ApiResponse memory_history(const std::string& session_id);
    ApiResponse consolidate(const ApiRequest& request);
    ApiResponse graph(const ApiRequest& request);
    ApiResponse clear_graph(const ApiRequest& request);
    ApiResponse simulation_submit(const ApiRequest& request);
    ApiResponse simulation_list();
    ApiResponse simulation_status(const std::string& job_id);
    ApiResponse simulation_cancel(const std::string& job_id);
    ApiResponse simulation_discard(const std::string& job_id);
    ApiResponse simulation_commit(const ApiRequest& request);

    GraphMemoryService& memory_;
    SimulationCoordinator& simulations_;
    Provider& provider_;
    std::string model_;
    double temperature_;
};

} // namespace graphmem
