#include <network_export/serializer.hpp>
#include <network_log/logger.hpp>
#include <chrono>
#include <ctime>

namespace network_export {

std::string current_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

ScenarioBundle serialize_scenario(const network_model::Scenario& scenario, const SerializeOptions& options) {
    const std::string created_at = options.created_at.empty() ? current_timestamp() : options.created_at;

    ScenarioBundle bundle;
    bundle.files[file_names::nodes] = nodes_document(scenario.graph);
    bundle.files[file_names::edges] = edges_document(scenario.graph);
    bundle.files[file_names::routes] = routes_document(scenario.routes, scenario.config.distribution);
    bundle.files[file_names::run_config] = run_configuration_document(scenario.config.horizon);
    bundle.files[file_names::metadata] = metadata_document(scenario, created_at);

    network_log::engine_logger()->info("Serialized scenario {}: {} nodes, {} edges, {} vehicles",
        scenario.config.name, scenario.graph.nodes.size(), scenario.graph.edges.size(), scenario.routes.size());
    return bundle;
}

} // namespace network_export
