#pragma once

#include <network_model/scenario.hpp>
#include <network_model/types.hpp>
#include <map>
#include <string>
#include <vector>

namespace network_export {

// Names the external tools expect; the run configuration refers to them.
namespace file_names {
constexpr const char* nodes = "nodes.nod.xml";
constexpr const char* edges = "edges.edg.xml";
constexpr const char* routes = "routes.rou.xml";
constexpr const char* run_config = "simulation.sumocfg";
constexpr const char* metadata = "simulation_metadata.json";
constexpr const char* compiled_network = "network.net.xml";
} // namespace file_names

// File name -> content, for the five documents above.
struct ScenarioBundle {
    std::map<std::string, std::string> files;
};

struct SerializeOptions {
    std::string created_at;  // empty: current UTC time
};

std::string nodes_document(const network_model::Graph& graph);

// Edges whose endpoints are not in the graph are left out and logged.
std::string edges_document(const network_model::Graph& graph);

// Standard vTypes, then one route + vehicle per assignment in departure order.
std::string routes_document(const std::vector<network_model::RouteAssignment>& routes,
    const std::vector<network_model::VehicleDistribution>& distribution);

std::string run_configuration_document(double horizon);

std::string metadata_document(const network_model::Scenario& scenario, const std::string& created_at);

// All five documents or an exception; never a partial bundle.
ScenarioBundle serialize_scenario(const network_model::Scenario& scenario, const SerializeOptions& options = {});

// Shortest text that reads back to the same double ("50", "13.89").
std::string format_number(double value);

std::string current_timestamp();

} // namespace network_export
