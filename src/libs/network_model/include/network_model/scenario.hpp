#pragma once

#include <network_model/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace network_model {

// Edge whose open end is a boundary of the network. x/y are the dangling node's
// coordinates, or zero when the node could not be resolved.
struct BoundaryPoint {
    std::string id;
    double x = 0;
    double y = 0;
};

struct BoundaryPoints {
    std::vector<BoundaryPoint> entry_points;
    std::vector<BoundaryPoint> exit_points;
};

struct VehicleDistribution {
    std::string vehicle_type;
    double percentage = 0;
    std::string color = "yellow";
    double period = 1.0;
    std::optional<std::string> attributes;
};

struct RouteAssignment {
    std::string id;
    std::vector<std::string> edges;
    std::string vehicle_type;
    double depart_time = 0;
    std::string color;
};

struct SimulationConfig {
    std::string name = "simulation";
    std::string network_id;
    int total_vehicles = 0;
    double horizon = 3600;
    std::optional<std::uint32_t> seed;
    std::vector<VehicleDistribution> distribution;
};

struct Scenario {
    Graph graph;
    std::vector<RouteAssignment> routes;
    SimulationConfig config;
    std::vector<std::string> entry_edge_ids;
    std::vector<std::string> exit_edge_ids;
};

} // namespace network_model
