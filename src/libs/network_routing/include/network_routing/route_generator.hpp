#pragma once

#include <network_model/scenario.hpp>
#include <network_model/types.hpp>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace network_routing {

// Allowed deviation of the percentage sum from 100.
constexpr double percentage_tolerance = 0.01;

struct RouteRequest {
    int total_vehicles = 0;
    std::vector<network_model::VehicleDistribution> distribution;
    std::vector<std::string> entry_edge_ids;
    std::vector<std::string> exit_edge_ids;
    double horizon = 3600;
    std::optional<std::uint32_t> seed;
};

// Throws network_model::InvalidDistributionError unless every percentage is in
// [0,100] and they sum to 100 within percentage_tolerance.
void validate_distribution(const std::vector<network_model::VehicleDistribution>& distribution);

// floor(percentage / 100 * total) per entry; the remainder goes to the first
// entry so the counts always add up to total_vehicles. An excess (percentages
// summing above 100 within tolerance) is taken from the entries in order, and
// no count drops below zero.
std::vector<int> vehicle_counts(const std::vector<network_model::VehicleDistribution>& distribution,
    int total_vehicles);

// One single-vehicle route per successfully routed attempt. Each attempt picks
// an entry and an exit edge uniformly (with replacement) and takes the
// minimum-hop path from the entry's from-node to the exit's to-node.
// Attempt i departs at i * horizon / total_vehicles whether or not it routes;
// unroutable attempts are dropped, never retried.
// Throws InvalidDistributionError, InvalidRequestError, or
// NoRoutableVehiclesError when nothing could be routed.
std::vector<network_model::RouteAssignment> generate_routes(const network_model::Graph& graph,
    const RouteRequest& request, std::mt19937& rng);

// Seeds a fresh generator once from request.seed, or from std::random_device.
std::vector<network_model::RouteAssignment> generate_routes(const network_model::Graph& graph,
    const RouteRequest& request);

} // namespace network_routing
