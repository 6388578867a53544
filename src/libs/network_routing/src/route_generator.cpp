#include <network_routing/route_generator.hpp>
#include <network_routing/shortest_path.hpp>
#include <network_log/logger.hpp>
#include <network_model/errors.hpp>
#include <algorithm>
#include <cmath>

namespace network_routing {

namespace {

struct ResolvedEdge {
    std::string id;
    std::string from_node_id;
    std::string to_node_id;
};

std::vector<ResolvedEdge> resolve_selection(const network_model::Graph& graph,
    const std::vector<std::string>& ids, const char* what)
{
    if (ids.empty())
        throw network_model::InvalidRequestError(std::string("no ") + what + " points selected");

    std::vector<ResolvedEdge> out;
    for (const auto& id : ids) {
        const network_model::Edge* edge = graph.find_edge(id);
        if (!edge) {
            network_log::engine_logger()->warn("Selected {} edge {} is not in the network, ignoring", what, id);
            continue;
        }
        out.push_back({ edge->id, edge->from_node_id, edge->to_node_id });
    }
    if (out.empty())
        throw network_model::InvalidRequestError(std::string("none of the selected ") + what
            + " edges exist in the network");
    return out;
}

} // namespace

void validate_distribution(const std::vector<network_model::VehicleDistribution>& distribution) {
    double sum = 0;
    for (const auto& d : distribution) {
        if (d.percentage < 0 || d.percentage > 100)
            throw network_model::InvalidDistributionError("percentage of " + d.vehicle_type
                + " must be between 0 and 100");
        sum += d.percentage;
    }
    if (std::abs(sum - 100) > percentage_tolerance)
        throw network_model::InvalidDistributionError("vehicle percentages sum to "
            + std::to_string(sum) + ", expected 100");
}

std::vector<int> vehicle_counts(const std::vector<network_model::VehicleDistribution>& distribution,
    int total_vehicles)
{
    std::vector<int> counts;
    int assigned = 0;
    for (const auto& d : distribution) {
        const int n = static_cast<int>(std::floor(d.percentage / 100 * total_vehicles));
        counts.push_back(n);
        assigned += n;
    }
    if (counts.empty()) return counts;
    if (assigned <= total_vehicles) {
        counts.front() += total_vehicles - assigned;
        return counts;
    }
    // Percentages may sum slightly above 100; trim the excess in order.
    int excess = assigned - total_vehicles;
    for (int& n : counts) {
        const int take = std::min(n, excess);
        n -= take;
        excess -= take;
        if (excess == 0) break;
    }
    return counts;
}

std::vector<network_model::RouteAssignment> generate_routes(const network_model::Graph& graph,
    const RouteRequest& request, std::mt19937& rng)
{
    validate_distribution(request.distribution);
    if (request.total_vehicles < 1)
        throw network_model::InvalidRequestError("total_vehicles must be at least 1");
    if (!(request.horizon > 0))
        throw network_model::InvalidRequestError("simulation horizon must be positive");

    const auto entries = resolve_selection(graph, request.entry_edge_ids, "entry");
    const auto exits = resolve_selection(graph, request.exit_edge_ids, "exit");
    const std::vector<int> counts = vehicle_counts(request.distribution, request.total_vehicles);
    const AdjacencyMap adjacency(graph);
    const double step = request.horizon / std::max(1, request.total_vehicles);

    std::uniform_int_distribution<std::size_t> pick_entry(0, entries.size() - 1);
    std::uniform_int_distribution<std::size_t> pick_exit(0, exits.size() - 1);
    auto logger = network_log::engine_logger();

    std::vector<network_model::RouteAssignment> routes;
    std::size_t attempt = 0;
    for (std::size_t t = 0; t < request.distribution.size(); ++t) {
        const auto& type = request.distribution[t];
        for (int i = 0; i < counts[t]; ++i, ++attempt) {
            const ResolvedEdge& entry = entries[pick_entry(rng)];
            const ResolvedEdge& exit = exits[pick_exit(rng)];
            auto path = adjacency.shortest_path(entry.from_node_id, exit.to_node_id);
            if (!path) {
                logger->debug("No path from {} to {}, dropping {} vehicle", entry.id, exit.id, type.vehicle_type);
                continue;
            }
            network_model::RouteAssignment r;
            r.id = "veh_" + std::to_string(routes.size());
            r.edges = std::move(*path);
            r.vehicle_type = type.vehicle_type;
            r.depart_time = static_cast<double>(attempt) * step;
            r.color = type.color;
            routes.push_back(std::move(r));
        }
    }

    if (routes.empty())
        throw network_model::NoRoutableVehiclesError("none of the " + std::to_string(request.total_vehicles)
            + " vehicles could be routed between the selected entry and exit points");
    logger->info("Generated {} of {} vehicles", routes.size(), request.total_vehicles);
    return routes;
}

std::vector<network_model::RouteAssignment> generate_routes(const network_model::Graph& graph,
    const RouteRequest& request)
{
    std::mt19937 rng;
    if (request.seed) {
        rng.seed(*request.seed);
    } else {
        std::random_device rd;
        rng.seed(rd());
    }
    return generate_routes(graph, request, rng);
}

} // namespace network_routing
