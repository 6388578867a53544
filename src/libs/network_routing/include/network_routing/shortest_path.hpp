#pragma once

#include <network_model/types.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace network_routing {

// Outgoing links per node id, in edge-set order.
class AdjacencyMap {
public:
    struct Link {
        std::string to_node_id;
        std::string edge_id;
    };

    explicit AdjacencyMap(const network_model::Graph& graph);

    const std::vector<Link>& links_from(const std::string& node_id) const;

    // Minimum-hop edge sequence (every edge costs 1). Among equal-length paths
    // the one reached first in edge-set order wins. nullopt when the target is
    // unreachable or equals the source, since a route needs at least one edge.
    std::optional<std::vector<std::string>> shortest_path(const std::string& from_node_id,
        const std::string& to_node_id) const;

private:
    std::unordered_map<std::string, std::vector<Link>> links_;
};

} // namespace network_routing
