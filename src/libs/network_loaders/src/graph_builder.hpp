#pragma once

#include <network_loaders/network_loader.hpp>
#include <network_loaders/numeric_field.hpp>
#include <string>
#include <vector>

namespace network_loaders {

const int default_lane_count = 2;
const double default_speed = 13.89;
const double default_length = 100;

struct RawEdge {
    std::string id;
    std::string from_node_id;
    std::string to_node_id;
    RawNumeric lanes;
    RawNumeric speed;
    RawNumeric length;
};

// Appends nodes in order; a node whose id is already taken is dropped.
void add_nodes(LoadedNetwork& out, std::vector<network_model::Node> nodes);

// Resolves numeric fields and shape for each edge against out.graph.nodes.
// Edges whose endpoints are unknown, or whose id is taken, are dropped.
void add_edges(LoadedNetwork& out, const std::vector<RawEdge>& edges);

} // namespace network_loaders
