#pragma once

#include <network_model/scenario.hpp>
#include <network_model/types.hpp>

namespace network_routing {

// Entry point: edge whose from-node has no incoming edge.
// Exit point: edge whose to-node has no outgoing edge.
// Degrees are counted over the whole edge set; an edge can be both or neither.
network_model::BoundaryPoints classify_boundary(const network_model::Graph& graph);

} // namespace network_routing
