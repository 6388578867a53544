#pragma once

#include <network_model/types.hpp>
#include <vector>

namespace network_geometry {

// Half-width of the square display viewport that normalized coordinates fill.
constexpr double viewport_half_width = 100;

// Rescales node x/y in place so the bounding box maps onto
// [-100,100]x[-100,100] with one aspect-preserving scale factor, and returns
// the viewport. A box with zero extent on either axis leaves nodes untouched
// and returns the raw min/max (all zero for an empty list).
network_model::Bounds normalize_coordinates(std::vector<network_model::Node>& nodes);

struct NormalizedGraph {
    network_model::Graph graph;
    network_model::Bounds bounds;
};

// Copy-on-read variant for graphs that must stay immutable (e.g. cached ones).
NormalizedGraph normalized_copy(const network_model::Graph& graph);

network_model::Bounds raw_bounds(const std::vector<network_model::Node>& nodes);

} // namespace network_geometry
