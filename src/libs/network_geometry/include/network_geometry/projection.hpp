#pragma once

#include <network_model/types.hpp>
#include <cstddef>

namespace network_geometry {

// Approximate metres per degree of latitude.
constexpr double metres_per_degree = 111000;

// Recomputes x/y (local metres, rounded to centimetres) from lat/lon for every
// node that has both, using an equirectangular projection about the centroid
// of those nodes. Nodes without geographic coordinates keep x/y.
// Returns the number of nodes projected.
std::size_t reproject_from_geographic(network_model::Graph& graph);

} // namespace network_geometry
