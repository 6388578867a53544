#pragma once

#include <network_model/types.hpp>
#include <optional>
#include <string>

namespace network_geometry {

// Network ids of the form map_<north>_<south>_<east>_<west> carry their
// selection box as degrees x 1000. Min/max are swapped where needed.
std::optional<network_model::GeoBounds> bounds_from_network_id(const std::string& network_id);

bool contains(const network_model::GeoBounds& box, const network_model::Node& node);

// Keeps nodes with geographic coordinates inside the box, then edges whose
// two endpoints were kept. Nodes without lat/lon are always dropped.
network_model::Graph filter_by_bounds(const network_model::Graph& graph, const network_model::GeoBounds& box);

} // namespace network_geometry
