#pragma once

#include <network_model/types.hpp>
#include <cstddef>

namespace network_geometry {

struct NetworkStatistics {
    std::size_t node_count = 0;
    std::size_t edge_count = 0;
    double total_length = 0;
    double average_speed = 13.89;
    double density = 0;  // edges per node
};

NetworkStatistics compute_statistics(const network_model::Graph& graph);

} // namespace network_geometry
