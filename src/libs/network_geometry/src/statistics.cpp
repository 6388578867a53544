#include <network_geometry/statistics.hpp>
#include <algorithm>

namespace network_geometry {

NetworkStatistics compute_statistics(const network_model::Graph& graph) {
    NetworkStatistics s;
    s.node_count = graph.nodes.size();
    s.edge_count = graph.edges.size();
    double speed_sum = 0;
    for (const auto& e : graph.edges) {
        s.total_length += e.length;
        speed_sum += e.speed;
    }
    if (!graph.edges.empty()) s.average_speed = speed_sum / graph.edges.size();
    s.density = static_cast<double>(s.edge_count) / std::max<std::size_t>(1, s.node_count);
    return s;
}

} // namespace network_geometry
