#include <network_routing/boundary_classifier.hpp>
#include <network_log/logger.hpp>
#include <network_model/errors.hpp>
#include <unordered_map>

namespace network_routing {

namespace {

network_model::BoundaryPoint make_point(const network_model::Graph& graph,
    const network_model::Edge& edge, const std::string& node_id)
{
    network_model::BoundaryPoint p;
    p.id = edge.id;
    if (const network_model::Node* node = graph.find_node(node_id)) {
        p.x = node->x;
        p.y = node->y;
    } else {
        network_log::engine_logger()->warn("{}, using zero coordinate",
            network_model::UnresolvedReferenceError(edge.id, node_id).what());
    }
    return p;
}

} // namespace

network_model::BoundaryPoints classify_boundary(const network_model::Graph& graph) {
    std::unordered_map<std::string, int> in_degree;
    std::unordered_map<std::string, int> out_degree;
    for (const auto& e : graph.edges) {
        ++in_degree[e.to_node_id];
        ++out_degree[e.from_node_id];
    }

    network_model::BoundaryPoints out;
    for (const auto& e : graph.edges) {
        if (in_degree.find(e.from_node_id) == in_degree.end())
            out.entry_points.push_back(make_point(graph, e, e.from_node_id));
        if (out_degree.find(e.to_node_id) == out_degree.end())
            out.exit_points.push_back(make_point(graph, e, e.to_node_id));
    }

    network_log::engine_logger()->info("Found {} entry points, {} exit points",
        out.entry_points.size(), out.exit_points.size());
    return out;
}

} // namespace network_routing
