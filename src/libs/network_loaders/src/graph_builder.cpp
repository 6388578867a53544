#include "graph_builder.hpp"
#include <unordered_map>
#include <unordered_set>

namespace network_loaders {

namespace {

int resolve_lane_count(const RawNumeric& raw) {
    const auto v = resolve_numeric(raw);
    if (!v) return default_lane_count;
    if (!(*v >= 1)) return 1;
    if (*v >= 1e6) return 1000000;
    return static_cast<int>(*v);
}

double resolve_positive(const RawNumeric& raw, double fallback) {
    const auto v = resolve_numeric(raw);
    return v && *v > 0 ? *v : fallback;
}

} // namespace

void add_nodes(LoadedNetwork& out, std::vector<network_model::Node> nodes) {
    std::unordered_set<std::string> seen;
    for (const auto& n : out.graph.nodes)
        seen.insert(n.id);
    for (auto& node : nodes) {
        if (!seen.insert(node.id).second) {
            out.warnings.push_back("Node " + node.id + " is duplicated, skipping");
            continue;
        }
        out.graph.nodes.push_back(std::move(node));
    }
}

void add_edges(LoadedNetwork& out, const std::vector<RawEdge>& edges) {
    std::unordered_map<std::string, const network_model::Node*> by_id;
    for (const auto& n : out.graph.nodes)
        by_id.emplace(n.id, &n);
    std::unordered_set<std::string> seen;
    for (const auto& e : out.graph.edges)
        seen.insert(e.id);

    for (const auto& raw : edges) {
        if (seen.count(raw.id)) {
            out.warnings.push_back("Edge " + raw.id + " is duplicated, skipping");
            continue;
        }
        auto from_it = by_id.find(raw.from_node_id);
        auto to_it = by_id.find(raw.to_node_id);
        if (from_it == by_id.end() || to_it == by_id.end()) {
            out.warnings.push_back("Edge " + raw.id + " has missing node coordinates, skipping");
            continue;
        }
        seen.insert(raw.id);
        const network_model::Node& from = *from_it->second;
        const network_model::Node& to = *to_it->second;

        network_model::Edge edge;
        edge.id = raw.id;
        edge.from_node_id = raw.from_node_id;
        edge.to_node_id = raw.to_node_id;
        edge.lane_count = resolve_lane_count(raw.lanes);
        edge.speed = resolve_positive(raw.speed, default_speed);
        edge.length = resolve_positive(raw.length, default_length);
        if (from.has_geo() && to.has_geo())
            edge.shape = { { *from.lat, *from.lon }, { *to.lat, *to.lon } };
        else
            edge.shape = { { from.x, from.y }, { to.x, to.y } };
        out.graph.edges.push_back(std::move(edge));
    }
}

} // namespace network_loaders
