#include <network_routing/shortest_path.hpp>
#include <algorithm>
#include <cstdint>
#include <functional>
#include <queue>
#include <tuple>

namespace network_routing {

namespace {

const std::vector<AdjacencyMap::Link> no_links;

struct Reached {
    int hops = 0;
    std::string prev_node_id;
    std::string via_edge_id;
};

} // namespace

AdjacencyMap::AdjacencyMap(const network_model::Graph& graph) {
    for (const auto& e : graph.edges)
        links_[e.from_node_id].push_back({ e.to_node_id, e.id });
}

const std::vector<AdjacencyMap::Link>& AdjacencyMap::links_from(const std::string& node_id) const {
    auto it = links_.find(node_id);
    return it == links_.end() ? no_links : it->second;
}

std::optional<std::vector<std::string>> AdjacencyMap::shortest_path(const std::string& from_node_id,
    const std::string& to_node_id) const
{
    if (from_node_id == to_node_id) return std::nullopt;

    // (hops, discovery order, node); the order term makes ties deterministic.
    using Entry = std::tuple<int, std::uint64_t, std::string>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue;
    std::unordered_map<std::string, Reached> reached;
    std::unordered_map<std::string, bool> settled;
    std::uint64_t order = 0;

    reached[from_node_id] = Reached{};
    queue.push({ 0, order++, from_node_id });
    while (!queue.empty()) {
        auto [hops, seq, node] = queue.top();
        (void)seq;
        queue.pop();
        if (settled[node]) continue;
        settled[node] = true;
        if (node == to_node_id) break;

        for (const auto& link : links_from(node)) {
            const int next_hops = hops + 1;
            auto it = reached.find(link.to_node_id);
            if (it != reached.end() && it->second.hops <= next_hops) continue;
            reached[link.to_node_id] = Reached{ next_hops, node, link.edge_id };
            queue.push({ next_hops, order++, link.to_node_id });
        }
    }

    if (!settled[to_node_id]) return std::nullopt;

    std::vector<std::string> path;
    for (std::string at = to_node_id; at != from_node_id;) {
        const Reached& r = reached.at(at);
        path.push_back(r.via_edge_id);
        at = r.prev_node_id;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace network_routing
