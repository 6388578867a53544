#include <network_geometry/bbox_filter.hpp>
#include <algorithm>
#include <regex>
#include <stdexcept>
#include <unordered_set>

namespace network_geometry {

std::optional<network_model::GeoBounds> bounds_from_network_id(const std::string& network_id) {
    static const std::regex pattern(R"(map_(-?\d+)_(-?\d+)_(-?\d+)_(-?\d+))");
    std::smatch m;
    if (!std::regex_search(network_id, m, pattern, std::regex_constants::match_continuous))
        return std::nullopt;

    double v[4];
    for (int i = 0; i < 4; ++i) {
        try {
            v[i] = std::stod(m[i + 1].str()) / 1000;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    network_model::GeoBounds box;
    box.north = std::max(v[0], v[1]);
    box.south = std::min(v[0], v[1]);
    box.east = std::max(v[2], v[3]);
    box.west = std::min(v[2], v[3]);
    return box;
}

bool contains(const network_model::GeoBounds& box, const network_model::Node& node) {
    if (!node.has_geo()) return false;
    return box.west <= *node.lon && *node.lon <= box.east
        && box.south <= *node.lat && *node.lat <= box.north;
}

network_model::Graph filter_by_bounds(const network_model::Graph& graph, const network_model::GeoBounds& box) {
    network_model::Graph out;
    std::unordered_set<std::string> kept;
    for (const auto& n : graph.nodes) {
        if (!contains(box, n)) continue;
        kept.insert(n.id);
        out.nodes.push_back(n);
    }
    for (const auto& e : graph.edges) {
        if (kept.count(e.from_node_id) && kept.count(e.to_node_id))
            out.edges.push_back(e);
    }
    return out;
}

} // namespace network_geometry
