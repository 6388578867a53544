#include <network_geometry/normalizer.hpp>
#include <algorithm>

namespace network_geometry {

network_model::Bounds raw_bounds(const std::vector<network_model::Node>& nodes) {
    network_model::Bounds b;
    if (nodes.empty()) return b;
    b.xmin = b.xmax = nodes.front().x;
    b.ymin = b.ymax = nodes.front().y;
    for (const auto& n : nodes) {
        b.xmin = std::min(b.xmin, n.x);
        b.xmax = std::max(b.xmax, n.x);
        b.ymin = std::min(b.ymin, n.y);
        b.ymax = std::max(b.ymax, n.y);
    }
    return b;
}

network_model::Bounds normalize_coordinates(std::vector<network_model::Node>& nodes) {
    const network_model::Bounds b = raw_bounds(nodes);
    const double x_range = b.xmax - b.xmin;
    const double y_range = b.ymax - b.ymin;
    if (x_range <= 0 || y_range <= 0) return b;

    const double extent = 2 * viewport_half_width;
    const double scale = std::min(extent / x_range, extent / y_range);
    for (auto& n : nodes) {
        n.x = (n.x - b.xmin - x_range / 2) * scale;
        n.y = (n.y - b.ymin - y_range / 2) * scale;
    }
    return { -viewport_half_width, -viewport_half_width, viewport_half_width, viewport_half_width };
}

NormalizedGraph normalized_copy(const network_model::Graph& graph) {
    NormalizedGraph out;
    out.graph = graph;
    out.bounds = normalize_coordinates(out.graph.nodes);
    return out;
}

} // namespace network_geometry
