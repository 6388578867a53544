#include <network_geometry/projection.hpp>
#include <cmath>

namespace network_geometry {

namespace {

const double pi = 3.14159265358979323846;

double round_centimetres(double v) {
    return std::round(v * 100) / 100;
}

} // namespace

std::size_t reproject_from_geographic(network_model::Graph& graph) {
    double sum_lat = 0;
    double sum_lon = 0;
    std::size_t count = 0;
    for (const auto& n : graph.nodes) {
        if (!n.has_geo()) continue;
        sum_lat += *n.lat;
        sum_lon += *n.lon;
        ++count;
    }
    if (count == 0) return 0;

    const double center_lat = sum_lat / count;
    const double center_lon = sum_lon / count;
    const double lat_scale = metres_per_degree;
    const double lon_scale = metres_per_degree * std::abs(std::cos(center_lat * pi / 180));
    for (auto& n : graph.nodes) {
        if (!n.has_geo()) continue;
        n.x = round_centimetres((*n.lon - center_lon) * lon_scale);
        n.y = round_centimetres((*n.lat - center_lat) * lat_scale);
    }
    return count;
}

} // namespace network_geometry
