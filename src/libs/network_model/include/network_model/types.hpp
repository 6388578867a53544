#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace network_model {

struct Coordinate {
    double x = 0;
    double y = 0;
};

struct Node {
    std::string id;
    double x = 0;
    double y = 0;
    std::optional<double> lat;
    std::optional<double> lon;
    enum class Kind { Priority, SignalControlled };
    Kind kind = Kind::Priority;

    bool has_geo() const { return lat.has_value() && lon.has_value(); }
};

struct Edge {
    std::string id;
    std::string from_node_id;
    std::string to_node_id;
    int lane_count = 2;
    double speed = 13.89;
    double length = 100;
    // Two points: (lat, lon) pairs when both endpoints are geographic, else planar (x, y).
    std::vector<Coordinate> shape;
};

struct Graph {
    std::vector<Node> nodes;
    std::vector<Edge> edges;

    const Node* find_node(const std::string& id) const {
        for (const auto& n : nodes)
            if (n.id == id) return &n;
        return nullptr;
    }

    const Edge* find_edge(const std::string& id) const {
        for (const auto& e : edges)
            if (e.id == id) return &e;
        return nullptr;
    }
};

// Planar box in the coordinates of the graph it was computed from.
struct Bounds {
    double xmin = 0;
    double ymin = 0;
    double xmax = 0;
    double ymax = 0;
};

// Geographic box in degrees; north >= south and east >= west.
struct GeoBounds {
    double north = 0;
    double south = 0;
    double east = 0;
    double west = 0;
};

inline const char* kind_to_string(Node::Kind kind) {
    return kind == Node::Kind::SignalControlled ? "traffic_light" : "priority";
}

inline Node::Kind kind_from_string(const std::string& s) {
    if (s == "traffic_light") return Node::Kind::SignalControlled;
    return Node::Kind::Priority;
}

} // namespace network_model
