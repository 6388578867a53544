#include <network_loaders/network_loader.hpp>
#include <network_model/errors.hpp>
#include "graph_builder.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace network_loaders {

namespace {

// Ids arrive as strings, or as integers from OSM-derived graphs.
std::string id_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return "";
    const auto& v = j[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    return "";
}

RawNumeric numeric_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return std::monostate{};
    return decode_json_numeric(j[key]);
}

std::optional<double> optional_number(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return resolve_numeric(decode_json_numeric(j[key]));
}

std::optional<network_model::Node> parse_node(const nlohmann::json& n, std::vector<std::string>& warnings) {
    if (!n.is_object()) {
        warnings.push_back("Node entry is not an object, skipping");
        return std::nullopt;
    }
    network_model::Node node;
    node.id = id_field(n, "id");
    const auto x = optional_number(n, "x");
    const auto y = optional_number(n, "y");
    if (node.id.empty() || !x || !y) {
        warnings.push_back("Node " + node.id + " has missing coordinates, skipping");
        return std::nullopt;
    }
    node.x = *x;
    node.y = *y;
    node.lat = optional_number(n, "lat");
    node.lon = optional_number(n, "lon");
    const char* kind_key = n.contains("type") ? "type" : "kind";
    if (n.contains(kind_key) && n[kind_key].is_string())
        node.kind = network_model::kind_from_string(n[kind_key].get<std::string>());
    return node;
}

std::optional<RawEdge> parse_edge(const nlohmann::json& e, std::vector<std::string>& warnings) {
    if (!e.is_object()) {
        warnings.push_back("Edge entry is not an object, skipping");
        return std::nullopt;
    }
    RawEdge edge;
    edge.id = id_field(e, "id");
    edge.from_node_id = id_field(e, "from");
    edge.to_node_id = id_field(e, "to");
    if (edge.id.empty() || edge.from_node_id.empty() || edge.to_node_id.empty()) {
        warnings.push_back("Edge " + edge.id + " has missing attributes, skipping");
        return std::nullopt;
    }
    for (const char* key : { "lanes", "numLanes", "lane_count" }) {
        if (e.contains(key)) {
            edge.lanes = numeric_field(e, key);
            break;
        }
    }
    edge.speed = numeric_field(e, "speed");
    edge.length = numeric_field(e, "length");
    return edge;
}

LoadedNetwork parse_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("nodes") || !j["nodes"].is_array())
        throw network_model::MalformedInputError("network JSON: missing nodes array");
    if (!j.contains("edges") || !j["edges"].is_array())
        throw network_model::MalformedInputError("network JSON: missing edges array");

    LoadedNetwork out;
    std::vector<network_model::Node> nodes;
    for (const auto& n : j["nodes"]) {
        auto node = parse_node(n, out.warnings);
        if (node) nodes.push_back(std::move(*node));
    }
    add_nodes(out, std::move(nodes));

    std::vector<RawEdge> edges;
    for (const auto& e : j["edges"]) {
        auto edge = parse_edge(e, out.warnings);
        if (edge) edges.push_back(std::move(*edge));
    }
    add_edges(out, edges);
    return out;
}

} // namespace

LoadedNetwork load_network_from_json(std::istream& in) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        throw network_model::MalformedInputError(std::string("network JSON: ") + e.what());
    }
    return parse_json(j);
}

std::optional<LoadedNetwork> load_network_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_network_from_json(f);
}

std::optional<LoadedNetwork> load_network_file(const std::string& path) {
    const std::string suffix = ".json";
    if (path.size() >= suffix.size() && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0)
        return load_network_from_json_file(path);
    return load_network_from_xml_file(path);
}

} // namespace network_loaders
