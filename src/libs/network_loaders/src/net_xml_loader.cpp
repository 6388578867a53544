#include <network_loaders/network_loader.hpp>
#include <network_model/errors.hpp>
#include "graph_builder.hpp"
#include <pugixml.hpp>
#include <fstream>

namespace network_loaders {

namespace {

std::string attribute_text(const pugi::xml_node& n, const char* name) {
    return n.attribute(name).value();
}

std::optional<network_model::Node> parse_node_element(const pugi::xml_node& n, std::vector<std::string>& warnings) {
    const std::string id = attribute_text(n, "id");
    const std::string x_str = attribute_text(n, "x");
    const std::string y_str = attribute_text(n, "y");
    if (id.empty() || x_str.empty() || y_str.empty()) {
        warnings.push_back("Node " + id + " has missing coordinates, skipping");
        return std::nullopt;
    }

    const auto x = parse_number(x_str);
    const auto y = parse_number(y_str);
    if (!x || !y) {
        warnings.push_back("Node " + id + " has invalid coordinates, skipping");
        return std::nullopt;
    }

    network_model::Node node;
    node.id = id;
    node.x = *x;
    node.y = *y;
    node.kind = network_model::kind_from_string(attribute_text(n, "type"));

    const std::string lat_str = attribute_text(n, "lat");
    const std::string lon_str = attribute_text(n, "lon");
    if (!lat_str.empty()) {
        node.lat = parse_number(lat_str);
        if (!node.lat) {
            warnings.push_back("Node " + id + " has invalid coordinates, skipping");
            return std::nullopt;
        }
    }
    if (!lon_str.empty()) {
        node.lon = parse_number(lon_str);
        if (!node.lon) {
            warnings.push_back("Node " + id + " has invalid coordinates, skipping");
            return std::nullopt;
        }
    }
    return node;
}

std::optional<RawEdge> parse_edge_element(const pugi::xml_node& e, std::vector<std::string>& warnings) {
    RawEdge edge;
    edge.id = attribute_text(e, "id");
    edge.from_node_id = attribute_text(e, "from");
    edge.to_node_id = attribute_text(e, "to");
    if (edge.id.empty() || edge.from_node_id.empty() || edge.to_node_id.empty()) {
        warnings.push_back("Edge " + edge.id + " has missing attributes, skipping");
        return std::nullopt;
    }
    edge.lanes = decode_attribute_numeric(e.attribute("numLanes").as_string(nullptr));
    edge.speed = decode_attribute_numeric(e.attribute("speed").as_string(nullptr));
    edge.length = decode_attribute_numeric(e.attribute("length").as_string(nullptr));
    return edge;
}

} // namespace

LoadedNetwork load_network_from_xml(std::istream& in) {
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load(in);
    if (!result)
        throw network_model::MalformedInputError(std::string("network XML: ") + result.description());
    if (!doc.document_element())
        throw network_model::MalformedInputError("network XML: no root element");

    LoadedNetwork out;
    std::vector<network_model::Node> nodes;
    for (const pugi::xpath_node& xn : doc.select_nodes("//node")) {
        auto node = parse_node_element(xn.node(), out.warnings);
        if (node) nodes.push_back(std::move(*node));
    }
    add_nodes(out, std::move(nodes));

    std::vector<RawEdge> edges;
    for (const pugi::xpath_node& xe : doc.select_nodes("//edge")) {
        auto edge = parse_edge_element(xe.node(), out.warnings);
        if (edge) edges.push_back(std::move(*edge));
    }
    add_edges(out, edges);
    return out;
}

std::optional<LoadedNetwork> load_network_from_xml_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return std::nullopt;
    return load_network_from_xml(f);
}

} // namespace network_loaders
