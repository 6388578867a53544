#include <network_export/serializer.hpp>
#include <network_log/logger.hpp>
#include "vehicle_types.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <charconv>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace network_export {

namespace {

const char* const xsi_namespace = "http://www.w3.org/2001/XMLSchema-instance";
const char* const indent = "    ";

pugi::xml_node begin_document(pugi::xml_document& doc, const char* root_name, const char* schema) {
    pugi::xml_node decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";
    pugi::xml_node root = doc.append_child(root_name);
    root.append_attribute("xmlns:xsi") = xsi_namespace;
    root.append_attribute("xsi:noNamespaceSchemaLocation") = schema;
    return root;
}

std::string to_text(const pugi::xml_document& doc) {
    std::ostringstream out;
    doc.save(out, indent, pugi::format_default, pugi::encoding_utf8);
    return out.str();
}

void set_number(pugi::xml_node node, const char* name, double value) {
    node.append_attribute(name) = format_number(value).c_str();
}

void set_text(pugi::xml_node node, const char* name, const std::string& value) {
    node.append_attribute(name) = value.c_str();
}

void add_value(pugi::xml_node section, const char* name, const std::string& value) {
    section.append_child(name).append_attribute("value") = value.c_str();
}

void add_vehicle_type(pugi::xml_node root, const VehicleTypeSpec& t, const std::string& id) {
    pugi::xml_node v = root.append_child("vType");
    set_text(v, "id", id);
    set_number(v, "accel", t.accel);
    set_number(v, "decel", t.decel);
    set_number(v, "sigma", t.sigma);
    set_number(v, "length", t.length);
    set_number(v, "minGap", t.min_gap);
    set_number(v, "maxSpeed", t.max_speed);
    set_text(v, "guiShape", t.gui_shape);
}

// Id of the first endpoint missing from node_ids, if any.
std::optional<std::string> missing_endpoint(const std::unordered_set<std::string>& node_ids,
    const network_model::Edge& e)
{
    if (!node_ids.count(e.from_node_id)) return e.from_node_id;
    if (!node_ids.count(e.to_node_id)) return e.to_node_id;
    return std::nullopt;
}

std::string join_edges(const std::vector<std::string>& edges) {
    std::string out;
    for (const auto& e : edges) {
        if (!out.empty()) out += ' ';
        out += e;
    }
    return out;
}

} // namespace

std::string format_number(double value) {
    char buf[64];
    const auto result = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, result.ptr);
}

std::string nodes_document(const network_model::Graph& graph) {
    pugi::xml_document doc;
    pugi::xml_node root = begin_document(doc, "nodes", "http://sumo.dlr.de/xsd/nodes_file.xsd");
    for (const auto& n : graph.nodes) {
        pugi::xml_node node = root.append_child("node");
        set_text(node, "id", n.id);
        set_number(node, "x", n.x);
        set_number(node, "y", n.y);
        set_text(node, "type", network_model::kind_to_string(n.kind));
    }
    return to_text(doc);
}

std::string edges_document(const network_model::Graph& graph) {
    std::unordered_set<std::string> node_ids;
    for (const auto& n : graph.nodes)
        node_ids.insert(n.id);

    pugi::xml_document doc;
    pugi::xml_node root = begin_document(doc, "edges", "http://sumo.dlr.de/xsd/edges_file.xsd");
    for (const auto& e : graph.edges) {
        if (const auto missing = missing_endpoint(node_ids, e)) {
            network_log::engine_logger()->warn("Leaving edge {} out of edges document, it references missing node {}",
                e.id, *missing);
            continue;
        }
        pugi::xml_node edge = root.append_child("edge");
        set_text(edge, "id", e.id);
        set_text(edge, "from", e.from_node_id);
        set_text(edge, "to", e.to_node_id);
        edge.append_attribute("numLanes") = e.lane_count;
        set_number(edge, "speed", e.speed);
    }
    return to_text(doc);
}

std::string routes_document(const std::vector<network_model::RouteAssignment>& routes,
    const std::vector<network_model::VehicleDistribution>& distribution)
{
    pugi::xml_document doc;
    pugi::xml_node root = begin_document(doc, "routes", "http://sumo.dlr.de/xsd/routes_file.xsd");
    for (const auto& t : standard_vehicle_types)
        add_vehicle_type(root, t, t.id);

    // Distributed types outside the standard set borrow the car parameters.
    std::unordered_set<std::string> extra_types;
    for (const auto& d : distribution) {
        if (is_standard_vehicle_type(d.vehicle_type) || !extra_types.insert(d.vehicle_type).second) continue;
        add_vehicle_type(root, standard_vehicle_types[0], d.vehicle_type);
    }

    std::vector<const network_model::RouteAssignment*> ordered;
    for (const auto& r : routes)
        ordered.push_back(&r);
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const auto* a, const auto* b) { return a->depart_time < b->depart_time; });

    for (const auto* r : ordered) {
        const std::string route_id = r->id + "_route";
        pugi::xml_node route = root.append_child("route");
        set_text(route, "id", route_id);
        set_text(route, "edges", join_edges(r->edges));

        pugi::xml_node vehicle = root.append_child("vehicle");
        set_text(vehicle, "id", r->id);
        set_text(vehicle, "type", r->vehicle_type);
        set_text(vehicle, "route", route_id);
        set_number(vehicle, "depart", r->depart_time);
        set_text(vehicle, "color", r->color);
    }
    return to_text(doc);
}

std::string run_configuration_document(double horizon) {
    pugi::xml_document doc;
    pugi::xml_node root = begin_document(doc, "configuration", "http://sumo.dlr.de/xsd/sumoConfiguration.xsd");

    pugi::xml_node input = root.append_child("input");
    add_value(input, "net-file", file_names::compiled_network);
    add_value(input, "route-files", file_names::routes);

    pugi::xml_node time = root.append_child("time");
    add_value(time, "begin", "0");
    add_value(time, "end", format_number(horizon));

    // Broken routes and collisions are reported, not fatal.
    pugi::xml_node processing = root.append_child("processing");
    add_value(processing, "ignore-route-errors", "true");
    add_value(processing, "collision.action", "warn");

    pugi::xml_node report = root.append_child("report");
    add_value(report, "verbose", "true");
    add_value(report, "no-step-log", "true");
    return to_text(doc);
}

} // namespace network_export
