#include <network_export/serializer.hpp>
#include <network_geometry/normalizer.hpp>
#include <nlohmann/json.hpp>
#include <unordered_set>

namespace network_export {

namespace {

using ordered_json = nlohmann::ordered_json;

ordered_json optional_number(const std::optional<double>& v) {
    return v ? ordered_json(*v) : ordered_json(nullptr);
}

ordered_json distribution_json(const network_model::VehicleDistribution& d) {
    ordered_json j;
    j["vehicle_type"] = d.vehicle_type;
    j["percentage"] = d.percentage;
    j["color"] = d.color;
    j["period"] = d.period;
    j["attributes"] = d.attributes ? ordered_json(*d.attributes) : ordered_json(nullptr);
    return j;
}

ordered_json reconstruction_instructions() {
    return ordered_json::array({
        "Write nodes.nod.xml with one <node id x y type> per entry of 'nodes'.",
        "Write edges.edg.xml with one <edge id from to numLanes speed> per entry of 'edges'.",
        "Write routes.rou.xml: the car, motorcycle, bus and truck vTypes, then for each entry of 'routes' "
        "sorted by depart_time a <route id=\"<id>_route\" edges> followed by <vehicle id type route depart color>.",
        "Write simulation.sumocfg with net-file network.net.xml, route-files routes.rou.xml, "
        "begin 0 and end simulation_config.simulation_time.",
        "Compile the network: netconvert --node-files nodes.nod.xml --edge-files edges.edg.xml "
        "--output-file network.net.xml --no-turnarounds",
        "Run: sumo-gui -c simulation.sumocfg",
    });
}

} // namespace

std::string metadata_document(const network_model::Scenario& scenario, const std::string& created_at) {
    const auto& graph = scenario.graph;
    const auto& cfg = scenario.config;
    const std::unordered_set<std::string> entries(scenario.entry_edge_ids.begin(), scenario.entry_edge_ids.end());
    const std::unordered_set<std::string> exits(scenario.exit_edge_ids.begin(), scenario.exit_edge_ids.end());

    std::unordered_set<std::string> entry_nodes;
    std::unordered_set<std::string> exit_nodes;
    for (const auto& e : graph.edges) {
        if (entries.count(e.id)) entry_nodes.insert(e.from_node_id);
        if (exits.count(e.id)) exit_nodes.insert(e.to_node_id);
    }

    ordered_json doc;

    ordered_json& info = doc["simulation_info"];
    info["name"] = cfg.name;
    info["network_id"] = cfg.network_id;
    info["created_at"] = created_at;
    info["simulation_time"] = cfg.horizon;
    info["total_vehicles"] = cfg.total_vehicles;
    info["generated_vehicles"] = scenario.routes.size();
    info["files"] = {
        { "nodes", file_names::nodes },
        { "edges", file_names::edges },
        { "routes", file_names::routes },
        { "config", file_names::run_config },
        { "network", file_names::compiled_network },
    };

    const network_model::Bounds b = network_geometry::raw_bounds(graph.nodes);
    ordered_json& net = doc["network_data"];
    net["id"] = cfg.network_id;
    net["node_count"] = graph.nodes.size();
    net["edge_count"] = graph.edges.size();
    net["bounds"] = { { "xmin", b.xmin }, { "ymin", b.ymin }, { "xmax", b.xmax }, { "ymax", b.ymax } };

    ordered_json& nodes = doc["nodes"] = ordered_json::array();
    for (const auto& n : graph.nodes) {
        ordered_json j;
        j["id"] = n.id;
        j["x"] = n.x;
        j["y"] = n.y;
        j["lat"] = optional_number(n.lat);
        j["lon"] = optional_number(n.lon);
        j["type"] = network_model::kind_to_string(n.kind);
        j["is_entry_point"] = entry_nodes.count(n.id) > 0;
        j["is_exit_point"] = exit_nodes.count(n.id) > 0;
        nodes.push_back(std::move(j));
    }

    ordered_json& edges = doc["edges"] = ordered_json::array();
    for (const auto& e : graph.edges) {
        ordered_json j;
        j["id"] = e.id;
        j["from"] = e.from_node_id;
        j["to"] = e.to_node_id;
        j["lane_count"] = e.lane_count;
        j["speed"] = e.speed;
        j["length"] = e.length;
        ordered_json shape = ordered_json::array();
        for (const auto& p : e.shape)
            shape.push_back({ p.x, p.y });
        j["shape"] = std::move(shape);
        j["is_entry_point"] = entries.count(e.id) > 0;
        j["is_exit_point"] = exits.count(e.id) > 0;
        edges.push_back(std::move(j));
    }

    ordered_json& sim = doc["simulation_config"];
    sim["total_vehicles"] = cfg.total_vehicles;
    sim["simulation_time"] = cfg.horizon;
    sim["random_seed"] = cfg.seed ? ordered_json(*cfg.seed) : ordered_json(nullptr);
    sim["vehicle_distribution"] = ordered_json::array();
    for (const auto& d : cfg.distribution)
        sim["vehicle_distribution"].push_back(distribution_json(d));

    doc["selected_points"] = {
        { "entry_points", scenario.entry_edge_ids },
        { "exit_points", scenario.exit_edge_ids },
    };

    ordered_json& routes = doc["routes"] = ordered_json::array();
    for (const auto& r : scenario.routes) {
        ordered_json j;
        j["id"] = r.id;
        j["edges"] = r.edges;
        j["vehicle_type"] = r.vehicle_type;
        j["depart_time"] = r.depart_time;
        j["color"] = r.color;
        routes.push_back(std::move(j));
    }

    doc["reconstruction_instructions"] = reconstruction_instructions();
    return doc.dump(2) + "\n";
}

} // namespace network_export
