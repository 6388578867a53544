#include <network_loaders/metadata_loader.hpp>
#include <network_model/errors.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace network_loaders {

namespace {

const char* const required_sections[] = {
    "simulation_info", "network_data", "nodes", "edges",
    "simulation_config", "selected_points", "routes",
};

std::optional<double> optional_double(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<double>();
}

network_model::Node node_from_json(const nlohmann::json& n) {
    network_model::Node node;
    node.id = n.at("id").get<std::string>();
    node.x = n.at("x").get<double>();
    node.y = n.at("y").get<double>();
    node.lat = optional_double(n, "lat");
    node.lon = optional_double(n, "lon");
    node.kind = network_model::kind_from_string(n.value("type", std::string("priority")));
    return node;
}

network_model::Edge edge_from_json(const nlohmann::json& e) {
    network_model::Edge edge;
    edge.id = e.at("id").get<std::string>();
    edge.from_node_id = e.at("from").get<std::string>();
    edge.to_node_id = e.at("to").get<std::string>();
    edge.lane_count = e.at("lane_count").get<int>();
    edge.speed = e.at("speed").get<double>();
    edge.length = e.at("length").get<double>();
    if (e.contains("shape")) {
        for (const auto& p : e["shape"])
            edge.shape.push_back({ p.at(0).get<double>(), p.at(1).get<double>() });
    }
    return edge;
}

network_model::VehicleDistribution distribution_from_json(const nlohmann::json& d) {
    network_model::VehicleDistribution dist;
    dist.vehicle_type = d.at("vehicle_type").get<std::string>();
    dist.percentage = d.at("percentage").get<double>();
    dist.color = d.at("color").get<std::string>();
    dist.period = d.at("period").get<double>();
    if (d.contains("attributes") && d["attributes"].is_string())
        dist.attributes = d["attributes"].get<std::string>();
    return dist;
}

network_model::RouteAssignment route_from_json(const nlohmann::json& r) {
    network_model::RouteAssignment route;
    route.id = r.at("id").get<std::string>();
    route.edges = r.at("edges").get<std::vector<std::string>>();
    route.vehicle_type = r.at("vehicle_type").get<std::string>();
    route.depart_time = r.at("depart_time").get<double>();
    route.color = r.at("color").get<std::string>();
    return route;
}

network_model::Scenario parse_metadata(const nlohmann::json& j) {
    if (!j.is_object()) throw network_model::MalformedInputError("metadata: not a JSON object");
    for (const char* section : required_sections) {
        if (!j.contains(section))
            throw network_model::MalformedInputError(std::string("metadata: missing ") + section);
    }

    network_model::Scenario s;
    const auto& info = j["simulation_info"];
    s.config.name = info.value("name", std::string("simulation"));
    s.config.network_id = info.value("network_id", std::string());

    const auto& cfg = j["simulation_config"];
    s.config.total_vehicles = cfg.at("total_vehicles").get<int>();
    s.config.horizon = cfg.at("simulation_time").get<double>();
    if (cfg.contains("random_seed") && !cfg["random_seed"].is_null())
        s.config.seed = cfg["random_seed"].get<std::uint32_t>();
    for (const auto& d : cfg.at("vehicle_distribution"))
        s.config.distribution.push_back(distribution_from_json(d));

    for (const auto& n : j["nodes"])
        s.graph.nodes.push_back(node_from_json(n));
    for (const auto& e : j["edges"])
        s.graph.edges.push_back(edge_from_json(e));

    const auto& selected = j["selected_points"];
    s.entry_edge_ids = selected.at("entry_points").get<std::vector<std::string>>();
    s.exit_edge_ids = selected.at("exit_points").get<std::vector<std::string>>();

    for (const auto& r : j["routes"])
        s.routes.push_back(route_from_json(r));
    return s;
}

} // namespace

network_model::Scenario load_scenario_from_metadata(std::istream& in) {
    try {
        return parse_metadata(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        throw network_model::MalformedInputError(std::string("metadata: ") + e.what());
    }
}

std::optional<network_model::Scenario> load_scenario_from_metadata_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_scenario_from_metadata(f);
}

} // namespace network_loaders
