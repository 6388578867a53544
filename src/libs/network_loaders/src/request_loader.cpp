#include <network_loaders/request_loader.hpp>
#include <network_model/errors.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>

namespace network_loaders {

namespace {

std::vector<std::string> parse_id_list(const nlohmann::json& j, const char* key) {
    if (!j[key].is_array())
        throw network_model::InvalidRequestError(std::string(key) + " must be a list of edge ids");
    std::vector<std::string> ids;
    for (const auto& id : j[key]) {
        if (id.is_string())
            ids.push_back(id.get<std::string>());
        else if (id.is_object() && id.contains("id") && id["id"].is_string())
            ids.push_back(id["id"].get<std::string>());
        else
            throw network_model::InvalidRequestError(std::string(key) + " contains a non-string id");
    }
    return ids;
}

std::optional<int> int_value(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(u);
    }
    if (v.is_number_integer()) {
        const auto i = v.get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(i);
    }
    return std::nullopt;
}

network_model::VehicleDistribution parse_distribution(const nlohmann::json& d) {
    if (!d.is_object() || !d.contains("vehicle_type") || !d["vehicle_type"].is_string())
        throw network_model::InvalidRequestError("vehicle_distribution entry needs a vehicle_type");
    if (!d.contains("percentage") || !d["percentage"].is_number())
        throw network_model::InvalidRequestError("vehicle_distribution entry needs a numeric percentage");

    network_model::VehicleDistribution out;
    out.vehicle_type = d["vehicle_type"].get<std::string>();
    out.percentage = d["percentage"].get<double>();
    if (d.contains("color") && d["color"].is_string()) out.color = d["color"].get<std::string>();
    if (d.contains("period") && d["period"].is_number()) out.period = d["period"].get<double>();
    if (d.contains("attributes") && d["attributes"].is_string()) out.attributes = d["attributes"].get<std::string>();
    return out;
}

ExportRequest parse_request(const nlohmann::json& j) {
    if (!j.is_object()) throw network_model::InvalidRequestError("export request must be a JSON object");

    ExportRequest req;
    auto& cfg = req.config;
    if (j.contains("name") && j["name"].is_string()) cfg.name = j["name"].get<std::string>();
    if (j.contains("network_id") && j["network_id"].is_string()) cfg.network_id = j["network_id"].get<std::string>();
    if (j.contains("total_vehicles")) {
        const auto total = int_value(j["total_vehicles"]);
        if (!total) throw network_model::InvalidRequestError("total_vehicles must be a 32-bit integer");
        cfg.total_vehicles = *total;
    }
    if (j.contains("simulation_time")) {
        if (!j["simulation_time"].is_number())
            throw network_model::InvalidRequestError("simulation_time must be a number");
        cfg.horizon = j["simulation_time"].get<double>();
    }
    if (j.contains("random_seed") && !j["random_seed"].is_null()) {
        const auto& seed = j["random_seed"];
        if (!seed.is_number_integer() || seed.get<long long>() < 0
            || seed.get<long long>() > std::numeric_limits<std::uint32_t>::max())
            throw network_model::InvalidRequestError("random_seed must be a non-negative 32-bit integer");
        cfg.seed = static_cast<std::uint32_t>(seed.get<long long>());
    }
    if (j.contains("vehicle_distribution")) {
        if (!j["vehicle_distribution"].is_array())
            throw network_model::InvalidRequestError("vehicle_distribution must be a list");
        for (const auto& d : j["vehicle_distribution"])
            cfg.distribution.push_back(parse_distribution(d));
    }
    if (j.contains("entry_points")) req.entry_points = parse_id_list(j, "entry_points");
    if (j.contains("exit_points")) req.exit_points = parse_id_list(j, "exit_points");
    return req;
}

} // namespace

ExportRequest load_export_request(std::istream& in) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        throw network_model::InvalidRequestError(std::string("export request: ") + e.what());
    }
    return parse_request(j);
}

std::optional<ExportRequest> load_export_request_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_export_request(f);
}

} // namespace network_loaders
