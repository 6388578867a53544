// Scenario exporter: network file + export request -> simulation file bundle.
#include <network_export/bundle_writer.hpp>
#include <network_export/serializer.hpp>
#include <network_geometry/bbox_filter.hpp>
#include <network_geometry/normalizer.hpp>
#include <network_geometry/projection.hpp>
#include <network_geometry/statistics.hpp>
#include <network_loaders/network_loader.hpp>
#include <network_loaders/request_loader.hpp>
#include <network_log/logger.hpp>
#include <network_model/errors.hpp>
#include <network_routing/boundary_classifier.hpp>
#include <network_routing/route_generator.hpp>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Options {
    std::string network_path;
    std::string request_path;
    std::string out_dir = "scenario_out";
    std::string network_id;
    std::string log_file;
    std::string log_level = "info";
    bool keep_projected = false;
    bool reproject = false;
    bool info_only = false;
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: scenario_cli --network <file.net.xml|file.json> [--request <request.json>]\n"
        "                    [--out <dir>] [--network-id <id>] [--log-file <path>]\n"
        "                    [--log-level trace|debug|info|warn|error] [--keep-projected]\n"
        "                    [--reproject] [--info]\n");
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options o;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        bool ok = true;
        if (arg == "--network") ok = next(o.network_path);
        else if (arg == "--request") ok = next(o.request_path);
        else if (arg == "--out") ok = next(o.out_dir);
        else if (arg == "--network-id") ok = next(o.network_id);
        else if (arg == "--log-file") ok = next(o.log_file);
        else if (arg == "--log-level") ok = next(o.log_level);
        else if (arg == "--keep-projected") o.keep_projected = true;
        else if (arg == "--reproject") o.reproject = true;
        else if (arg == "--info") o.info_only = true;
        else ok = false;
        if (!ok) return std::nullopt;
    }
    if (o.network_path.empty()) return std::nullopt;
    if (!o.info_only && o.request_path.empty()) return std::nullopt;
    return o;
}

std::string network_id_from_path(const std::string& path) {
    std::string name = std::filesystem::path(path).filename().string();
    for (const char* suffix : { ".net.xml", ".json", ".xml" }) {
        const std::string s = suffix;
        if (name.size() > s.size() && name.compare(name.size() - s.size(), s.size(), s) == 0)
            return name.substr(0, name.size() - s.size());
    }
    return name;
}

std::vector<std::string> ids_of(const std::vector<network_model::BoundaryPoint>& points) {
    std::vector<std::string> ids;
    for (const auto& p : points) ids.push_back(p.id);
    return ids;
}

void print_info(const network_model::Graph& graph, const network_model::Bounds& bounds,
    const network_model::BoundaryPoints& boundary)
{
    const auto stats = network_geometry::compute_statistics(graph);
    printf("nodes: %zu\nedges: %zu\ntotal_length: %.2f\naverage_speed: %.2f\ndensity: %.3f\n",
        stats.node_count, stats.edge_count, stats.total_length, stats.average_speed, stats.density);
    printf("bounds: [%.3f, %.3f] x [%.3f, %.3f]\n", bounds.xmin, bounds.xmax, bounds.ymin, bounds.ymax);
    for (const auto& p : boundary.entry_points) printf("entry %s %.3f %.3f\n", p.id.c_str(), p.x, p.y);
    for (const auto& p : boundary.exit_points) printf("exit %s %.3f %.3f\n", p.id.c_str(), p.x, p.y);
}

int run(const Options& opts) {
    auto logger = network_log::engine_logger();

    auto loaded = network_loaders::load_network_file(opts.network_path);
    if (!loaded) {
        logger->error("Cannot open network file {}", opts.network_path);
        return 1;
    }
    for (const auto& w : loaded->warnings) logger->warn("{}", w);
    network_model::Graph graph = std::move(loaded->graph);
    logger->info("Parsed network {}: {} nodes, {} edges", opts.network_path, graph.nodes.size(), graph.edges.size());

    if (opts.reproject) {
        const auto projected = network_geometry::reproject_from_geographic(graph);
        logger->info("Re-projected {} nodes from geographic coordinates", projected);
    }

    std::optional<network_loaders::ExportRequest> request;
    if (!opts.request_path.empty()) {
        request = network_loaders::load_export_request_file(opts.request_path);
        if (!request) {
            logger->error("Cannot open request file {}", opts.request_path);
            return 1;
        }
    }

    std::string network_id = opts.network_id;
    if (network_id.empty() && request) network_id = request->config.network_id;
    if (network_id.empty()) network_id = network_id_from_path(opts.network_path);

    if (const auto box = network_geometry::bounds_from_network_id(network_id)) {
        graph = network_geometry::filter_by_bounds(graph, *box);
        logger->info("Filtered to selection box: {} nodes, {} edges", graph.nodes.size(), graph.edges.size());
    }

    network_model::Bounds bounds = network_geometry::raw_bounds(graph.nodes);
    if (!opts.keep_projected) bounds = network_geometry::normalize_coordinates(graph.nodes);

    const network_model::BoundaryPoints boundary = network_routing::classify_boundary(graph);
    if (opts.info_only) {
        print_info(graph, bounds, boundary);
        return 0;
    }

    network_model::Scenario scenario;
    scenario.config = request->config;
    scenario.config.network_id = network_id;
    if (scenario.config.name == "simulation") scenario.config.name = "simulation_" + network_id;
    scenario.entry_edge_ids = request->entry_points ? *request->entry_points : ids_of(boundary.entry_points);
    scenario.exit_edge_ids = request->exit_points ? *request->exit_points : ids_of(boundary.exit_points);

    network_routing::RouteRequest route_request;
    route_request.total_vehicles = scenario.config.total_vehicles;
    route_request.distribution = scenario.config.distribution;
    route_request.entry_edge_ids = scenario.entry_edge_ids;
    route_request.exit_edge_ids = scenario.exit_edge_ids;
    route_request.horizon = scenario.config.horizon;
    route_request.seed = scenario.config.seed;
    scenario.routes = network_routing::generate_routes(graph, route_request);
    scenario.graph = std::move(graph);

    const auto bundle = network_export::serialize_scenario(scenario);
    network_export::write_bundle(bundle, opts.out_dir);

    std::string command;
    for (const auto& part : network_export::network_compile_command()) {
        if (!command.empty()) command += ' ';
        command += part;
    }
    printf("Scenario written to %s\nCompile the network there with: %s\n", opts.out_dir.c_str(), command.c_str());
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 2;
    }

    network_log::LogSettings log_settings;
    log_settings.file_path = opts->log_file;
    log_settings.level = network_log::level_from_string(opts->log_level);
    network_log::configure_logging(log_settings);

    try {
        return run(*opts);
    } catch (const network_model::ScenarioError& e) {
        network_log::engine_logger()->error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        network_log::engine_logger()->error("Export failed: {}", e.what());
        return 1;
    }
}
