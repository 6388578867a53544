#include <gtest/gtest.h>
#include <network_model/errors.hpp>
#include <network_routing/boundary_classifier.hpp>
#include <network_routing/route_generator.hpp>
#include <network_routing/shortest_path.hpp>
#include <cmath>
#include <numeric>

using namespace network_routing;
using network_model::Edge;
using network_model::Graph;
using network_model::Node;
using network_model::VehicleDistribution;

namespace {

Node node(const std::string& id, double x, double y) {
    Node n;
    n.id = id;
    n.x = x;
    n.y = y;
    return n;
}

Edge edge(const std::string& id, const std::string& from, const std::string& to) {
    Edge e;
    e.id = id;
    e.from_node_id = from;
    e.to_node_id = to;
    return e;
}

// A -> B -> C
Graph chain() {
    Graph g;
    g.nodes = { node("A", 0, 0), node("B", 10, 0), node("C", 20, 0) };
    g.edges = { edge("e1", "A", "B"), edge("e2", "B", "C") };
    return g;
}

VehicleDistribution share(const std::string& type, double percentage, const std::string& color = "yellow") {
    VehicleDistribution d;
    d.vehicle_type = type;
    d.percentage = percentage;
    d.color = color;
    return d;
}

RouteRequest chain_request(int total) {
    RouteRequest r;
    r.total_vehicles = total;
    r.distribution = { share("car", 100) };
    r.entry_edge_ids = { "e1" };
    r.exit_edge_ids = { "e2" };
    r.horizon = 100;
    r.seed = 42;
    return r;
}

} // namespace

// ─── Boundary classification ──────────────────────────────────

TEST(BoundaryTest, ClassifiesChainEnds) {
    const auto points = classify_boundary(chain());
    ASSERT_EQ(points.entry_points.size(), 1u);
    EXPECT_EQ(points.entry_points[0].id, "e1");
    EXPECT_DOUBLE_EQ(points.entry_points[0].x, 0);
    ASSERT_EQ(points.exit_points.size(), 1u);
    EXPECT_EQ(points.exit_points[0].id, "e2");
    EXPECT_DOUBLE_EQ(points.exit_points[0].x, 20);
}

TEST(BoundaryTest, IsolatedSegmentIsBoth) {
    Graph g;
    g.nodes = { node("P", 1, 2), node("Q", 3, 4) };
    g.edges = { edge("solo", "P", "Q") };
    const auto points = classify_boundary(g);
    ASSERT_EQ(points.entry_points.size(), 1u);
    ASSERT_EQ(points.exit_points.size(), 1u);
    EXPECT_EQ(points.entry_points[0].id, "solo");
    EXPECT_DOUBLE_EQ(points.entry_points[0].y, 2);
    EXPECT_DOUBLE_EQ(points.exit_points[0].y, 4);
}

TEST(BoundaryTest, CycleHasNoBoundary) {
    Graph g;
    g.nodes = { node("A", 0, 0), node("B", 1, 0) };
    g.edges = { edge("ab", "A", "B"), edge("ba", "B", "A") };
    const auto points = classify_boundary(g);
    EXPECT_TRUE(points.entry_points.empty());
    EXPECT_TRUE(points.exit_points.empty());
}

TEST(BoundaryTest, MissingNodeFallsBackToOrigin) {
    Graph g;
    g.nodes = { node("B", 5, 5) };
    g.edges = { edge("e", "ghost", "B") };
    const auto points = classify_boundary(g);
    ASSERT_EQ(points.entry_points.size(), 1u);
    EXPECT_DOUBLE_EQ(points.entry_points[0].x, 0);
    EXPECT_DOUBLE_EQ(points.entry_points[0].y, 0);
    ASSERT_EQ(points.exit_points.size(), 1u);
    EXPECT_DOUBLE_EQ(points.exit_points[0].x, 5);
}

// ─── Shortest path ────────────────────────────────────────────

TEST(ShortestPathTest, PrefersFewerHops) {
    Graph g;
    g.nodes = { node("A", 0, 0), node("B", 0, 0), node("C", 0, 0), node("D", 0, 0) };
    g.edges = { edge("ab", "A", "B"), edge("bc", "B", "C"), edge("cd", "C", "D"), edge("ad", "A", "D") };
    const AdjacencyMap adjacency(g);
    const auto path = adjacency.shortest_path("A", "D");
    ASSERT_TRUE(path);
    EXPECT_EQ(*path, std::vector<std::string>{ "ad" });
}

TEST(ShortestPathTest, TiesFollowEdgeOrder) {
    Graph g;
    g.nodes = { node("A", 0, 0), node("B", 0, 0), node("C", 0, 0), node("D", 0, 0) };
    g.edges = { edge("ab", "A", "B"), edge("ac", "A", "C"), edge("cd", "C", "D"), edge("bd", "B", "D") };
    const AdjacencyMap adjacency(g);
    const auto path = adjacency.shortest_path("A", "D");
    ASSERT_TRUE(path);
    EXPECT_EQ(*path, (std::vector<std::string>{ "ab", "bd" }));
}

TEST(ShortestPathTest, UnreachableAndSameNode) {
    const Graph g = chain();
    const AdjacencyMap adjacency(g);
    EXPECT_FALSE(adjacency.shortest_path("C", "A"));
    EXPECT_FALSE(adjacency.shortest_path("B", "B"));
    EXPECT_FALSE(adjacency.shortest_path("A", "nowhere"));
    EXPECT_TRUE(adjacency.links_from("C").empty());
    ASSERT_EQ(adjacency.links_from("A").size(), 1u);
    EXPECT_EQ(adjacency.links_from("A")[0].edge_id, "e1");
}

// ─── Distribution ─────────────────────────────────────────────

TEST(DistributionTest, CountsAlwaysAddUp) {
    const std::vector<VehicleDistribution> dist = { share("car", 33.33), share("bus", 33.33),
        share("truck", 33.34) };
    EXPECT_EQ(vehicle_counts(dist, 10), (std::vector<int>{ 4, 3, 3 }));

    for (int total = 1; total <= 97; total += 8) {
        const auto counts = vehicle_counts(dist, total);
        EXPECT_EQ(std::accumulate(counts.begin(), counts.end(), 0), total);
    }
}

TEST(DistributionTest, SumAboveHundredNeverOvershoots) {
    const std::vector<VehicleDistribution> dist = { share("car", 0), share("bus", 50.004),
        share("truck", 50.004) };
    EXPECT_NO_THROW(validate_distribution(dist));

    for (int total : { 1, 999, 1000000 }) {
        const auto counts = vehicle_counts(dist, total);
        EXPECT_EQ(std::accumulate(counts.begin(), counts.end(), 0), total);
        for (int n : counts) EXPECT_GE(n, 0);
    }
    const auto counts = vehicle_counts(dist, 1000000);
    EXPECT_EQ(counts[0], 0);
    EXPECT_LT(counts[1], counts[2]);
}

TEST(DistributionTest, ExcessSpillsPastSmallEntries) {
    const std::vector<VehicleDistribution> dist = { share("car", 0.001), share("bus", 50.0045),
        share("truck", 50.0045) };
    const auto counts = vehicle_counts(dist, 1000000);
    EXPECT_EQ(counts[0], 0);
    EXPECT_EQ(std::accumulate(counts.begin(), counts.end(), 0), 1000000);
}

TEST(DistributionTest, ValidatesPercentages) {
    EXPECT_NO_THROW(validate_distribution({ share("car", 60), share("bus", 40.005) }));
    EXPECT_THROW(validate_distribution({ share("car", 60), share("bus", 39) }),
        network_model::InvalidDistributionError);
    EXPECT_THROW(validate_distribution({ share("car", 120), share("bus", -20) }),
        network_model::InvalidDistributionError);
    EXPECT_THROW(validate_distribution({}), network_model::InvalidDistributionError);
}

// ─── Route generation ─────────────────────────────────────────

TEST(RouteGeneratorTest, ChainProducesEvenlySpacedRoutes) {
    const auto routes = generate_routes(chain(), chain_request(2));
    ASSERT_EQ(routes.size(), 2u);
    for (const auto& r : routes) {
        EXPECT_EQ(r.edges, (std::vector<std::string>{ "e1", "e2" }));
        EXPECT_EQ(r.vehicle_type, "car");
    }
    EXPECT_EQ(routes[0].id, "veh_0");
    EXPECT_EQ(routes[1].id, "veh_1");
    EXPECT_DOUBLE_EQ(routes[0].depart_time, 0);
    EXPECT_DOUBLE_EQ(routes[1].depart_time, 50);
}

TEST(RouteGeneratorTest, DeparturesStayInsideHorizon) {
    RouteRequest r = chain_request(100000);
    r.distribution = { share("car", 0), share("bus", 50.004), share("truck", 50.004) };
    const auto routes = generate_routes(chain(), r);
    EXPECT_EQ(routes.size(), 100000u);
    EXPECT_LT(routes.back().depart_time, r.horizon);
}

TEST(RouteGeneratorTest, UnroutableSingleVehicleThrows) {
    Graph g;
    g.nodes = { node("A", 0, 0), node("B", 1, 0), node("C", 2, 0), node("D", 3, 0) };
    g.edges = { edge("ab", "A", "B"), edge("cd", "C", "D") };
    RouteRequest r = chain_request(1);
    r.entry_edge_ids = { "ab" };
    r.exit_edge_ids = { "cd" };
    EXPECT_THROW(generate_routes(g, r), network_model::NoRoutableVehiclesError);
}

TEST(RouteGeneratorTest, DroppedAttemptsKeepTheirSlot) {
    // Exit "e1" ends at B, reachable from A; exit "e0" ends at A, never reachable.
    Graph g = chain();
    g.nodes.push_back(node("Z", -10, 0));
    g.edges.push_back(edge("e0", "Z", "A"));
    RouteRequest r = chain_request(40);
    r.entry_edge_ids = { "e1" };
    r.exit_edge_ids = { "e1", "e0" };

    const auto routes = generate_routes(g, r);
    ASSERT_FALSE(routes.empty());
    EXPECT_LT(routes.size(), 40u);
    const double step = 100.0 / 40;
    for (std::size_t i = 0; i < routes.size(); ++i) {
        EXPECT_EQ(routes[i].id, "veh_" + std::to_string(i));
        EXPECT_EQ(routes[i].edges, std::vector<std::string>{ "e1" });
        const double slot = routes[i].depart_time / step;
        EXPECT_DOUBLE_EQ(slot, std::round(slot));
        EXPECT_LT(routes[i].depart_time, 100);
        if (i > 0) EXPECT_GT(routes[i].depart_time, routes[i - 1].depart_time);
    }
}

TEST(RouteGeneratorTest, SeedMakesRunsReproducible) {
    Graph g;
    g.nodes = { node("A", 0, 0), node("B", 0, 0), node("C", 0, 0), node("D", 0, 0), node("E", 0, 0) };
    g.edges = { edge("ab", "A", "B"), edge("bc", "B", "C"), edge("db", "D", "B"), edge("be", "B", "E") };
    RouteRequest r = chain_request(25);
    r.distribution = { share("car", 50, "red"), share("bus", 50, "blue") };
    r.entry_edge_ids = { "ab", "db" };
    r.exit_edge_ids = { "bc", "be" };
    r.seed = 7;

    const auto first = generate_routes(g, r);
    const auto second = generate_routes(g, r);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].edges, second[i].edges);
        EXPECT_DOUBLE_EQ(first[i].depart_time, second[i].depart_time);
        EXPECT_EQ(first[i].color, first[i].vehicle_type == "car" ? "red" : "blue");
    }
}

TEST(RouteGeneratorTest, RejectsBadRequests) {
    const Graph g = chain();

    RouteRequest no_vehicles = chain_request(0);
    EXPECT_THROW(generate_routes(g, no_vehicles), network_model::InvalidRequestError);

    RouteRequest no_horizon = chain_request(2);
    no_horizon.horizon = 0;
    EXPECT_THROW(generate_routes(g, no_horizon), network_model::InvalidRequestError);

    RouteRequest no_entries = chain_request(2);
    no_entries.entry_edge_ids.clear();
    EXPECT_THROW(generate_routes(g, no_entries), network_model::InvalidRequestError);

    RouteRequest unknown_exits = chain_request(2);
    unknown_exits.exit_edge_ids = { "nope" };
    EXPECT_THROW(generate_routes(g, unknown_exits), network_model::InvalidRequestError);

    RouteRequest bad_split = chain_request(2);
    bad_split.distribution = { share("car", 50) };
    EXPECT_THROW(generate_routes(g, bad_split), network_model::InvalidDistributionError);
}

TEST(RouteGeneratorTest, UnknownSelectionsAreIgnored) {
    RouteRequest r = chain_request(3);
    r.entry_edge_ids = { "missing", "e1" };
    const auto routes = generate_routes(chain(), r);
    EXPECT_EQ(routes.size(), 3u);
}
