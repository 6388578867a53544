#include <gtest/gtest.h>
#include <network_loaders/metadata_loader.hpp>
#include <network_loaders/network_loader.hpp>
#include <network_loaders/numeric_field.hpp>
#include <network_loaders/request_loader.hpp>
#include <network_model/errors.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace network_loaders;

namespace {

LoadedNetwork load_xml(const std::string& text) {
    std::istringstream in(text);
    return load_network_from_xml(in);
}

LoadedNetwork load_json(const std::string& text) {
    std::istringstream in(text);
    return load_network_from_json(in);
}

const network_model::Edge* edge(const LoadedNetwork& net, const std::string& id) {
    return net.graph.find_edge(id);
}

} // namespace

// ─── Numeric field decoding ───────────────────────────────────

TEST(NumericFieldTest, ScalarAndList) {
    EXPECT_EQ(resolve_numeric(decode_json_numeric(nlohmann::json(3))), 3.0);
    EXPECT_EQ(resolve_numeric(decode_json_numeric(nlohmann::json::parse(R"(["4", "2"])"))), 4.0);
    EXPECT_EQ(resolve_numeric(decode_json_numeric(nlohmann::json("12.5"))), 12.5);
}

TEST(NumericFieldTest, UnusableValuesFallBack) {
    EXPECT_FALSE(resolve_numeric(decode_json_numeric(nlohmann::json(nullptr))));
    EXPECT_FALSE(resolve_numeric(decode_json_numeric(nlohmann::json::array())));
    EXPECT_FALSE(resolve_numeric(decode_json_numeric(nlohmann::json("fast"))));
    EXPECT_FALSE(resolve_numeric(decode_json_numeric(nlohmann::json(true))));
    EXPECT_DOUBLE_EQ(resolve_numeric_or(decode_json_numeric(nlohmann::json("fast")), 13.89), 13.89);
}

TEST(NumericFieldTest, AttributeText) {
    EXPECT_TRUE(std::holds_alternative<std::monostate>(decode_attribute_numeric(nullptr)));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(decode_attribute_numeric("  ")));
    EXPECT_EQ(resolve_numeric(decode_attribute_numeric("[2, 3]")), 2.0);
    EXPECT_EQ(resolve_numeric(decode_attribute_numeric("['5', '1']")), 5.0);
    EXPECT_EQ(resolve_numeric(decode_attribute_numeric("7.5")), 7.5);
    EXPECT_FALSE(resolve_numeric(decode_attribute_numeric("[]")));
    EXPECT_FALSE(parse_number("12abc"));
}

// ─── XML network ──────────────────────────────────────────────

TEST(XmlLoaderTest, ParsesNodesAndEdges) {
    auto net = load_xml(R"(<?xml version="1.0"?>
<net>
  <nodes>
    <node id="A" x="0" y="0" lat="40.1" lon="-3.1" type="traffic_light"/>
    <node id="B" x="10" y="5" lat="40.2" lon="-3.2"/>
    <node id="C" x="20" y="5"/>
  </nodes>
  <edges>
    <edge id="e1" from="A" to="B" numLanes="3" speed="20" length="250"/>
    <edge id="e2" from="B" to="C"/>
  </edges>
</net>)");
    ASSERT_EQ(net.graph.nodes.size(), 3u);
    ASSERT_EQ(net.graph.edges.size(), 2u);
    EXPECT_TRUE(net.warnings.empty());

    const auto* a = net.graph.find_node("A");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->kind, network_model::Node::Kind::SignalControlled);
    EXPECT_EQ(net.graph.find_node("C")->kind, network_model::Node::Kind::Priority);
    EXPECT_FALSE(net.graph.find_node("C")->has_geo());

    const auto* e1 = edge(net, "e1");
    EXPECT_EQ(e1->lane_count, 3);
    EXPECT_DOUBLE_EQ(e1->speed, 20);
    EXPECT_DOUBLE_EQ(e1->length, 250);
    ASSERT_EQ(e1->shape.size(), 2u);
    EXPECT_DOUBLE_EQ(e1->shape[0].x, 40.1);
    EXPECT_DOUBLE_EQ(e1->shape[0].y, -3.1);

    // C has no lat/lon, so the planar pair is used.
    const auto* e2 = edge(net, "e2");
    EXPECT_EQ(e2->lane_count, 2);
    EXPECT_DOUBLE_EQ(e2->speed, 13.89);
    EXPECT_DOUBLE_EQ(e2->length, 100);
    EXPECT_DOUBLE_EQ(e2->shape[1].x, 20);
    EXPECT_DOUBLE_EQ(e2->shape[1].y, 5);
}

TEST(XmlLoaderTest, SkipsMalformedElements) {
    auto net = load_xml(R"(<net>
  <node id="A" x="0" y="0"/>
  <node id="B" x="1"/>
  <node id="C" x="abc" y="1"/>
  <node id="D" x="3" y="3"/>
  <edge id="e1" from="A" to="D" numLanes="0" speed="-4"/>
  <edge id="e2" from="A" to="B"/>
  <edge id="e3" from="A"/>
  <edge id=":internal" function="internal"/>
  <edge id="e4" from="D" to="A" numLanes="[3, 1]" length="['40']"/>
</net>)");
    EXPECT_EQ(net.graph.nodes.size(), 2u);
    ASSERT_EQ(net.graph.edges.size(), 2u);
    EXPECT_EQ(net.warnings.size(), 5u);

    EXPECT_EQ(edge(net, "e1")->lane_count, 1);
    EXPECT_DOUBLE_EQ(edge(net, "e1")->speed, 13.89);
    EXPECT_EQ(edge(net, "e4")->lane_count, 3);
    EXPECT_DOUBLE_EQ(edge(net, "e4")->length, 40);
}

TEST(XmlLoaderTest, RejectsNonXml) {
    EXPECT_THROW(load_xml("this is not a network"), network_model::MalformedInputError);
    EXPECT_THROW(load_xml("<net><node id='A'"), network_model::MalformedInputError);
}

TEST(XmlLoaderTest, MissingFileIsNullopt) {
    EXPECT_FALSE(load_network_from_xml_file("/nonexistent/dir/network.net.xml"));
}

// ─── JSON network ─────────────────────────────────────────────

TEST(JsonLoaderTest, AcceptsListValuedFields) {
    auto net = load_json(R"({
        "nodes": [
            {"id": 101, "x": 0, "y": 0, "lat": 1.0, "lon": 2.0},
            {"id": "102", "x": 5, "y": 5, "type": "traffic_light"}
        ],
        "edges": [
            {"id": "e1", "from": 101, "to": "102", "lanes": ["3", "2"], "speed": [], "length": "55.5"},
            {"id": "e2", "from": "102", "to": 101, "numLanes": "many", "speed": [22.2]}
        ]
    })");
    ASSERT_EQ(net.graph.nodes.size(), 2u);
    ASSERT_EQ(net.graph.edges.size(), 2u);
    EXPECT_EQ(net.graph.nodes[0].id, "101");
    EXPECT_EQ(net.graph.nodes[1].kind, network_model::Node::Kind::SignalControlled);

    const auto* e1 = edge(net, "e1");
    EXPECT_EQ(e1->from_node_id, "101");
    EXPECT_EQ(e1->lane_count, 3);
    EXPECT_DOUBLE_EQ(e1->speed, 13.89);
    EXPECT_DOUBLE_EQ(e1->length, 55.5);

    const auto* e2 = edge(net, "e2");
    EXPECT_EQ(e2->lane_count, 2);
    EXPECT_DOUBLE_EQ(e2->speed, 22.2);
}

TEST(JsonLoaderTest, DropsDuplicatesAndDanglingEdges) {
    auto net = load_json(R"({
        "nodes": [{"id": "A", "x": 0, "y": 0}, {"id": "A", "x": 1, "y": 1}, {"id": "B"}],
        "edges": [{"id": "e1", "from": "A", "to": "B"}, {"id": "e2", "from": "A", "to": "A"}, {"id": "e2", "from": "A", "to": "A"}]
    })");
    EXPECT_EQ(net.graph.nodes.size(), 1u);
    ASSERT_EQ(net.graph.edges.size(), 1u);
    EXPECT_EQ(net.graph.edges[0].id, "e2");
    EXPECT_EQ(net.warnings.size(), 4u);
}

TEST(JsonLoaderTest, DanglingEdgeDoesNotReserveItsId) {
    auto net = load_json(R"({
        "nodes": [{"id": "A", "x": 0, "y": 0}, {"id": "B", "x": 5, "y": 0}],
        "edges": [{"id": "e1", "from": "A", "to": "ghost"}, {"id": "e1", "from": "A", "to": "B"}]
    })");
    ASSERT_EQ(net.graph.edges.size(), 1u);
    EXPECT_EQ(net.graph.edges[0].to_node_id, "B");
    ASSERT_EQ(net.warnings.size(), 1u);
    EXPECT_EQ(net.warnings[0].find("duplicated"), std::string::npos);
}

TEST(JsonLoaderTest, RejectsBadDocuments) {
    EXPECT_THROW(load_json("{"), network_model::MalformedInputError);
    EXPECT_THROW(load_json(R"({"edges": []})"), network_model::MalformedInputError);
    EXPECT_THROW(load_json(R"({"nodes": []})"), network_model::MalformedInputError);
}

// ─── Export request ───────────────────────────────────────────

TEST(RequestLoaderTest, ParsesRequest) {
    std::istringstream in(R"({
        "network_id": "map_1_2_3_4",
        "total_vehicles": 20,
        "simulation_time": 600,
        "random_seed": 7,
        "vehicle_distribution": [
            {"vehicle_type": "car", "percentage": 70, "color": "red"},
            {"vehicle_type": "bus", "percentage": 30, "period": 2.5, "attributes": "speedFactor=\"0.9\""}
        ],
        "entry_points": ["e1", {"id": "e2"}]
    })");
    const ExportRequest req = load_export_request(in);
    EXPECT_EQ(req.config.network_id, "map_1_2_3_4");
    EXPECT_EQ(req.config.total_vehicles, 20);
    EXPECT_DOUBLE_EQ(req.config.horizon, 600);
    ASSERT_TRUE(req.config.seed);
    EXPECT_EQ(*req.config.seed, 7u);
    ASSERT_EQ(req.config.distribution.size(), 2u);
    EXPECT_EQ(req.config.distribution[0].color, "red");
    EXPECT_EQ(req.config.distribution[1].color, "yellow");
    EXPECT_DOUBLE_EQ(req.config.distribution[1].period, 2.5);
    ASSERT_TRUE(req.config.distribution[1].attributes);
    ASSERT_TRUE(req.entry_points);
    EXPECT_EQ(*req.entry_points, (std::vector<std::string>{ "e1", "e2" }));
    EXPECT_FALSE(req.exit_points);
}

TEST(RequestLoaderTest, RejectsWrongTypes) {
    std::istringstream bad_json("[1, 2");
    EXPECT_THROW(load_export_request(bad_json), network_model::InvalidRequestError);
    std::istringstream bad_seed(R"({"random_seed": -1})");
    EXPECT_THROW(load_export_request(bad_seed), network_model::InvalidRequestError);
    std::istringstream bad_dist(R"({"vehicle_distribution": [{"vehicle_type": "car"}]})");
    EXPECT_THROW(load_export_request(bad_dist), network_model::InvalidRequestError);
}

TEST(RequestLoaderTest, RejectsVehicleCountsOutsideIntRange) {
    std::istringstream too_many(R"({"total_vehicles": 3000000000})");
    EXPECT_THROW(load_export_request(too_many), network_model::InvalidRequestError);
    std::istringstream too_few(R"({"total_vehicles": -3000000000})");
    EXPECT_THROW(load_export_request(too_few), network_model::InvalidRequestError);
    std::istringstream huge(R"({"total_vehicles": 18446744073709551615})");
    EXPECT_THROW(load_export_request(huge), network_model::InvalidRequestError);

    std::istringstream at_limit(R"({"total_vehicles": 2147483647})");
    EXPECT_EQ(load_export_request(at_limit).config.total_vehicles, 2147483647);
}

// ─── Metadata ─────────────────────────────────────────────────

TEST(MetadataLoaderTest, RequiresEverySection) {
    std::istringstream in(R"({"simulation_info": {}, "nodes": [], "edges": []})");
    EXPECT_THROW(load_scenario_from_metadata(in), network_model::MalformedInputError);
}
