#pragma once

#include <network_model/types.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace network_loaders {

// Parsed graph plus one message per skipped node or edge, for the caller to log.
struct LoadedNetwork {
    network_model::Graph graph;
    std::vector<std::string> warnings;
};

// SUMO-style network: <node id x y [lat lon type]/> and <edge id from to
// [numLanes speed length]/> elements anywhere in the document.
// Throws network_model::MalformedInputError when the document is not XML.
LoadedNetwork load_network_from_xml(std::istream& in);
std::optional<LoadedNetwork> load_network_from_xml_file(const std::string& path);

// {"nodes": [...], "edges": [...]}. Numeric edge fields may be scalars,
// numeric strings or lists. Throws MalformedInputError on a bad document.
LoadedNetwork load_network_from_json(std::istream& in);
std::optional<LoadedNetwork> load_network_from_json_file(const std::string& path);

// Picks the format from the extension (.json, anything else is XML).
std::optional<LoadedNetwork> load_network_file(const std::string& path);

} // namespace network_loaders
