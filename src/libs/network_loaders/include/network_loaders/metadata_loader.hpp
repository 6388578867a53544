#pragma once

#include <network_model/scenario.hpp>
#include <istream>
#include <optional>
#include <string>

namespace network_loaders {

// Rebuilds the scenario from a simulation_metadata.json document alone.
// Throws network_model::MalformedInputError when a top-level section is missing.
network_model::Scenario load_scenario_from_metadata(std::istream& in);
std::optional<network_model::Scenario> load_scenario_from_metadata_file(const std::string& path);

} // namespace network_loaders
