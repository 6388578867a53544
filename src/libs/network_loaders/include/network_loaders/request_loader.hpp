#pragma once

#include <network_model/scenario.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace network_loaders {

// Export request: what to generate and between which boundary edges.
// An absent entry/exit list means "every classified point".
struct ExportRequest {
    network_model::SimulationConfig config;
    std::optional<std::vector<std::string>> entry_points;
    std::optional<std::vector<std::string>> exit_points;
};

// Throws network_model::InvalidRequestError on malformed JSON or wrong field types.
ExportRequest load_export_request(std::istream& in);
std::optional<ExportRequest> load_export_request_file(const std::string& path);

} // namespace network_loaders
