#pragma once

#include <stdexcept>
#include <string>

namespace network_model {

struct ScenarioError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Document-level parse failure; single malformed elements are skipped instead.
struct MalformedInputError : ScenarioError {
    using ScenarioError::ScenarioError;
};

struct InvalidDistributionError : ScenarioError {
    using ScenarioError::ScenarioError;
};

struct NoRoutableVehiclesError : ScenarioError {
    using ScenarioError::ScenarioError;
};

struct UnresolvedReferenceError : ScenarioError {
    UnresolvedReferenceError(const std::string& edge, const std::string& node)
        : ScenarioError("edge " + edge + " references missing node " + node)
        , edge_id(edge)
        , node_id(node)
    {
    }

    std::string edge_id;
    std::string node_id;
};

struct InvalidRequestError : ScenarioError {
    using ScenarioError::ScenarioError;
};

} // namespace network_model
