#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace network_loaders {

// Numeric attribute exactly as upstream tooling delivered it: absent, a single
// value, or a list of values (first one wins). Text values are coerced late.
using RawScalar = std::variant<double, std::string>;
using RawNumeric = std::variant<std::monostate, RawScalar, std::vector<RawScalar>>;

RawNumeric decode_json_numeric(const nlohmann::json& value);

// XML attribute text. Null or empty is absent; "[2, 3]" and "['2', '3']" are lists.
RawNumeric decode_attribute_numeric(const char* text);

std::optional<double> resolve_numeric(const RawNumeric& raw);

double resolve_numeric_or(const RawNumeric& raw, double fallback);

std::optional<double> parse_number(const std::string& text);

} // namespace network_loaders
