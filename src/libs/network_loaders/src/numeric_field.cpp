#include <network_loaders/numeric_field.hpp>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace network_loaders {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '\'' || s.front() == '"') && s.back() == s.front())
        return s.substr(1, s.size() - 2);
    return s;
}

RawScalar scalar_from_json(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

std::optional<double> resolve_scalar(const RawScalar& scalar) {
    if (const double* d = std::get_if<double>(&scalar)) {
        if (!std::isfinite(*d)) return std::nullopt;
        return *d;
    }
    return parse_number(std::get<std::string>(scalar));
}

} // namespace

std::optional<double> parse_number(const std::string& text) {
    const std::string s = strip_quotes(trim(text));
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

RawNumeric decode_json_numeric(const nlohmann::json& value) {
    if (value.is_null()) return std::monostate{};
    if (value.is_array()) {
        std::vector<RawScalar> list;
        for (const auto& item : value)
            list.push_back(scalar_from_json(item));
        return list;
    }
    return scalar_from_json(value);
}

RawNumeric decode_attribute_numeric(const char* text) {
    if (text == nullptr) return std::monostate{};
    const std::string s = trim(text);
    if (s.empty()) return std::monostate{};
    if (s.front() != '[' || s.back() != ']') return RawScalar(s);

    std::vector<RawScalar> list;
    const std::string body = s.substr(1, s.size() - 2);
    std::size_t start = 0;
    while (start <= body.size()) {
        const auto comma = body.find(',', start);
        const std::string item = trim(body.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!item.empty()) list.push_back(item);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return list;
}

std::optional<double> resolve_numeric(const RawNumeric& raw) {
    if (const RawScalar* scalar = std::get_if<RawScalar>(&raw))
        return resolve_scalar(*scalar);
    if (const auto* list = std::get_if<std::vector<RawScalar>>(&raw)) {
        if (list->empty()) return std::nullopt;
        return resolve_scalar(list->front());
    }
    return std::nullopt;
}

double resolve_numeric_or(const RawNumeric& raw, double fallback) {
    return resolve_numeric(raw).value_or(fallback);
}

} // namespace network_loaders
