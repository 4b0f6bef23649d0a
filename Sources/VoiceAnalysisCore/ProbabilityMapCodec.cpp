#include "ProbabilityMapCodec.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace va {

// ---------------------------------------------------------------------------
// encode
// ---------------------------------------------------------------------------

std::optional<std::string> ProbabilityMapCodec::encode(
    const std::optional<ProbabilityMap>& map) {
    if (!map) return std::nullopt;
    return encode(*map);
}

std::string ProbabilityMapCodec::encode(const ProbabilityMap& map) {
    std::string out = "[";
    bool first = true;
    for (const auto& [label, value] : map) {
        if (!first) out += ',';
        first = false;
        out += label;
        out += ':';
        out += format_value(value);
    }
    out += ']';
    return out;
}

// ---------------------------------------------------------------------------
// decode
// ---------------------------------------------------------------------------

std::optional<ProbabilityMap> ProbabilityMapCodec::decode(
    const std::optional<std::string>& text) {
    if (!text) return std::nullopt;
    return decode_detailed(*text).map;
}

ProbabilityMapCodec::DecodeResult ProbabilityMapCodec::decode_detailed(
    const std::string& text) {
    DecodeResult result;

    const std::string trimmed = trim(text);
    if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
        return result;
    }

    result.map = ProbabilityMap{};
    result.status = DecodeStatus::full;

    const std::string body = trimmed.substr(1, trimmed.size() - 2);
    if (body.empty()) return result;

    size_t start = 0;
    while (start <= body.size()) {
        size_t comma = body.find(',', start);
        if (comma == std::string::npos) comma = body.size();
        const std::string pair = body.substr(start, comma - start);
        start = comma + 1;

        const size_t colon = pair.find(':');
        if (colon == std::string::npos) {
            ++result.dropped;
            continue;
        }

        const std::string key = trim(pair.substr(0, colon));
        const auto value = parse_value(trim(pair.substr(colon + 1)));
        if (!value) {
            ++result.dropped;
            continue;
        }
        (*result.map)[key] = *value;
    }

    if (result.dropped > 0) result.status = DecodeStatus::partial;
    return result;
}

// ---------------------------------------------------------------------------
// is_encodable
// ---------------------------------------------------------------------------

bool ProbabilityMapCodec::is_encodable(const ProbabilityMap& map) {
    for (const auto& [label, value] : map) {
        if (!std::isfinite(value)) return false;
        if (label.find_first_of(":,[]") != std::string::npos) return false;
        if (trim(label) != label) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::string ProbabilityMapCodec::format_value(double v) {
    // Shortest precision that reads back to the same double.
    char buf[32];
    for (int precision = 15; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v) break;
    }
    return buf;
}

std::optional<double> ProbabilityMapCodec::parse_value(const std::string& s) {
    if (s.empty()) return std::nullopt;

    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::string ProbabilityMapCodec::trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    const size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    const size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace va
