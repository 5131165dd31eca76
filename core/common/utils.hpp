#pragma once

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <string>
#include <system_error>
#include <vector>

namespace cskit::core::common {

// Returns base when it is free, otherwise "<base>.001", "<base>.002", ...
inline std::string uniquify(const std::string& base, const std::vector<std::string>& existing) {
    auto taken = [&](const std::string& candidate) {
        return std::find(existing.begin(), existing.end(), candidate) != existing.end();
    };
    std::string value = base;
    int index = 0;
    while (taken(value)) {
        ++index;
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), ".%03d", index);
        value = base + suffix;
    }
    return value;
}

// Returns "<base><n>" for the smallest n >= 0 not in `existing`.
inline std::string nextSymbol(const std::string& base, const std::vector<std::string>& existing) {
    for (int n = 0;; ++n) {
        std::string candidate = base + std::to_string(n);
        if (std::find(existing.begin(), existing.end(), candidate) == existing.end()) return candidate;
    }
}

// `name` without its trailing digits: "var12" -> "var".
inline std::string symbolStem(const std::string& name) {
    std::size_t end = name.size();
    while (end > 0 && name[end - 1] >= '0' && name[end - 1] <= '9') --end;
    return name.substr(0, end);
}

// True for names usable as expression symbols: [A-Za-z_][A-Za-z0-9_]*.
inline bool isIdentifier(const std::string& name) {
    if (name.empty()) return false;
    auto alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; };
    if (!alpha(name.front())) return false;
    return std::all_of(name.begin(), name.end(), [&](char c) { return alpha(c) || (c >= '0' && c <= '9'); });
}

// Decimal rounding to `digits` places, correctly rounded from the exact binary value.
inline double roundToPrecision(double value, int digits) {
    if (!std::isfinite(value)) return value;
    char buf[512];
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed, digits);
    if (res.ec != std::errc{}) return value;
    double out = value;
    std::from_chars(buf, res.ptr, out, std::chars_format::fixed);
    return out;
}

// Shortest fixed-point text that reads back as `value`, always carrying a decimal point.
inline std::string formatDecimal(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value < 0.0 ? "-inf" : "inf";
    char buf[512];
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    std::string out(buf, res.ec == std::errc{} ? res.ptr : buf);
    if (out.find('.') == std::string::npos) out += ".0";
    return out;
}

inline std::string formatLiteral(double value, int digits) {
    return formatDecimal(roundToPrecision(value, digits));
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

inline bool nearlyEqual(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

} // namespace cskit::core::common
