// src/types/coerce.hpp
#pragma once
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "cell.hpp"
#include "parse_date.hpp"
#include "../util/strings.hpp"

namespace dprof {

// Text -> value parsers. None of them throw: a value that does not parse
// yields nullopt and the caller decides whether that is a fallback or a drop.

inline bool is_blank_text(const cell& c) {
    const std::string* s = std::get_if<std::string>(&c);
    return s && trim_view(*s).empty();
}

inline std::optional<std::int64_t> parse_int64(std::string_view s) {
    s = trim_view(s);
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
        if (!s.empty() && s.front() == '-') return std::nullopt;
    }
    if (s.empty()) return std::nullopt;
    std::int64_t v = 0;
    const char* first = s.data();
    const char* last  = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return v;
}

// Decimal or scientific notation: [+-]digits[.digits][(e|E)[+-]digits]
inline bool is_float_syntax(std::string_view s) {
    if (s.empty()) return false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    bool digit = false, dot = false;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        break;
    }
    if (!digit) return false;
    if (i == s.size()) return true;
    if (s[i] != 'e' && s[i] != 'E') return false;
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    if (i == s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

inline std::optional<double> parse_special_float(std::string_view s) {
    bool neg = false;
    if (!s.empty() && (s[0] == '+' || s[0] == '-')) { neg = s[0] == '-'; s.remove_prefix(1); }
    if (ieq(s, "inf") || ieq(s, "infinity")) {
        const double inf = std::numeric_limits<double>::infinity();
        return neg ? -inf : inf;
    }
    if (ieq(s, "nan")) return std::numeric_limits<double>::quiet_NaN();
    return std::nullopt;
}

inline std::optional<double> parse_number(std::string_view s) {
    const std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    if (!is_float_syntax(t)) return parse_special_float(t);
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return std::nullopt;
    return v;
}

inline std::optional<bool> parse_bool(std::string_view s) {
    const std::string_view t = trim_view(s);
    static const char* truthy[] = {"true", "1", "yes", "t", "y"};
    static const char* falsy[]  = {"false", "0", "no", "f", "n"};
    for (auto* w : truthy) if (ieq(t, w)) return true;
    for (auto* w : falsy)  if (ieq(t, w)) return false;
    return std::nullopt;
}

// ---------- cell coercion ----------

inline std::optional<double> coerce_number(const cell& c) {
    if (const auto* v = std::get_if<std::int64_t>(&c)) return static_cast<double>(*v);
    if (const auto* v = std::get_if<double>(&c))       return *v;
    if (const auto* v = std::get_if<bool>(&c))         return *v ? 1.0 : 0.0;
    if (const auto* v = std::get_if<std::string>(&c))  return parse_number(*v);
    return std::nullopt;
}

inline std::optional<timestamp> coerce_datetime(const cell& c) {
    if (const auto* v = std::get_if<timestamp>(&c))   return *v;
    if (const auto* v = std::get_if<std::string>(&c)) return parse_datetime(*v);
    return std::nullopt;
}

inline std::optional<bool> coerce_bool(const cell& c) {
    if (const auto* v = std::get_if<bool>(&c))         return *v;
    if (const auto* v = std::get_if<std::int64_t>(&c)) return *v != 0;
    if (const auto* v = std::get_if<double>(&c)) {
        if (std::isnan(*v)) return std::nullopt;
        return *v != 0.0;
    }
    if (const auto* v = std::get_if<std::string>(&c))  return parse_bool(*v);
    return std::nullopt;
}

}
