// src/util/json_escape.hpp
#pragma once
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

namespace dprof {

// Minimal JSON string escaper.
// Escapes: backslash, quote, control chars (< 0x20), and common whitespace.
inline std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 16);
    auto hex = [](unsigned v)->char {
        return (v < 10) ? char('0' + v) : char('a' + (v - 10));
    };

    for (unsigned char c : in) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out += hex((c >> 4) & 0xF);
                    out += hex(c & 0xF);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

inline std::string json_string(std::string_view s) { return "\"" + json_escape(s) + "\""; }

// JSON has no NaN/Infinity; they are written as null.
inline std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    return fmt::format("{}", v);
}

template <class T>
inline std::string json_optional(const std::optional<T>& v) {
    if (!v) return "null";
    if constexpr (std::is_floating_point_v<T>) return json_number(*v);
    else if constexpr (std::is_convertible_v<T, std::string_view>) return json_string(*v);
    else return fmt::format("{}", *v);
}

}
