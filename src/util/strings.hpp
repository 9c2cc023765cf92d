// src/util/strings.hpp
#pragma once
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>

namespace dprof {

// ---------- whitespace ----------
inline std::string_view trim_view(std::string_view s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}
inline std::string trim(std::string_view s) { return std::string(trim_view(s)); }

inline bool ieq(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

// Number of code points in a UTF-8 string (continuation bytes are skipped).
inline std::size_t utf8_length(std::string_view s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

// ---------- numbers ----------
inline double round_to(double v, int digits) {
    const double scale = std::pow(10.0, digits);
    const double scaled = v * scale;
    // magnitudes this large carry no fractional digits to round
    if (!std::isfinite(scaled)) return v;
    return std::round(scaled) / scale;
}

inline double percent_of(std::size_t count, std::size_t total) {
    if (total == 0) return 0.0;
    return round_to(static_cast<double>(count) / static_cast<double>(total) * 100.0, 2);
}

}
