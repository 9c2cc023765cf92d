#pragma once
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "../util/strings.hpp"

namespace dprof {

// UTC instant with whole-second resolution.
struct timestamp {
    std::int64_t seconds = 0; // since 1970-01-01T00:00:00Z

    friend bool operator==(timestamp a, timestamp b) { return a.seconds == b.seconds; }
    friend bool operator!=(timestamp a, timestamp b) { return a.seconds != b.seconds; }
    friend bool operator<(timestamp a, timestamp b)  { return a.seconds < b.seconds; }
};

inline const std::vector<std::string>& default_date_formats() {
    static const std::vector<std::string> fmts = {
        "%Y-%m-%dT%H:%M:%SZ",
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%dT%H:%M",
        "%Y-%m-%d %H:%M",
        "%Y-%m-%d",
        "%Y/%m/%d %H:%M:%S",
        "%Y/%m/%d",
        "%m/%d/%Y %H:%M:%S",
        "%m/%d/%Y %H:%M",
        "%m/%d/%Y",
        "%d-%b-%Y",
        "%b %d %Y",
        "%b %d, %Y",
    };
    return fmts;
}

inline std::int64_t utc_seconds(std::tm tm) {
#if defined(_WIN32)
    return static_cast<std::int64_t>(_mkgmtime(&tm));
#else
    return static_cast<std::int64_t>(timegm(&tm));
#endif
}

inline std::tm utc_tm(timestamp t) {
    std::tm tm{};
    const std::time_t tt = static_cast<std::time_t>(t.seconds);
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

// Removes a trailing zone ("Z", "+HH:MM", "-HHMM") and ".fraction" from a
// value that carries a clock time. Returns the zone offset in seconds east
// of UTC; sub-second digits are dropped.
inline std::int64_t strip_time_suffix(std::string& t) {
    const auto colon = t.find(':');
    if (colon == std::string::npos) return 0;
    auto digit = [&](std::size_t i) { return std::isdigit(static_cast<unsigned char>(t[i])) != 0; };
    auto two = [&](std::size_t i) { return (t[i] - '0') * 10 + (t[i + 1] - '0'); };

    std::int64_t offset = 0;
    const std::size_t n = t.size();
    if (t.back() == 'Z' || t.back() == 'z') {
        t.pop_back();
    } else {
        std::size_t sign = std::string::npos;
        int hh = 0, mm = 0;
        if (n >= 6 && digit(n - 5) && digit(n - 4) && t[n - 3] == ':' && digit(n - 2) && digit(n - 1)) {
            sign = n - 6; hh = two(n - 5); mm = two(n - 2);
        } else if (n >= 5 && digit(n - 4) && digit(n - 3) && digit(n - 2) && digit(n - 1)) {
            sign = n - 5; hh = two(n - 4); mm = two(n - 2);
        }
        // the sign must follow the clock digits, never a date separator
        if (sign != std::string::npos && sign > colon && digit(sign - 1) &&
            (t[sign] == '+' || t[sign] == '-') && hh <= 14 && mm < 60) {
            offset = (hh * 3600 + mm * 60) * (t[sign] == '-' ? -1 : 1);
            t.erase(sign);
        }
    }

    const auto dot = t.rfind('.');
    if (dot != std::string::npos && dot > colon && dot + 1 < t.size() && digit(dot - 1)) {
        bool all_digits = true;
        for (std::size_t i = dot + 1; i < t.size(); ++i) all_digits = all_digits && digit(i);
        if (all_digits) t.erase(dot);
    }
    return offset;
}

// The whole (trimmed) input must match one format and name a real calendar
// date; "2023-02-30" or "2023-01-05 garbage" are rejected. A fractional
// second and a zone suffix are accepted after the clock time and the result
// is shifted to UTC.
inline std::optional<timestamp> parse_date_any(std::string_view s,
                                               const std::vector<std::string>& fmts) {
    std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    const std::int64_t offset = strip_time_suffix(t);
    if (t.empty()) return std::nullopt;
    for (const auto& fmt : fmts) {
        std::tm tm{};
        std::istringstream iss(t);
        iss >> std::get_time(&tm, fmt.c_str());
        if (iss.fail()) continue;
        if (iss.peek() != std::char_traits<char>::eof()) continue;

        const int year = tm.tm_year, mon = tm.tm_mon, day = tm.tm_mday;
        const std::int64_t secs = utc_seconds(tm);
        const std::tm back = utc_tm(timestamp{secs});
        if (back.tm_year != year || back.tm_mon != mon || back.tm_mday != day) continue;
        return timestamp{secs - offset};
    }
    return std::nullopt;
}

inline std::optional<timestamp> parse_datetime(std::string_view s) {
    return parse_date_any(s, default_date_formats());
}

inline std::string format_utc(timestamp t, const char* fmt) {
    const std::tm tm = utc_tm(t);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf);
}

// YYYY-MM-DDTHH:MM:SS
inline std::string format_iso(timestamp t) { return format_utc(t, "%Y-%m-%dT%H:%M:%S"); }

inline timestamp now_utc() { return timestamp{static_cast<std::int64_t>(std::time(nullptr))}; }

inline std::string now_iso_utc() { return format_utc(now_utc(), "%Y-%m-%dT%H:%M:%SZ"); }

}
