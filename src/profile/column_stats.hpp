// src/profile/column_stats.hpp
#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../core/settings.hpp"
#include "../types/cell.hpp"
#include "../types/coerce.hpp"
#include "../types/infer.hpp"
#include "../util/strings.hpp"
#include "patterns.hpp"
#include "profiler.hpp"

namespace dprof {

// ---------- statistics blocks ----------

struct numeric_stats {
    std::optional<double>      min_value, max_value;
    std::optional<double>      average, median, standard_deviation;
    std::optional<double>      quartile_25, quartile_75;
    std::optional<std::size_t> zero_count, negative_count, positive_count;
};

struct frequent_value {
    std::string value;
    std::size_t count = 0;
    double      percentage = 0.0;
};

struct string_stats {
    double                      avg_length = 0.0;
    std::size_t                 min_length = 0;
    std::size_t                 max_length = 0;
    std::vector<frequent_value> most_common_values;
    std::vector<value_pattern>  patterns;
};

struct datetime_stats {
    std::optional<std::string>  min_date, max_date;
    std::optional<std::int64_t> date_range_days;
    std::vector<std::string>    most_common_dates;
};

struct boolean_stats {
    std::size_t           true_count = 0;
    std::size_t           false_count = 0;
    std::optional<double> true_percentage, false_percentage;
};

// One alternative per semantic type family; integer and float share numeric.
using column_statistics = std::variant<numeric_stats, string_stats, datetime_stats, boolean_stats>;

struct timestamp_hash {
    std::size_t operator()(timestamp t) const { return std::hash<std::int64_t>{}(t.seconds); }
};

// ---------- per-type computation (non-null subset only) ----------

inline numeric_stats compute_numeric_stats(const column& col) {
    numeric_accumulator acc;
    for (const auto& v : col.values) {
        if (is_null(v)) continue;
        const auto x = coerce_number(v);
        if (!x || std::isnan(*x)) continue; // residual that does not coerce is dropped
        acc.add(*x);
    }
    numeric_stats st;
    if (acc.count == 0) return st;
    acc.finish();
    st.min_value          = acc.min;
    st.max_value          = acc.max;
    st.average            = round_to(acc.mean, 6);
    st.median             = acc.quantile(0.5);
    st.standard_deviation = round_to(acc.stddev(), 6);
    st.quartile_25        = acc.quantile(0.25);
    st.quartile_75        = acc.quantile(0.75);
    st.zero_count         = acc.zeros;
    st.negative_count     = acc.negatives;
    st.positive_count     = acc.positives;
    return st;
}

inline string_stats compute_string_stats(const column& col, const settings& cfg) {
    string_stats st;
    frequency_counter<cell, cell_hash> freq;
    std::vector<std::string> rendered;
    std::size_t total_len = 0;
    std::size_t min_len = std::numeric_limits<std::size_t>::max();
    std::size_t max_len = 0;

    for (const auto& v : col.values) {
        if (is_null(v)) continue;
        std::string s = to_display_string(v);
        const std::size_t len = utf8_length(s);
        total_len += len;
        if (len < min_len) min_len = len;
        if (len > max_len) max_len = len;
        freq.add(v);
        if (rendered.size() < cfg.pattern_sample_size) rendered.push_back(std::move(s));
    }

    const std::size_t n = freq.total;
    if (n == 0) return st;

    st.avg_length = round_to(static_cast<double>(total_len) / static_cast<double>(n), 2);
    st.min_length = min_len;
    st.max_length = max_len;
    for (const auto& [value, count] : freq.top(cfg.top_values)) {
        st.most_common_values.push_back(frequent_value{to_display_string(value), count, percent_of(count, n)});
    }
    st.patterns = mine_patterns(rendered, cfg.max_patterns, cfg.pattern_sample_size);
    return st;
}

inline datetime_stats compute_datetime_stats(const column& col, const settings& cfg) {
    frequency_counter<timestamp, timestamp_hash> freq;
    std::optional<timestamp> lo, hi;
    for (const auto& v : col.values) {
        if (is_null(v)) continue;
        const auto t = coerce_datetime(v);
        if (!t) continue; // malformed residual dropped
        if (!lo || *t < *lo) lo = *t;
        if (!hi || *hi < *t) hi = *t;
        freq.add(*t);
    }
    datetime_stats st;
    if (!lo) return st;
    st.min_date        = format_iso(*lo);
    st.max_date        = format_iso(*hi);
    st.date_range_days = (hi->seconds - lo->seconds) / 86400;
    for (const auto& entry : freq.top(cfg.top_dates)) st.most_common_dates.push_back(format_iso(entry.first));
    return st;
}

// Best effort: one value that is not a boolean voids the counts.
inline boolean_stats compute_boolean_stats(const column& col) {
    boolean_stats st;
    std::size_t n = 0, trues = 0;
    for (const auto& v : col.values) {
        if (is_null(v)) continue;
        const auto b = coerce_bool(v);
        if (!b) return boolean_stats{};
        ++n;
        if (*b) ++trues;
    }
    if (n == 0) return st;
    st.true_count       = trues;
    st.false_count      = n - trues;
    st.true_percentage  = percent_of(st.true_count, n);
    st.false_percentage = percent_of(st.false_count, n);
    return st;
}

inline column_statistics compute_statistics(const column& col, data_type type, const settings& cfg) {
    switch (type) {
        case data_type::integer_:
        case data_type::float_:    return compute_numeric_stats(col);
        case data_type::datetime_: return compute_datetime_stats(col, cfg);
        case data_type::boolean_:  return compute_boolean_stats(col);
        case data_type::string_:   break;
    }
    return compute_string_stats(col, cfg);
}

// Non-null values whose trimmed text is empty; only text storage has blanks.
inline std::size_t count_blanks(const column& col) {
    if (col.storage != storage_type::text_) return 0;
    std::size_t blanks = 0;
    for (const auto& v : col.values) {
        if (!is_null(v) && is_blank_text(v)) ++blanks;
    }
    return blanks;
}

}
