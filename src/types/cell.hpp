// src/types/cell.hpp
#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "parse_date.hpp"

namespace dprof {

// ---------- data model ----------

// Physical storage of a column as delivered by a data source.
enum class storage_type { int64_, float64_, boolean_, datetime_, text_ };

// One table cell. monostate = absent.
using cell = std::variant<std::monostate, std::int64_t, double, bool, timestamp, std::string>;

struct column {
    std::string       name;
    storage_type      storage = storage_type::text_;
    std::vector<cell> values;

    std::size_t size() const noexcept { return values.size(); }
};

struct table {
    std::string         name;
    std::vector<column> columns;

    std::size_t rows() const noexcept { return columns.empty() ? 0 : columns.front().size(); }
    bool rectangular() const noexcept {
        for (const auto& c : columns) if (c.size() != rows()) return false;
        return true;
    }
};

// NaN is a missing value, the same as an absent cell.
inline bool is_null(const cell& c) {
    if (std::holds_alternative<std::monostate>(c)) return true;
    if (const double* d = std::get_if<double>(&c)) return std::isnan(*d);
    return false;
}

inline std::string to_display_string(const cell& c) {
    struct visitor {
        std::string operator()(std::monostate) const        { return "null"; }
        std::string operator()(std::int64_t v) const        { return std::to_string(v); }
        std::string operator()(double v) const              { return fmt::format("{}", v); }
        std::string operator()(bool v) const                { return v ? "true" : "false"; }
        std::string operator()(timestamp v) const           { return format_iso(v); }
        std::string operator()(const std::string& v) const  { return v; }
    };
    return std::visit(visitor{}, c);
}

inline const char* to_string(storage_type t) {
    switch (t) {
        case storage_type::int64_:    return "int64";
        case storage_type::float64_:  return "float64";
        case storage_type::boolean_:  return "bool";
        case storage_type::datetime_: return "datetime";
        default:                      return "text";
    }
}

struct cell_hash {
    std::size_t operator()(const cell& c) const {
        struct visitor {
            std::size_t operator()(std::monostate) const       { return 0; }
            std::size_t operator()(std::int64_t v) const       { return std::hash<std::int64_t>{}(v); }
            std::size_t operator()(double v) const             { return std::hash<double>{}(v); }
            std::size_t operator()(bool v) const               { return std::hash<bool>{}(v); }
            std::size_t operator()(timestamp v) const          { return std::hash<std::int64_t>{}(v.seconds); }
            std::size_t operator()(const std::string& v) const { return std::hash<std::string>{}(v); }
        };
        return std::visit(visitor{}, c) ^ (c.index() * 0x9e3779b97f4a7c15ULL);
    }
};

}
