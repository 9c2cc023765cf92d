// src/profile/profile.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "../core/error.hpp"
#include "../core/settings.hpp"
#include "../types/cell.hpp"
#include "../types/infer.hpp"
#include "../util/strings.hpp"
#include "column_stats.hpp"
#include "quality.hpp"

namespace dprof {

// ---------- data model ----------

// Stands in for a column or table whose profiling failed.
struct profile_error {
    std::string message;
};

struct column_profile {
    std::string column_name;
    data_type   type = data_type::string_;

    std::size_t total_values        = 0;
    std::size_t null_count          = 0;
    double      null_percentage     = 0.0;
    std::size_t blank_count         = 0;
    double      blank_percentage    = 0.0;
    std::size_t non_null_count      = 0;
    std::size_t distinct_count      = 0;
    double      distinct_percentage = 0.0;

    column_statistics statistics;

    double                   quality_score = 100.0;
    double                   completeness_percentage = 100.0;
    double                   uniqueness_percentage = 0.0;
    std::vector<std::string> potential_issues;
};

using column_entry = std::variant<column_profile, profile_error>;

struct table_profile {
    std::string   table_name;
    std::uint64_t total_records = 0;
    std::uint64_t total_columns = 0;
    std::string   profiled_at;
    std::vector<std::pair<std::string, column_entry>> columns; // source column order
};

using table_entry = std::variant<table_profile, profile_error>;

// Table identifier -> profile or error, one entry per requested identifier.
struct profile_report {
    std::vector<std::pair<std::string, table_entry>> tables;

    const table_entry* find(const std::string& name) const {
        for (const auto& t : tables) if (t.first == name) return &t.second;
        return nullptr;
    }
    std::size_t size() const noexcept { return tables.size(); }
};

inline bool is_error(const column_entry& e) { return std::holds_alternative<profile_error>(e); }
inline bool is_error(const table_entry& e)  { return std::holds_alternative<profile_error>(e); }

// ---------- column profiler ----------

inline std::size_t count_distinct(const column& col) {
    std::unordered_set<cell, cell_hash> seen;
    for (const auto& v : col.values) {
        if (!is_null(v)) seen.insert(v);
    }
    return seen.size();
}

// Type inference, type-specific statistics and quality scoring for one column.
// Percentages are over every row of the column, nulls included.
inline column_profile profile_column(const column& col, const settings& cfg) {
    column_profile p;
    p.column_name  = col.name;
    p.type         = infer_type(col);
    p.total_values = col.size();

    for (const auto& v : col.values) if (is_null(v)) ++p.null_count;
    p.non_null_count = p.total_values - p.null_count;
    p.blank_count    = count_blanks(col);
    p.distinct_count = count_distinct(col);

    p.null_percentage     = percent_of(p.null_count, p.total_values);
    p.blank_percentage    = percent_of(p.blank_count, p.total_values);
    p.distinct_percentage = percent_of(p.distinct_count, p.total_values);

    try {
        p.statistics = compute_statistics(col, p.type, cfg);
    } catch (const column_profiling_error&) {
        throw;
    } catch (const std::exception& e) {
        throw column_profiling_error("column '" + col.name + "': statistics failed: " + e.what());
    }

    quality_assessment qa = assess_quality(p.total_values, p.null_count, p.blank_count, p.distinct_count);
    p.quality_score           = qa.quality_score;
    p.completeness_percentage = qa.completeness_percentage;
    p.uniqueness_percentage   = qa.uniqueness_percentage;
    p.potential_issues        = std::move(qa.potential_issues);
    return p;
}

}
