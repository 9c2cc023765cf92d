#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../core/error.hpp"
#include "../profile/profile.hpp"
#include "../types/parse_date.hpp"
#include "../util/json_escape.hpp"

namespace dprof {

// Indented JSON writer; tracks commas per nesting level.
class json_emitter {
public:
    explicit json_emitter(std::size_t indent = 2) : indent_(indent) {}

    json_emitter& key(std::string_view k) {
        separate();
        out_ += json_string(k);
        out_ += ": ";
        keyed_ = true;
        return *this;
    }
    json_emitter& begin_object() { separate(); out_ += '{'; first_.push_back(true); return *this; }
    json_emitter& end_object()   { close('}'); return *this; }
    json_emitter& begin_array()  { separate(); out_ += '['; first_.push_back(true); return *this; }
    json_emitter& end_array()    { close(']'); return *this; }

    // Appends an already serialized JSON value.
    json_emitter& raw(std::string_view json) { separate(); out_ += json; return *this; }

    json_emitter& field(std::string_view k, std::string_view json_value) { return key(k).raw(json_value); }

    const std::string& str() const noexcept { return out_; }

private:
    void separate() {
        if (keyed_) { keyed_ = false; return; }
        if (first_.empty()) return;
        if (!first_.back()) out_ += ',';
        first_.back() = false;
        newline();
    }
    void close(char c) {
        const bool empty = first_.back();
        first_.pop_back();
        if (!empty) newline();
        out_ += c;
    }
    void newline() {
        out_ += '\n';
        out_.append(first_.size() * indent_, ' ');
    }

    std::string       out_;
    std::vector<bool> first_;
    std::size_t       indent_;
    bool              keyed_ = false;
};

// ---------- statistics blocks ----------

inline void emit_stats(json_emitter& j, const numeric_stats& s) {
    j.field("min_value", json_optional(s.min_value));
    j.field("max_value", json_optional(s.max_value));
    j.field("average", json_optional(s.average));
    j.field("median", json_optional(s.median));
    j.field("standard_deviation", json_optional(s.standard_deviation));
    j.field("quartile_25", json_optional(s.quartile_25));
    j.field("quartile_75", json_optional(s.quartile_75));
    j.field("zero_count", json_optional(s.zero_count));
    j.field("negative_count", json_optional(s.negative_count));
    j.field("positive_count", json_optional(s.positive_count));
}

inline void emit_stats(json_emitter& j, const string_stats& s) {
    j.field("avg_length", json_number(s.avg_length));
    j.field("min_length", std::to_string(s.min_length));
    j.field("max_length", std::to_string(s.max_length));
    j.key("most_common_values").begin_array();
    for (const auto& v : s.most_common_values) {
        j.begin_object()
         .field("value", json_string(v.value))
         .field("count", std::to_string(v.count))
         .field("percentage", json_number(v.percentage))
         .end_object();
    }
    j.end_array();
    j.key("patterns").begin_array();
    for (const auto& p : s.patterns) {
        j.begin_object()
         .field("pattern", json_string(p.pattern))
         .field("count", std::to_string(p.count))
         .field("percentage", json_number(p.percentage));
        j.key("examples").begin_array();
        for (const auto& e : p.examples) j.raw(json_string(e));
        j.end_array().end_object();
    }
    j.end_array();
}

inline void emit_stats(json_emitter& j, const datetime_stats& s) {
    j.field("min_date", json_optional(s.min_date));
    j.field("max_date", json_optional(s.max_date));
    j.field("date_range_days", json_optional(s.date_range_days));
    j.key("most_common_dates").begin_array();
    for (const auto& d : s.most_common_dates) j.raw(json_string(d));
    j.end_array();
}

inline void emit_stats(json_emitter& j, const boolean_stats& s) {
    j.field("true_count", std::to_string(s.true_count));
    j.field("false_count", std::to_string(s.false_count));
    j.field("true_percentage", json_optional(s.true_percentage));
    j.field("false_percentage", json_optional(s.false_percentage));
}

// ---------- entities ----------

inline void emit_error(json_emitter& j, const profile_error& e) {
    j.begin_object().field("error", json_string(e.message)).end_object();
}

inline void emit_column(json_emitter& j, const column_profile& c) {
    j.begin_object();
    j.field("column_name", json_string(c.column_name));
    j.field("data_type", json_string(to_string(c.type)));
    j.field("total_values", std::to_string(c.total_values));
    j.field("null_count", std::to_string(c.null_count));
    j.field("null_percentage", json_number(c.null_percentage));
    j.field("blank_count", std::to_string(c.blank_count));
    j.field("blank_percentage", json_number(c.blank_percentage));
    j.field("non_null_count", std::to_string(c.non_null_count));
    j.field("distinct_count", std::to_string(c.distinct_count));
    j.field("distinct_percentage", json_number(c.distinct_percentage));
    std::visit([&j](const auto& s) { emit_stats(j, s); }, c.statistics);
    j.field("quality_score", json_number(c.quality_score));
    j.field("completeness_percentage", json_number(c.completeness_percentage));
    j.field("uniqueness_percentage", json_number(c.uniqueness_percentage));
    j.key("potential_issues").begin_array();
    for (const auto& issue : c.potential_issues) j.raw(json_string(issue));
    j.end_array();
    j.end_object();
}

inline void emit_table(json_emitter& j, const table_profile& t) {
    j.begin_object();
    j.field("table_name", json_string(t.table_name));
    j.field("total_records", std::to_string(t.total_records));
    j.field("total_columns", std::to_string(t.total_columns));
    j.field("profiled_at", json_string(t.profiled_at));
    j.key("columns").begin_object();
    for (const auto& [name, entry] : t.columns) {
        j.key(name);
        if (const auto* e = std::get_if<profile_error>(&entry)) emit_error(j, *e);
        else emit_column(j, std::get<column_profile>(entry));
    }
    j.end_object();
    j.end_object();
}

// Serializes a report as {"export_metadata": {...}, "tables": {...}}.
inline std::string profile_report_json(const profile_report& report, const std::string& exported_at) {
    json_emitter j;
    j.begin_object();
    j.key("export_metadata").begin_object()
     .field("exported_at", json_string(exported_at))
     .field("total_tables", std::to_string(report.size()))
     .field("export_format", json_string("json"))
     .field("version", json_string("1.0"))
     .end_object();
    j.key("tables").begin_object();
    for (const auto& [name, entry] : report.tables) {
        j.key(name);
        if (const auto* e = std::get_if<profile_error>(&entry)) emit_error(j, *e);
        else emit_table(j, std::get<table_profile>(entry));
    }
    j.end_object();
    j.end_object();
    return j.str() + "\n";
}

// data_profile_YYYYMMDD_HHMMSS.<ext>
inline std::string export_file_name(const std::string& ext) {
    return format_utc(now_utc(), "data_profile_%Y%m%d_%H%M%S.") + ext;
}

inline void emit_profile_json(const std::filesystem::path& out_path, const profile_report& report) {
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw export_error("Failed to open for write: " + out_path.string());
    f << profile_report_json(report, now_iso_utc());
    if (!f) throw export_error("Failed to write: " + out_path.string());
}

}
