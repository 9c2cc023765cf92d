#pragma once
#include <mustache.hpp>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>
#include <filesystem>

#include <fmt/format.h>

#include "../core/error.hpp"
#include "../profile/profile.hpp"
#include "../types/parse_date.hpp"

#if defined(_WIN32)
  #include <windows.h>
#elif defined(__APPLE__)
  #include <mach-o/dyld.h>
#endif

namespace dprof {

namespace mstch = kainjow::mustache;

// ---------- utils ----------
inline std::filesystem::path exe_dir() {
#if defined(_WIN32)
    wchar_t buf[MAX_PATH]{};
    const DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (len == 0 || len == MAX_PATH) return std::filesystem::current_path();
    return std::filesystem::path(buf).parent_path();
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string tmp(size, '\0');
    if (_NSGetExecutablePath(tmp.data(), &size) != 0) return std::filesystem::current_path();
    std::error_code ec;
    auto p = std::filesystem::weakly_canonical(std::filesystem::path(tmp), ec);
    if (ec) p = std::filesystem::path(tmp);
    return p.parent_path();
#else
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return std::filesystem::current_path();
    return p.parent_path();
#endif
}

inline std::filesystem::path first_existing(const std::vector<std::filesystem::path>& candidates,
                                            std::string* tried = nullptr) {
    for (const auto& c : candidates) {
        std::error_code ec;
        if (std::filesystem::exists(c, ec) && std::filesystem::is_regular_file(c, ec)) {
            return c;
        }
        if (tried) *tried += "  - " + c.string() + "\n";
    }
    return {};
}

// Exact path, else <exe_dir>/templates/<name>, else <cwd>/templates/<name>.
inline std::filesystem::path resolve_template(const std::filesystem::path& template_path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (fs::exists(template_path, ec) && fs::is_regular_file(template_path, ec)) return template_path;

    const fs::path tpl_name = template_path.filename();
    std::string tried;
    const fs::path resolved = first_existing({exe_dir() / "templates" / tpl_name,
                                              fs::current_path() / "templates" / tpl_name}, &tried);
    if (resolved.empty()) {
        std::ostringstream msg;
        msg << "Template not found. Looked at:\n" << tried
            << "Original requested path: " << template_path.string();
        throw export_error(msg.str());
    }
    return resolved;
}

// ---------- report context ----------
inline std::string fmt_pct(double v) { return fmt::format("{:.2f}%", v); }

inline std::string fmt_opt(const std::optional<double>& v) { return v ? fmt::format("{}", *v) : "-"; }

// One-line digest of the type-specific statistics for the column table.
inline std::string stats_summary(const column_statistics& stats) {
    struct visitor {
        std::string operator()(const numeric_stats& s) const {
            if (!s.min_value) return "no numeric values";
            return fmt::format("min {} / max {} / mean {} / median {} / sd {}",
                               fmt_opt(s.min_value), fmt_opt(s.max_value), fmt_opt(s.average),
                               fmt_opt(s.median), fmt_opt(s.standard_deviation));
        }
        std::string operator()(const string_stats& s) const {
            std::string out = fmt::format("length {}..{} (avg {})", s.min_length, s.max_length, s.avg_length);
            if (!s.patterns.empty()) out += fmt::format(", top pattern '{}' ({:.2f}%)", s.patterns.front().pattern, s.patterns.front().percentage);
            return out;
        }
        std::string operator()(const datetime_stats& s) const {
            if (!s.min_date) return "no valid dates";
            return fmt::format("{} .. {} ({} days)", *s.min_date, *s.max_date, s.date_range_days.value_or(0));
        }
        std::string operator()(const boolean_stats& s) const {
            return fmt::format("true {} / false {}", s.true_count, s.false_count);
        }
    };
    return std::visit(visitor{}, stats);
}

inline mstch::data column_context(const std::string& name, const column_entry& entry) {
    mstch::data c;
    c.set("name", name);
    if (const auto* e = std::get_if<profile_error>(&entry)) {
        c.set("error", e->message);
        return c;
    }
    const auto& p = std::get<column_profile>(entry);
    std::string issues;
    for (const auto& i : p.potential_issues) issues += (issues.empty() ? "" : "; ") + i;
    c.set("data_type", std::string(to_string(p.type)));
    c.set("null_pct", fmt_pct(p.null_percentage));
    c.set("blank_pct", fmt_pct(p.blank_percentage));
    c.set("distinct_count", std::to_string(p.distinct_count));
    c.set("quality_score", fmt::format("{:.1f}", p.quality_score));
    c.set("completeness", fmt_pct(p.completeness_percentage));
    c.set("uniqueness", fmt_pct(p.uniqueness_percentage));
    c.set("summary", stats_summary(p.statistics));
    c.set("issues", issues);
    return c;
}

inline mstch::data report_context(const profile_report& report, const std::string& generated_at) {
    mstch::data ctx;
    ctx.set("generated_at", generated_at);
    ctx.set("total_tables", std::to_string(report.size()));

    mstch::data tables{mstch::data::type::list};
    for (const auto& [name, entry] : report.tables) {
        mstch::data t;
        t.set("name", name);
        if (const auto* e = std::get_if<profile_error>(&entry)) {
            t.set("error", e->message);
        } else {
            const auto& tp = std::get<table_profile>(entry);
            t.set("total_records", std::to_string(tp.total_records));
            t.set("total_columns", std::to_string(tp.total_columns));
            t.set("profiled_at", tp.profiled_at);
            mstch::data cols{mstch::data::type::list};
            for (const auto& [cname, centry] : tp.columns) cols.push_back(column_context(cname, centry));
            t.set("columns", cols);
        }
        tables.push_back(t);
    }
    ctx.set("tables", tables);
    return ctx;
}

// ---------- main ----------
/**
 * Renders the profile report as HTML through a Mustache template.
 * Context: generated_at, total_tables, tables[] {name, error | total_records,
 * total_columns, profiled_at, columns[] {name, error | data_type, null_pct,
 * blank_pct, distinct_count, quality_score, completeness, uniqueness,
 * summary, issues}}.
 */
inline std::string render_report_html(const std::filesystem::path& template_path,
                                      const profile_report& report) {
    const auto resolved = resolve_template(template_path);
    std::ifstream tf(resolved, std::ios::binary);
    if (!tf) throw export_error("Failed to read template: " + resolved.string());
    std::ostringstream tss; tss << tf.rdbuf();

    mstch::mustache m{tss.str()};
    if (!m.is_valid()) throw export_error("Mustache template parse error: " + m.error_message());
    return m.render(report_context(report, now_iso_utc()));
}

inline void render_report(const std::filesystem::path& template_path,
                          const profile_report& report,
                          const std::filesystem::path& out_html) {
    const std::string rendered = render_report_html(template_path, report);
    std::ofstream out(out_html, std::ios::binary);
    if (!out) throw export_error("Failed to write: " + out_html.string());
    out << rendered;
}

}
