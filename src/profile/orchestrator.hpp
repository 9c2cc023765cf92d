// src/profile/orchestrator.hpp
#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "../core/error.hpp"
#include "../core/settings.hpp"
#include "../metrics/timers.hpp"
#include "../parallel/worker_pool.hpp"
#include "../source/data_source.hpp"
#include "profile.hpp"

namespace dprof {

using progress_sink = std::function<void(int percent)>;

// Profiles one column. Replaceable so callers can wrap or instrument the
// per-column unit; the default is profile_column.
using column_profiler = std::function<column_profile(const column&, const settings&)>;

// Serializes progress: one increment per finished table, callback under the
// same lock so observers see a non-decreasing sequence ending at 100.
// The sink runs on a table worker while the lock is held. It must return
// promptly and must not wait on other profiling work, or the remaining
// tables stall behind it.
class progress_tracker {
public:
    progress_tracker(std::size_t total, progress_sink sink) : total_(total), sink_(std::move(sink)) {}

    void table_done() {
        std::lock_guard<std::mutex> lock(mtx_);
        ++completed_;
        if (!sink_) return;
        int pct = static_cast<int>(std::lround(static_cast<double>(completed_) / static_cast<double>(total_) * 100.0));
        if (completed_ < total_) pct = std::min(pct, 99);
        try {
            sink_(pct);
        } catch (const std::exception& e) {
            spdlog::warn("progress callback failed at {}%: {}", pct, e.what());
        }
    }

private:
    std::mutex    mtx_;
    std::size_t   total_;
    std::size_t   completed_ = 0;
    progress_sink sink_;
};

class profile_orchestrator {
public:
    profile_orchestrator(data_source& source, settings cfg, column_profiler profile_one = profile_column)
        : source_(source), cfg_(std::move(cfg)), profile_one_(std::move(profile_one)) {
        cfg_.validate();
        if (!profile_one_) throw configuration_error("column profiler must be callable");
    }

    // Profiles every column of an already materialized table on a column pool
    // of its own. A column that fails becomes an error entry.
    table_profile profile_table(const table& t) const {
        if (!t.rectangular()) throw table_profiling_error("table '" + t.name + "' has columns of different lengths");

        table_profile tp;
        tp.table_name    = t.name;
        tp.total_records = t.rows();
        tp.total_columns = t.columns.size();
        tp.profiled_at   = now_iso_utc();

        std::vector<std::future<column_profile>> futures;
        futures.reserve(t.columns.size());
        {
            worker_pool columns_pool(cfg_.max_threads, "columns:" + t.name);
            for (const auto& col : t.columns) {
                const column* c = &col;
                const settings* cfg = &cfg_;
                const column_profiler* one = &profile_one_;
                futures.push_back(columns_pool.submit([c, cfg, one]() { return (*one)(*c, *cfg); }));
            }
            columns_pool.shutdown();
        }

        tp.columns.reserve(t.columns.size());
        for (std::size_t i = 0; i < futures.size(); ++i) {
            const std::string& name = t.columns[i].name;
            try {
                tp.columns.emplace_back(name, futures[i].get());
            } catch (const column_profiling_error& e) {
                spdlog::warn("table '{}': column '{}' could not be profiled: {}", t.name, name, e.what());
                tp.columns.emplace_back(name, profile_error{e.what()});
            } catch (const std::exception& e) {
                spdlog::warn("table '{}': column '{}' failed: {}", t.name, name, e.what());
                tp.columns.emplace_back(name, profile_error{e.what()});
            } catch (...) {
                spdlog::warn("table '{}': column '{}' failed with a non-standard exception", t.name, name);
                tp.columns.emplace_back(name, profile_error{"unknown error while profiling column"});
            }
        }
        return tp;
    }

    // Fetches and profiles each distinct requested table on the table pool.
    // Per-table failures are recorded in the report; only invalid settings
    // throw.
    profile_report profile(const std::vector<std::string>& tables,
                           std::optional<std::uint64_t> row_cap = std::nullopt,
                           progress_sink on_progress = {}) {
        validate_row_cap(row_cap);

        std::vector<std::string> unique;
        std::unordered_set<std::string> seen;
        for (const auto& name : tables) {
            if (seen.insert(name).second) unique.push_back(name);
            else spdlog::warn("table '{}' requested more than once; profiling it once", name);
        }

        profile_report report;
        if (unique.empty()) return report;

        WallTimer wt; wt.start();
        progress_tracker progress(unique.size(), std::move(on_progress));
        std::vector<std::future<table_entry>> futures;
        futures.reserve(unique.size());
        {
            worker_pool tables_pool(cfg_.max_threads, "tables");
            for (const auto& name : unique) {
                futures.push_back(tables_pool.submit([this, name, row_cap, &progress]() {
                    table_entry entry = run_table(name, row_cap);
                    progress.table_done();
                    return entry;
                }));
            }
            tables_pool.shutdown();
        }

        std::size_t failed = 0;
        report.tables.reserve(unique.size());
        for (std::size_t i = 0; i < futures.size(); ++i) {
            table_entry entry = futures[i].get();
            if (is_error(entry)) ++failed;
            report.tables.emplace_back(unique[i], std::move(entry));
        }
        wt.stop();
        spdlog::info("profiled {} tables ({} failed) in {:.1f} ms", unique.size(), failed, wt.ms());
        return report;
    }

    const settings& config() const noexcept { return cfg_; }

private:
    // One table unit: never throws, a failure becomes the table's error entry.
    table_entry run_table(const std::string& name, std::optional<std::uint64_t> row_cap) const {
        try {
            WallTimer wt; wt.start();
            table t = source_.fetch(name, row_cap);
            if (row_cap && t.rows() > *row_cap) {
                throw table_profiling_error("data source returned " + std::to_string(t.rows()) +
                                            " rows for a cap of " + std::to_string(*row_cap));
            }
            t.name = name;
            table_profile tp = profile_table(t);
            wt.stop();
            spdlog::debug("table '{}': {} rows x {} columns in {:.1f} ms", name, tp.total_records, tp.total_columns, wt.ms());
            return table_entry{std::move(tp)};
        } catch (const std::exception& e) {
            spdlog::warn("table '{}' failed: {}", name, e.what());
            return profile_error{e.what()};
        } catch (...) {
            spdlog::warn("table '{}' failed with a non-standard exception", name);
            return profile_error{"unknown error while profiling table"};
        }
    }

    data_source&    source_;
    settings        cfg_;
    column_profiler profile_one_;
};

}
