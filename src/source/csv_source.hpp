// src/source/csv_source.hpp
#pragma once
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "../core/error.hpp"
#include "../csv/csv_count.hpp"
#include "../csv/tokenizer.hpp"
#include "../types/coerce.hpp"
#include "../util/nulls.hpp"
#include "../util/strings.hpp"
#include "data_source.hpp"

namespace dprof {

// ---------- column materialization ----------

// Raw text of one column; nullopt = null token.
using raw_column = std::vector<std::optional<std::string>>;

// Native storage by "all values are X" priority: int64, float64, bool, text.
// Dates stay text and are recognized later by type inference.
inline storage_type detect_storage(const raw_column& raw) {
    bool all_int = true, all_float = true, all_bool = true;
    std::size_t non_nulls = 0;
    for (const auto& v : raw) {
        if (!v) continue;
        ++non_nulls;
        if (all_int && !parse_int64(*v)) all_int = false;
        if (all_float && !is_float_syntax(trim_view(*v))) all_float = false;
        if (all_bool && !(ieq(trim_view(*v), "true") || ieq(trim_view(*v), "false"))) all_bool = false;
        if (!all_int && !all_float && !all_bool) break;
    }
    if (non_nulls == 0) return storage_type::text_;
    if (all_int)        return storage_type::int64_;
    if (all_float)      return storage_type::float64_;
    if (all_bool)       return storage_type::boolean_;
    return storage_type::text_;
}

inline column materialize_column(std::string name, raw_column raw) {
    column col;
    col.name    = std::move(name);
    col.storage = detect_storage(raw);
    col.values.reserve(raw.size());
    for (auto& v : raw) {
        if (!v) { col.values.emplace_back(std::monostate{}); continue; }
        switch (col.storage) {
            case storage_type::int64_:   col.values.emplace_back(*parse_int64(*v)); break;
            case storage_type::float64_: col.values.emplace_back(*parse_number(*v)); break;
            case storage_type::boolean_: col.values.emplace_back(ieq(trim_view(*v), "true")); break;
            default:                     col.values.emplace_back(std::move(*v)); break;
        }
    }
    return col;
}

// Empty header names become colN; repeated names get .1, .2, ... suffixes.
inline std::vector<std::string> normalize_header(std::vector<std::string> names) {
    std::unordered_map<std::string, int> seen;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i].empty()) names[i] = "col" + std::to_string(i + 1);
        int& n = seen[names[i]];
        if (n > 0) {
            std::string candidate;
            do {
                candidate = names[i] + "." + std::to_string(n++);
            } while (seen.count(candidate));
            seen[candidate] = 1;
            names[i] = candidate;
        } else {
            n = 1;
        }
    }
    return names;
}

// ---------- source ----------

// A CSV file is one table named after its stem; a directory contributes one
// table per *.csv file inside it.
class csv_source : public data_source {
public:
    explicit csv_source(std::filesystem::path path, csv_dialect dialect = {},
                        std::vector<std::string> null_tokens = default_null_tokens())
        : dialect_(dialect), null_tokens_(std::move(null_tokens))
    {
        namespace fs = std::filesystem;
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            for (const auto& entry : fs::directory_iterator(path, ec)) {
                if (entry.is_regular_file() && entry.path().extension() == ".csv") {
                    files_.emplace_back(entry.path().stem().string(), entry.path());
                }
            }
            if (ec) throw data_source_error("cannot list directory: " + path.string() + " (" + ec.message() + ")");
            std::sort(files_.begin(), files_.end());
        } else if (fs::is_regular_file(path, ec)) {
            files_.emplace_back(path.stem().string(), path);
        } else {
            throw data_source_error("input not found: " + path.string());
        }
    }

    table fetch(const std::string& table_name, std::optional<std::uint64_t> row_cap) override {
        const auto& path = resolve(table_name);
        std::ifstream in(path, std::ios::binary);
        if (!in) throw data_source_error("cannot open file: " + path.string());

        csv_record_reader reader(in, dialect_);
        std::vector<std::string> fields;
        std::vector<std::string> names;
        std::vector<raw_column> cols;
        std::uint64_t rows = 0;

        if (dialect_.has_header) {
            if (reader.next(fields)) names = std::move(fields);
            cols.resize(names.size());
        }

        while ((!row_cap || rows < *row_cap) && reader.next(fields)) {
            if (fields.size() > cols.size()) {
                // a long row widens the table; earlier rows read as null there
                cols.resize(fields.size(), raw_column(static_cast<std::size_t>(rows)));
            }
            for (std::size_t c = 0; c < cols.size(); ++c) {
                if (c >= fields.size() || is_null_like(fields[c], null_tokens_)) cols[c].emplace_back(std::nullopt);
                else cols[c].emplace_back(std::move(fields[c]));
            }
            ++rows;
        }
        while (names.size() < cols.size()) names.emplace_back();
        names = normalize_header(std::move(names));

        table t;
        t.name = table_name;
        t.columns.reserve(cols.size());
        for (std::size_t c = 0; c < cols.size(); ++c) {
            t.columns.push_back(materialize_column(std::move(names[c]), std::move(cols[c])));
        }
        spdlog::debug("csv: read {} rows x {} columns from {}", rows, t.columns.size(), path.string());
        return t;
    }

    std::vector<table_info> list_tables() override {
        std::vector<table_info> out;
        for (const auto& [name, path] : files_) {
            std::ifstream in(path, std::ios::binary);
            if (!in) throw data_source_error("cannot open file: " + path.string());
            csv_record_reader reader(in, dialect_);
            std::vector<std::string> first;
            table_info info{name, {}};
            if (reader.next(first)) {
                if (dialect_.has_header) info.columns = normalize_header(std::move(first));
                else info.columns = normalize_header(std::vector<std::string>(first.size()));
            }
            out.push_back(std::move(info));
        }
        return out;
    }

    std::uint64_t count_records(const std::string& table_name) override {
        return csv_count_rows_cols(resolve(table_name), dialect_).rows;
    }

private:
    const std::filesystem::path& resolve(const std::string& table_name) const {
        for (const auto& f : files_) {
            if (f.first == table_name) return f.second;
        }
        throw data_source_error("table not found: " + table_name);
    }

    csv_dialect dialect_;
    std::vector<std::string> null_tokens_;
    std::vector<std::pair<std::string, std::filesystem::path>> files_;
};

}
