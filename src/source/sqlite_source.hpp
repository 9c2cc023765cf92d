// src/source/sqlite_source.hpp
#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "../core/error.hpp"
#include "../types/coerce.hpp"
#include "../types/parse_date.hpp"
#include "data_source.hpp"

namespace dprof {

// ---------- RAII handles ----------

class sqlite_connection {
public:
    explicit sqlite_connection(const std::string& path) {
        const int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
            sqlite3_close(db_);
            throw data_source_error("cannot open database " + path + ": " + msg);
        }
    }
    ~sqlite_connection() { sqlite3_close(db_); }

    sqlite_connection(const sqlite_connection&) = delete;
    sqlite_connection& operator=(const sqlite_connection&) = delete;

    sqlite3* get() const noexcept { return db_; }

private:
    sqlite3* db_ = nullptr;
};

class sqlite_statement {
public:
    sqlite_statement(const sqlite_connection& conn, const std::string& sql) : db_(conn.get()) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw data_source_error("query failed: " + std::string(sqlite3_errmsg(db_)) + " [" + sql + "]");
        }
    }
    ~sqlite_statement() { sqlite3_finalize(stmt_); }

    sqlite_statement(const sqlite_statement&) = delete;
    sqlite_statement& operator=(const sqlite_statement&) = delete;

    // true while a row is available
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw data_source_error("query failed: " + std::string(sqlite3_errmsg(db_)));
    }

    void bind(int idx, std::int64_t v) {
        if (sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v)) != SQLITE_OK) {
            throw data_source_error("bind failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }
    void bind(int idx, const std::string& v) {
        if (sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
            throw data_source_error("bind failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    sqlite3*      db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

// ---------- helpers ----------

inline std::string quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out += "\"";
    return out;
}

inline std::string upper(std::string s) {
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// Declared BOOL*/DATE*/TIME* types decide storage; otherwise the values do.
inline storage_type storage_from_declared(const std::string& declared) {
    const std::string d = upper(declared);
    if (d.find("BOOL") != std::string::npos) return storage_type::boolean_;
    if (d.find("DATE") != std::string::npos || d.find("TIME") != std::string::npos) return storage_type::datetime_;
    return storage_type::text_;
}

inline cell read_value(sqlite3_stmt* stmt, int i) {
    switch (sqlite3_column_type(stmt, i)) {
        case SQLITE_NULL:    return std::monostate{};
        case SQLITE_INTEGER: return static_cast<std::int64_t>(sqlite3_column_int64(stmt, i));
        case SQLITE_FLOAT:   return sqlite3_column_double(stmt, i);
        default: {
            const auto* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt, i));
            const int len = sqlite3_column_bytes(stmt, i);
            return std::string(txt ? txt : "", static_cast<std::size_t>(len));
        }
    }
}

// Converts raw SQLite values into one storage type for the whole column.
inline void settle_column(column& col, storage_type declared) {
    if (declared == storage_type::boolean_) {
        bool ok = true;
        std::vector<cell> converted;
        converted.reserve(col.values.size());
        for (const auto& v : col.values) {
            if (is_null(v)) { converted.emplace_back(std::monostate{}); continue; }
            auto b = coerce_bool(v);
            if (!b) { ok = false; break; }
            converted.emplace_back(*b);
        }
        if (ok) {
            col.storage = storage_type::boolean_;
            col.values = std::move(converted);
            return;
        }
    }
    if (declared == storage_type::datetime_) {
        bool ok = true;
        std::vector<cell> converted;
        converted.reserve(col.values.size());
        for (const auto& v : col.values) {
            if (is_null(v)) { converted.emplace_back(std::monostate{}); continue; }
            if (const auto* secs = std::get_if<std::int64_t>(&v)) { converted.emplace_back(timestamp{*secs}); continue; }
            auto t = coerce_datetime(v);
            if (!t) { ok = false; break; }
            converted.emplace_back(*t);
        }
        if (ok) {
            col.storage = storage_type::datetime_;
            col.values = std::move(converted);
            return;
        }
    }

    bool all_int = true, all_num = true, any = false;
    for (const auto& v : col.values) {
        if (is_null(v)) continue;
        any = true;
        if (!std::holds_alternative<std::int64_t>(v)) all_int = false;
        if (!std::holds_alternative<std::int64_t>(v) && !std::holds_alternative<double>(v)) all_num = false;
    }
    if (any && all_int) { col.storage = storage_type::int64_; return; }
    if (any && all_num) {
        col.storage = storage_type::float64_;
        for (auto& v : col.values) {
            if (const auto* i = std::get_if<std::int64_t>(&v)) v = static_cast<double>(*i);
        }
        return;
    }
    col.storage = storage_type::text_;
    for (auto& v : col.values) {
        if (!is_null(v) && !std::holds_alternative<std::string>(v)) v = to_display_string(v);
    }
}

// ---------- source ----------

// Tables of a SQLite database file. Every call opens its own read-only
// connection, so fetch() can run on several workers at once.
class sqlite_source : public data_source {
public:
    explicit sqlite_source(std::string path) : path_(std::move(path)) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path_, ec)) throw data_source_error("database not found: " + path_);
    }

    table fetch(const std::string& table_name, std::optional<std::uint64_t> row_cap) override {
        sqlite_connection conn(path_);
        require_table(conn, table_name);

        std::vector<storage_type> declared;
        table t;
        t.name = table_name;
        {
            sqlite_statement info(conn, "PRAGMA table_info(" + quote_identifier(table_name) + ")");
            while (info.step()) {
                const auto* n = reinterpret_cast<const char*>(sqlite3_column_text(info.get(), 1));
                const auto* d = reinterpret_cast<const char*>(sqlite3_column_text(info.get(), 2));
                column c;
                c.name = n ? n : "";
                t.columns.push_back(std::move(c));
                declared.push_back(storage_from_declared(d ? d : ""));
            }
        }

        std::string sql = "SELECT * FROM " + quote_identifier(table_name);
        if (row_cap) sql += " LIMIT ?1";
        sqlite_statement q(conn, sql);
        if (row_cap) q.bind(1, static_cast<std::int64_t>(*row_cap));

        const int ncols = sqlite3_column_count(q.get());
        if (static_cast<std::size_t>(ncols) != t.columns.size()) {
            throw data_source_error("column metadata mismatch for table " + table_name);
        }
        while (q.step()) {
            for (int i = 0; i < ncols; ++i) {
                t.columns[static_cast<std::size_t>(i)].values.push_back(read_value(q.get(), i));
            }
        }
        for (std::size_t i = 0; i < t.columns.size(); ++i) settle_column(t.columns[i], declared[i]);

        spdlog::debug("sqlite: read {} rows x {} columns from {}", t.rows(), t.columns.size(), table_name);
        return t;
    }

    std::vector<table_info> list_tables() override {
        sqlite_connection conn(path_);
        std::vector<table_info> out;
        {
            sqlite_statement q(conn, "SELECT name FROM sqlite_master WHERE type IN ('table','view') "
                                     "AND name NOT LIKE 'sqlite_%' ORDER BY name");
            while (q.step()) {
                const auto* n = reinterpret_cast<const char*>(sqlite3_column_text(q.get(), 0));
                out.push_back(table_info{n ? n : "", {}});
            }
        }
        for (auto& info : out) {
            sqlite_statement cols(conn, "PRAGMA table_info(" + quote_identifier(info.name) + ")");
            while (cols.step()) {
                const auto* n = reinterpret_cast<const char*>(sqlite3_column_text(cols.get(), 1));
                info.columns.emplace_back(n ? n : "");
            }
        }
        return out;
    }

    std::uint64_t count_records(const std::string& table_name) override {
        sqlite_connection conn(path_);
        require_table(conn, table_name);
        sqlite_statement q(conn, "SELECT COUNT(*) FROM " + quote_identifier(table_name));
        if (!q.step()) return 0;
        return static_cast<std::uint64_t>(sqlite3_column_int64(q.get(), 0));
    }

private:
    static void require_table(const sqlite_connection& conn, const std::string& table_name) {
        sqlite_statement q(conn, "SELECT 1 FROM sqlite_master WHERE type IN ('table','view') AND name = ?1");
        q.bind(1, table_name);
        if (!q.step()) throw data_source_error("table not found: " + table_name);
    }

    std::string path_;
};

}
