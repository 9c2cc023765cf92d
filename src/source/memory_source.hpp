// src/source/memory_source.hpp
#pragma once
#include <algorithm>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../core/error.hpp"
#include "data_source.hpp"

namespace dprof {

// Tables already in memory. Each fetch hands out a copy truncated to the row cap.
class memory_source : public data_source {
public:
    void add(table t) {
        if (!t.rectangular()) throw data_source_error("table '" + t.name + "' has columns of different lengths");
        std::lock_guard<std::mutex> lock(mtx_);
        tables_[t.name] = std::move(t);
    }

    table fetch(const std::string& table_name, std::optional<std::uint64_t> row_cap) override {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = tables_.find(table_name);
        if (it == tables_.end()) throw data_source_error("table not found: " + table_name);
        table out = it->second;
        if (row_cap) {
            for (auto& c : out.columns) {
                if (c.values.size() > *row_cap) c.values.resize(static_cast<std::size_t>(*row_cap));
            }
        }
        return out;
    }

    std::vector<table_info> list_tables() override {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<table_info> out;
        for (const auto& [name, t] : tables_) {
            table_info info{name, {}};
            for (const auto& c : t.columns) info.columns.push_back(c.name);
            out.push_back(std::move(info));
        }
        return out;
    }

    std::uint64_t count_records(const std::string& table_name) override {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = tables_.find(table_name);
        if (it == tables_.end()) throw data_source_error("table not found: " + table_name);
        return it->second.rows();
    }

private:
    std::mutex                   mtx_;
    std::map<std::string, table> tables_;
};

}
