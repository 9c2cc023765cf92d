// src/source/data_source.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../types/cell.hpp"

namespace dprof {

struct table_info {
    std::string              name;
    std::vector<std::string> columns;
};

// Where tables come from. fetch() is called concurrently from the table pool
// and must be safe to call from several threads at once.
class data_source {
public:
    virtual ~data_source() = default;

    // Materializes a table with at most `row_cap` rows. Throws
    // data_source_error when the table is missing or cannot be read.
    virtual table fetch(const std::string& table_name, std::optional<std::uint64_t> row_cap) = 0;

    virtual std::vector<table_info> list_tables() = 0;

    virtual std::uint64_t count_records(const std::string& table_name) = 0;
};

}
