// src/core/settings.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "error.hpp"

namespace dprof {

struct settings {
    // Workers in the table pool, and in each per-table column pool.
    std::size_t   max_threads         = 4;
    // Row cap applied when a caller does not pass one. 0 = unlimited.
    std::uint64_t default_max_records = 10000;

    std::size_t pattern_sample_size = 1000;
    std::size_t max_patterns        = 20;
    std::size_t top_values          = 10;
    std::size_t top_dates           = 5;

    std::string export_dir = "exports";

    void validate() const {
        if (max_threads == 0)         throw configuration_error("max_threads must be > 0");
        if (pattern_sample_size == 0) throw configuration_error("pattern_sample_size must be > 0");
        if (max_patterns == 0)        throw configuration_error("max_patterns must be > 0");
        if (top_values == 0)          throw configuration_error("top_values must be > 0");
        if (top_dates == 0)           throw configuration_error("top_dates must be > 0");
    }

    std::optional<std::uint64_t> default_row_cap() const {
        if (default_max_records == 0) return std::nullopt;
        return default_max_records;
    }
};

// A row cap supplied by a caller must be a positive bound.
inline void validate_row_cap(const std::optional<std::uint64_t>& row_cap) {
    if (row_cap && *row_cap == 0) throw configuration_error("row cap must be > 0");
}

}
