// src/core/error.hpp
#pragma once
#include <stdexcept>
#include <string>

namespace dprof {

struct error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Missing table, unreadable file, failed connection or query.
struct data_source_error : error {
    using error::error;
};

// Statistics computation failed for one column.
struct column_profiling_error : error {
    using error::error;
};

// Fetch or aggregation failed for one table.
struct table_profiling_error : error {
    using error::error;
};

// Invalid concurrency, limit or row-cap settings. Fatal to a profiling run.
struct configuration_error : error {
    using error::error;
};

struct export_error : error {
    using error::error;
};

}
