#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "../core/error.hpp"
#include "tokenizer.hpp"

namespace dprof {

// Count logical rows and the column count of the first row without
// materializing cells.
// - Line breaks inside quotes do not end a row.
// - CR, LF and CRLF each end a row; empty lines are not rows.
// - Columns = delimiters outside quotes in the first row + 1.
struct csv_counts {
    std::uint64_t rows = 0;     // data rows (header excluded)
    std::uint64_t columns = 0;
};

inline csv_counts csv_count_rows_cols(const std::filesystem::path& path,
                                      const csv_dialect& d,
                                      std::size_t chunk_bytes = 262144)
{
    std::ifstream is(path, std::ios::binary);
    if (!is) throw data_source_error("cannot open file: " + path.string());
    if (chunk_bytes == 0) chunk_bytes = 262144;

    std::vector<char> buf(chunk_bytes);

    bool in_quotes = false;
    bool first_row_done = false;
    bool prev_was_cr = false;
    bool at_line_start = true;
    std::uint64_t rows = 0;
    std::uint64_t first_row_cols = 0;
    std::uint64_t cur_cols = 1;

    auto finish_row = [&]() {
        if (!at_line_start) {
            ++rows;
            if (!first_row_done) {
                first_row_cols = cur_cols;
                first_row_done = true;
            }
        }
        cur_cols = 1;
        at_line_start = true;
    };

    while (is) {
        is.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize n = is.gcount();
        if (n <= 0) break;

        for (std::streamsize i = 0; i < n; ++i) {
            const char c = buf[static_cast<std::size_t>(i)];

            if (prev_was_cr) {
                prev_was_cr = false;
                if (c == '\n') continue; // CRLF already ended the row
            }

            if (c == d.quote) {
                // "" inside a quoted field closes and reopens, net unchanged
                in_quotes = !in_quotes;
                at_line_start = false;
                continue;
            }

            if (!in_quotes && c == d.delimiter) {
                ++cur_cols;
                at_line_start = false;
            } else if (!in_quotes && (c == '\n' || c == '\r')) {
                finish_row();
                if (c == '\r') prev_was_cr = true;
            } else {
                at_line_start = false;
            }
        }
    }
    finish_row();

    csv_counts out;
    out.rows = rows;
    if (d.has_header && out.rows > 0) out.rows -= 1;
    out.columns = first_row_cols;
    return out;
}

}
