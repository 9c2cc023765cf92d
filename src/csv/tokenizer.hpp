#pragma once
#include <istream>
#include <string>
#include <vector>

namespace dprof {

struct csv_dialect {
    char delimiter  = ',';
    char quote      = '"';
    bool has_header = true;
};

// Splits an input stream into logical CSV records (RFC4180-ish). A quoted
// field may contain delimiters, doubled quotes and line breaks. CRLF is
// treated as LF; physical lines that are completely empty are skipped.
class csv_record_reader {
public:
    csv_record_reader(std::istream& in, csv_dialect d) : in_(in), d_(d) {}

    // Returns false at end of input.
    bool next(std::vector<std::string>& fields) {
        fields.clear();
        std::string line;
        do {
            if (!std::getline(in_, line)) return false;
            strip_cr(line);
        } while (line.empty());

        std::string cur;
        bool inq = false;
        for (;;) {
            for (std::size_t i = 0; i < line.size(); ++i) {
                const char c = line[i];
                if (inq) {
                    if (c == d_.quote) {
                        // doubled quote -> one literal quote, stay in field
                        if (i + 1 < line.size() && line[i + 1] == d_.quote) { cur.push_back(d_.quote); ++i; }
                        else { inq = false; }
                    } else {
                        cur.push_back(c);
                    }
                } else {
                    if (c == d_.quote) { inq = true; }
                    else if (c == d_.delimiter) { fields.push_back(cur); cur.clear(); }
                    else { cur.push_back(c); }
                }
            }
            if (!inq) break;
            // quoted field continues on the next physical line
            if (!std::getline(in_, line)) break; // unterminated quote: keep what we have
            strip_cr(line);
            cur.push_back('\n');
        }
        fields.push_back(cur);
        ++records_;
        return true;
    }

    std::size_t records_read() const noexcept { return records_; }

private:
    static void strip_cr(std::string& line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
    }

    std::istream& in_;
    csv_dialect   d_;
    std::size_t   records_ = 0;
};

}
