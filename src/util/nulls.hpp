#pragma once
#include <string_view>
#include <string>
#include <vector>

namespace dprof {

// Tokens a delimited file uses to spell a missing value. Matched exactly:
// a whitespace-only field is a blank, not a null.
inline const std::vector<std::string>& default_null_tokens() {
    static const std::vector<std::string> tokens = {"", "NA", "N/A", "null", "NULL", "NaN"};
    return tokens;
}

inline bool is_null_like(std::string_view s, const std::vector<std::string>& nulls) {
    for (const auto& n : nulls) {
        if (s == n) return true;
    }
    return false;
}

}
