// src/profile/patterns.hpp
#pragma once
#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../util/strings.hpp"

namespace dprof {

struct value_pattern {
    std::string              pattern;
    std::size_t              count = 0;
    double                   percentage = 0.0;
    std::vector<std::string> examples; // up to 3, in scan order
};

constexpr char digit_placeholder  = '9';
constexpr char letter_placeholder = 'A';
constexpr std::size_t max_pattern_examples = 3;

// ASCII digits -> '9', ASCII letters -> 'A', every other byte kept verbatim.
inline std::string to_pattern(std::string_view value) {
    std::string out(value);
    for (char& c : out) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (u >= '0' && u <= '9') c = digit_placeholder;
        else if ((u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z')) c = letter_placeholder;
    }
    return out;
}

// Patterns of the first `sample_size` values, most frequent first. Ties keep
// the order in which the pattern was first seen.
inline std::vector<value_pattern> mine_patterns(const std::vector<std::string>& values,
                                                std::size_t max_patterns = 20,
                                                std::size_t sample_size = 1000) {
    const std::size_t n = std::min(values.size(), sample_size);
    if (n == 0) return {};

    std::vector<value_pattern> found;
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < n; ++i) {
        std::string p = to_pattern(values[i]);
        auto it = index.find(p);
        if (it == index.end()) {
            it = index.emplace(p, found.size()).first;
            found.push_back(value_pattern{std::move(p), 0, 0.0, {}});
        }
        auto& vp = found[it->second];
        ++vp.count;
        if (vp.examples.size() < max_pattern_examples) vp.examples.push_back(values[i]);
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const value_pattern& a, const value_pattern& b) { return a.count > b.count; });
    if (found.size() > max_patterns) found.resize(max_patterns);
    for (auto& vp : found) vp.percentage = percent_of(vp.count, n);
    return found;
}

}
