#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <algorithm>
#include <cmath>

namespace dprof {

// Running accumulators shared by the per-type statistics.

struct numeric_accumulator {
    std::size_t count{0};
    std::size_t zeros{0}, negatives{0}, positives{0};
    double min{0.0}, max{0.0};
    double mean{0.0}, m2{0.0}; // Welford
    std::vector<double> sample; // for median/quantiles

    void add(double x) {
        ++count;
        if (count == 1) { min = max = x; mean = x; m2 = 0.0; }
        else {
            if (x < min) min = x;
            if (x > max) max = x;
            double delta = x - mean;
            mean += delta / static_cast<double>(count);
            m2 += delta * (x - mean);
        }
        if (x == 0.0) ++zeros;
        else if (x < 0.0) ++negatives;
        else if (x > 0.0) ++positives;
        sample.push_back(x);
    }
    // population variance
    double variance() const { return count > 0 ? m2 / static_cast<double>(count) : 0.0; }
    double stddev() const { return std::sqrt(variance()); }

    // Call once before quantile().
    void finish() { std::sort(sample.begin(), sample.end()); }

    // Linear interpolation between closest ranks; sample must be sorted.
    double quantile(double q) const {
        if (sample.empty()) return 0.0;
        double pos = q * static_cast<double>(sample.size() - 1);
        std::size_t i = static_cast<std::size_t>(pos);
        double frac = pos - static_cast<double>(i);
        if (i + 1 < sample.size()) return sample[i] * (1.0 - frac) + sample[i + 1] * frac;
        return sample[i];
    }
};

// Counts occurrences and remembers first-seen order so ties rank stably.
template <class Key, class Hash = std::hash<Key>>
struct frequency_counter {
    std::size_t total{0};
    std::vector<std::pair<Key, std::size_t>> entries;
    std::unordered_map<Key, std::size_t, Hash> index;

    void add(const Key& k) {
        ++total;
        auto it = index.find(k);
        if (it == index.end()) {
            index.emplace(k, entries.size());
            entries.emplace_back(k, 1);
        } else {
            ++entries[it->second].second;
        }
    }

    std::size_t distinct() const { return entries.size(); }

    std::vector<std::pair<Key, std::size_t>> top(std::size_t k) const {
        auto out = entries;
        std::stable_sort(out.begin(), out.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        if (out.size() > k) out.resize(k);
        return out;
    }
};

}
