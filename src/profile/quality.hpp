// src/profile/quality.hpp
#pragma once
#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include "../util/strings.hpp"

namespace dprof {

struct quality_assessment {
    double                   quality_score = 100.0;
    double                   completeness_percentage = 100.0;
    double                   uniqueness_percentage = 0.0;
    std::vector<std::string> potential_issues;
};

constexpr double null_penalty_cap   = 30.0;
constexpr double blank_penalty_cap  = 20.0;
constexpr double diversity_bonus    = 5.0;
constexpr double diversity_penalty  = 10.0;

// Score starts at 100, loses up to 30 for nulls and up to 20 for blanks,
// gains 5 above 80% diversity or loses 10 below 10%. Floored at 0 and not
// capped, so a fully populated unique column scores 105.
// A column with no values scores 100 / completeness 100 / uniqueness 0.
inline quality_assessment assess_quality(std::size_t total_values,
                                         std::size_t null_count,
                                         std::size_t blank_count,
                                         std::size_t distinct_count) {
    quality_assessment qa;
    if (total_values == 0) return qa;

    const double total        = static_cast<double>(total_values);
    const double null_pct     = static_cast<double>(null_count) / total * 100.0;
    const double blank_pct    = static_cast<double>(blank_count) / total * 100.0;
    const double diversity    = static_cast<double>(distinct_count) / total * 100.0;

    double score = 100.0;
    if (null_pct > 0.0)  score -= std::min(null_pct, null_penalty_cap);
    if (blank_pct > 0.0) score -= std::min(blank_pct, blank_penalty_cap);
    if (diversity > 80.0)      score += diversity_bonus;
    else if (diversity < 10.0) score -= diversity_penalty;

    qa.quality_score           = std::max(0.0, round_to(score, 1));
    qa.completeness_percentage = round_to((total - static_cast<double>(null_count)) / total * 100.0, 2);
    qa.uniqueness_percentage   = round_to(diversity, 2);

    if (null_pct > 50.0)  qa.potential_issues.emplace_back("High null percentage");
    if (blank_pct > 20.0) qa.potential_issues.emplace_back("High blank percentage");
    if (diversity < 5.0)  qa.potential_issues.emplace_back("Low data diversity");
    return qa;
}

}
