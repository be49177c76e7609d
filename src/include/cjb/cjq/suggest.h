#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace cjb {
namespace cjq {

// Levenshtein distance, two rows at a time.
inline size_t editDistance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t subst = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, subst});
        }
        prev.swap(cur);
    }
    return prev[b.size()];
}

// Closest candidate, or "" if nothing is within max(3, 40% of the length).
inline std::string closestOption(const std::string& given, const std::vector<std::string>& candidates) {
    std::string best;
    size_t best_distance = 0;
    for (auto const& option : candidates) {
        size_t d = editDistance(given, option);
        if (best.empty() or d < best_distance) {
            best = option;
            best_distance = d;
        }
    }
    size_t threshold = std::max<size_t>(3, given.size() * 2 / 5);
    return (not best.empty() and best_distance <= threshold) ? best : std::string();
}

inline std::string unknownOptionMessage(const std::string& given, const std::vector<std::string>& candidates) {
    std::string msg = "Unknown argument: " + given;
    std::string suggestion = closestOption(given, candidates);
    if (not suggestion.empty()) msg += "\n  Did you mean '" + suggestion + "'?";
    return msg;
}

}  // namespace cjq
}  // namespace cjb
