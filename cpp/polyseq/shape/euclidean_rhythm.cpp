#include "polyseq/shape/euclidean_rhythm.h"

#include <algorithm>
#include <limits>

namespace polyseq {

namespace {

struct Gap {
    std::int32_t start;
    std::int32_t length;
};

std::vector<std::int32_t> onsetPositions(const std::vector<bool>& pattern) {
    std::vector<std::int32_t> out;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i]) out.push_back(static_cast<std::int32_t>(i));
    }
    return out;
}

// Gaps between consecutive onsets, including the one that wraps past the end.
std::vector<Gap> collectGaps(const std::vector<bool>& pattern) {
    const std::int32_t n = static_cast<std::int32_t>(pattern.size());
    const std::vector<std::int32_t> onsets = onsetPositions(pattern);
    std::vector<Gap> gaps;
    if (onsets.empty()) return gaps;
    for (std::size_t i = 0; i + 1 < onsets.size(); ++i) {
        gaps.push_back(Gap{onsets[i], onsets[i + 1] - onsets[i]});
    }
    gaps.push_back(Gap{onsets.back(), n - onsets.back() + onsets.front()});
    return gaps;
}

void fillLargestGaps(std::vector<bool>& pattern, std::int32_t missing) {
    const std::int32_t n = static_cast<std::int32_t>(pattern.size());
    while (missing > 0) {
        std::vector<Gap> gaps = collectGaps(pattern);
        if (gaps.empty()) {
            pattern[0] = true;
            --missing;
            continue;
        }
        // Largest first; earlier start wins ties so the result is deterministic.
        std::stable_sort(gaps.begin(), gaps.end(), [](const Gap& a, const Gap& b) {
            return a.length > b.length;
        });
        bool placed = false;
        for (const Gap& gap : gaps) {
            if (gap.length < 2) break;
            const std::int32_t middle = (gap.start + gap.length / 2) % n;
            if (!pattern[middle]) {
                pattern[middle] = true;
                placed = true;
                break;
            }
        }
        if (!placed) {
            // Every gap is already tight; take the first free slot.
            const auto it = std::find(pattern.begin(), pattern.end(), false);
            if (it == pattern.end()) return;
            *it = true;
        }
        --missing;
    }
}

void trimShortestGaps(std::vector<bool>& pattern, std::int32_t excess) {
    const std::int32_t n = static_cast<std::int32_t>(pattern.size());
    std::vector<std::int32_t> onsets = onsetPositions(pattern);
    while (excess > 0 && !onsets.empty()) {
        std::int32_t minDistance = std::numeric_limits<std::int32_t>::max();
        std::size_t removeAt = 0;
        for (std::size_t i = 0; i < onsets.size(); ++i) {
            const std::size_t next = (i + 1) % onsets.size();
            const std::int32_t d = (onsets[next] - onsets[i] + n) % n;
            if (d < minDistance) {
                minDistance = d;
                removeAt = i;
            }
        }
        pattern[onsets[removeAt]] = false;
        onsets.erase(onsets.begin() + static_cast<std::ptrdiff_t>(removeAt));
        --excess;
    }
}

} // namespace

std::vector<bool> euclideanRhythm(std::int32_t steps, std::int32_t pulses) {
    if (steps <= 0) return {};
    const std::int32_t n = steps;
    const std::int32_t k = std::clamp<std::int32_t>(pulses, 0, n);

    std::vector<bool> pattern(static_cast<std::size_t>(n), false);
    if (k == 0) return pattern;
    if (k == n) {
        std::fill(pattern.begin(), pattern.end(), true);
        return pattern;
    }

    for (std::int32_t i = 0; i < k; ++i) {
        const std::int64_t pos = (static_cast<std::int64_t>(i) * n / k) % n;
        pattern[static_cast<std::size_t>(pos)] = true;
    }

    const std::int32_t count = static_cast<std::int32_t>(std::count(pattern.begin(), pattern.end(), true));
    if (count < k) {
        fillLargestGaps(pattern, k - count);
    } else if (count > k) {
        trimShortestGaps(pattern, count - k);
    }
    return pattern;
}

} // namespace polyseq
