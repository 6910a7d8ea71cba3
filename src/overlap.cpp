#include <algorithm>

#include "SpanNER/overlap.hpp"

using namespace spanner;

namespace {
    template <typename Conflict>
    std::vector<Entity> selectGreedy(const std::vector<Entity>& spans, Conflict conflicts) {
        if (spans.empty()) {
            return {};
        }

        std::vector<Entity> sorted = spans;
        std::stable_sort(sorted.begin(), sorted.end(), [](const Entity& a, const Entity& b) {
            return a.score > b.score;
        });

        std::vector<Entity> selected;
        selected.reserve(sorted.size());
        for (const Entity& span : sorted) {
            bool overlaps = std::any_of(selected.begin(), selected.end(), [&](const Entity& kept) {
                return conflicts(span, kept);
            });
            if (!overlaps) {
                selected.push_back(span);
            }
        }

        std::stable_sort(selected.begin(), selected.end(), [](const Entity& a, const Entity& b) {
            return a.startIdx < b.startIdx;
        });
        return selected;
    }
}

bool spanner::isNested(const Entity& s1, const Entity& s2) {
    return (s1.startIdx <= s2.startIdx && s2.endIdx <= s1.endIdx) || (s2.startIdx <= s1.startIdx && s1.endIdx <= s2.endIdx);
}

bool spanner::hasOverlapping(const Entity& s1, const Entity& s2, bool allowNested, bool multiLabel) {
    if (s1.startIdx == s2.startIdx && s1.endIdx == s2.endIdx) {
        return !multiLabel;
    }
    if (s1.startIdx > s2.endIdx || s2.startIdx > s1.endIdx) {
        return false;
    }
    if (allowNested && isNested(s1, s2)) {
        return false;
    }
    return true;
}

std::vector<Entity> spanner::greedySearch(const std::vector<Entity>& spans, bool flatNer, bool multiLabel) {
    return selectGreedy(spans, [flatNer, multiLabel](const Entity& a, const Entity& b) {
        return hasOverlapping(a, b, !flatNer, multiLabel);
    });
}

std::vector<std::vector<Entity>> spanner::batchGreedySearch(
    const std::vector<std::vector<Entity>>& spansBatch, bool flatNer, bool multiLabel
) {
    std::vector<std::vector<Entity>> allSelectedSpans;
    allSelectedSpans.reserve(spansBatch.size());

    for (const auto& spans : spansBatch) {
        allSelectedSpans.push_back(greedySearch(spans, flatNer, multiLabel));
    }
    return allSelectedSpans;
}

std::vector<Entity> spanner::labelScopedSearch(const std::vector<Entity>& spans) {
    return selectGreedy(spans, [](const Entity& a, const Entity& b) {
        return a.label == b.label && a.startIdx < b.endIdx && a.endIdx > b.startIdx;
    });
}
