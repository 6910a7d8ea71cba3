#pragma once

#include <vector>

#include "spanner_structs.hpp"

namespace spanner {
    bool isNested(const Entity& s1, const Entity& s2);

    // Whether two spans may not both be kept. Bounds are compared inclusively.
    bool hasOverlapping(const Entity& s1, const Entity& s2, bool allowNested = false, bool multiLabel = false);

    // Greedy selection by descending score (ties keep input order); result ordered by start.
    // flatNer forbids nested spans, multiLabel lets one span carry several labels.
    std::vector<Entity> greedySearch(const std::vector<Entity>& spans, bool flatNer = true, bool multiLabel = false);
    std::vector<std::vector<Entity>> batchGreedySearch(
        const std::vector<std::vector<Entity>>& spansBatch, bool flatNer = true, bool multiLabel = false
    );

    // Same greedy selection, but only spans sharing a label and intersecting as half-open
    // ranges conflict.
    std::vector<Entity> labelScopedSearch(const std::vector<Entity>& spans);
}
