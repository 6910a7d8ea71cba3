#pragma once

#include <vector>
#include <cstdint>

#include "spanner_structs.hpp"

namespace spanner {
    // All (start, end) pairs of up to maxWidth units over a sequence of `length` units,
    // ordered by start then width. Exactly length * maxWidth entries; pairs running past
    // the end are clamped and marked invalid.
    std::vector<SpanIndex> generateSpans(int64_t length, int64_t maxWidth);
}
