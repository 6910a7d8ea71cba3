#include <algorithm>
#include <stdexcept>
#include <string>

#include "SpanNER/span_lattice.hpp"

using namespace spanner;

std::vector<SpanIndex> spanner::generateSpans(int64_t length, int64_t maxWidth) {
    if (maxWidth < 1) {
        throw std::invalid_argument("maxWidth must be positive, got " + std::to_string(maxWidth));
    }
    if (length <= 0) {
        return {};
    }

    std::vector<SpanIndex> spans;
    spans.reserve(length * maxWidth);
    for (int64_t start = 0; start < length; start++) {
        for (int64_t width = 0; width < maxWidth; width++) {
            spans.push_back({
                start,
                std::min(start + width, length - 1),
                start + width < length
            });
        }
    }
    return spans;
}
