#include <stdexcept>

#include <gtest/gtest.h>

#include "SpanNER/span_lattice.hpp"

using namespace spanner;

TEST(SpanLatticeTest, CountAndValidity) {
    for (int64_t n = 0; n <= 7; n++) {
        for (int64_t w = 1; w <= 5; w++) {
            std::vector<SpanIndex> spans = generateSpans(n, w);
            ASSERT_EQ(static_cast<int64_t>(spans.size()), n * w) << "n=" << n << " w=" << w;

            for (size_t k = 0; k < spans.size(); k++) {
                const int64_t start = k / w;
                const int64_t width = k % w;
                const SpanIndex& span = spans[k];
                EXPECT_EQ(span.start, start);
                EXPECT_EQ(span.valid, start + width < n);
                EXPECT_LE(span.start, span.end);
                EXPECT_LT(span.end, n);
                if (span.valid) {
                    EXPECT_EQ(span.end, start + width);
                }
            }
        }
    }
}

TEST(SpanLatticeTest, ShortSequence) {
    std::vector<SpanIndex> spans = generateSpans(2, 3);

    ASSERT_EQ(spans.size(), 6u);
    EXPECT_EQ(spans[0].end, 0);
    EXPECT_TRUE(spans[0].valid);
    EXPECT_EQ(spans[1].end, 1);
    EXPECT_TRUE(spans[1].valid);
    EXPECT_EQ(spans[2].end, 1);
    EXPECT_FALSE(spans[2].valid);
    EXPECT_EQ(spans[3].start, 1);
    EXPECT_TRUE(spans[3].valid);
    EXPECT_FALSE(spans[4].valid);
    EXPECT_FALSE(spans[5].valid);
}

TEST(SpanLatticeTest, RejectsNonPositiveWidth) {
    EXPECT_THROW(generateSpans(3, 0), std::invalid_argument);
}
