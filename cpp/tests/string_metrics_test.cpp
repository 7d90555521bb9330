#include <gtest/gtest.h>
#include "cadstring/geometry/cad_string.h"
#include "cadstring/geometry/string_metrics.h"
#include <cmath>
#include <string>

TEST(StringMetricsTest, PlanLengthIgnoresElevation) {
    const VertexSequence ramp{{0, 0, 100}, {30, 40, 90}, {30, 40, 80}};
    EXPECT_DOUBLE_EQ(string_metrics::planLength(ramp), 50.0);
    EXPECT_DOUBLE_EQ(ramp.pathLength(), std::sqrt(2500.0 + 100.0) + 10.0);
}

TEST(StringMetricsTest, RingLengthAddsClosingSegmentOnlyWhenClosed) {
    const VertexSequence square{{0, 0, 0}, {10, 0, 0}, {10, 10, 0}, {0, 10, 0}};
    EXPECT_DOUBLE_EQ(string_metrics::ringLength(square, false), 30.0);
    EXPECT_DOUBLE_EQ(string_metrics::ringLength(square, true), 40.0);

    // Two vertices never get a closing segment.
    const VertexSequence pair{{0, 0, 0}, {10, 0, 0}};
    EXPECT_DOUBLE_EQ(string_metrics::ringLength(pair, true), 10.0);
}

TEST(StringMetricsTest, PlanLengthClosesRingWhenClosed) {
    const VertexSequence square{{0, 0, 0}, {10, 0, 0}, {10, 10, 20}, {0, 10, 20}};
    EXPECT_DOUBLE_EQ(string_metrics::planLength(square, false), 30.0);
    EXPECT_DOUBLE_EQ(string_metrics::planLength(square, true), 40.0);

    const VertexSequence pair{{0, 0, 0}, {10, 0, 0}};
    EXPECT_DOUBLE_EQ(string_metrics::planLength(pair, true), 10.0);
}

TEST(StringMetricsTest, PlanAreaForClosedStrings) {
    const VertexSequence square{{0, 0, 5}, {10, 0, 5}, {10, 10, 5}, {0, 10, 5}};
    const auto area = string_metrics::planArea(square, true);
    ASSERT_TRUE(area.has_value());
    EXPECT_DOUBLE_EQ(*area, 100.0);

    // Winding does not change the sign.
    const auto reversed = string_metrics::planArea(square.reverse(), true);
    ASSERT_TRUE(reversed.has_value());
    EXPECT_DOUBLE_EQ(*reversed, 100.0);

    EXPECT_FALSE(string_metrics::planArea(square, false).has_value());
    EXPECT_FALSE(string_metrics::planArea(VertexSequence{{0, 0, 0}, {1, 0, 0}}, true).has_value());
}

TEST(StringMetricsTest, GradientPerSegment) {
    const VertexSequence road{{0, 0, 100}, {100, 0, 90}, {100, 0, 95}, {200, 0, 95}};
    const auto info = string_metrics::gradient(road);
    ASSERT_TRUE(info.has_value());
    ASSERT_EQ(info->segmentGradients.size(), 3u);
    EXPECT_DOUBLE_EQ(info->segmentGradients[0], -10.0);
    // Vertical segment has no plan run.
    EXPECT_DOUBLE_EQ(info->segmentGradients[1], 0.0);
    EXPECT_DOUBLE_EQ(info->segmentGradients[2], 0.0);
    EXPECT_DOUBLE_EQ(info->minGradient, -10.0);
    EXPECT_DOUBLE_EQ(info->maxGradient, 0.0);
    EXPECT_DOUBLE_EQ(info->avgGradient, -10.0 / 3.0);

    EXPECT_FALSE(string_metrics::gradient(VertexSequence{{0, 0, 0}}).has_value());
}

TEST(StringTypeTest, KeysRoundTripAndUnknownIsCustom) {
    for (std::size_t i = 0; i < kStringTypeCount; ++i) {
        const auto type = static_cast<StringType>(i);
        EXPECT_EQ(parseStringType(stringTypeKey(type)), type);
    }
    EXPECT_EQ(parseStringType("haul_road"), StringType::HaulRoad);
    EXPECT_STREQ(stringTypeLabel(StringType::PitBoundary), "Pit Boundary");
    EXPECT_EQ(parseStringType("not_a_type"), StringType::Custom);
    EXPECT_EQ(parseStringType(""), StringType::Custom);
}
