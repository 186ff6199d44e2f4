// SPDX-License-Identifier: MIT
#include "rendering/CascadeFragmentSelector.h"

#include <gtest/gtest.h>

#include <vector>

namespace {

const std::vector<float> kSplits = { 0.1f, 0.3f, 0.6f, 1.0f };

} // namespace

TEST(CascadeFragmentSelectorTest, LinearDepthSpansShadowRange)
{
    EXPECT_FLOAT_EQ(CascadeFragmentSelector::linearDepth(1.0f, 1.0f, 101.0f), 0.0f);
    EXPECT_FLOAT_EQ(CascadeFragmentSelector::linearDepth(51.0f, 1.0f, 101.0f), 0.5f);
    EXPECT_FLOAT_EQ(CascadeFragmentSelector::linearDepth(101.0f, 1.0f, 101.0f), 1.0f);
    EXPECT_FLOAT_EQ(CascadeFragmentSelector::linearDepth(10.0f, 5.0f, 5.0f), 0.0f);
}

TEST(CascadeFragmentSelectorTest, BoundariesBelongToTheNextCascade)
{
    EXPECT_EQ(CascadeFragmentSelector::selectCascade(0.0f, kSplits), 0);
    EXPECT_EQ(CascadeFragmentSelector::selectCascade(0.0999f, kSplits), 0);
    EXPECT_EQ(CascadeFragmentSelector::selectCascade(0.1f, kSplits), 1);
    EXPECT_EQ(CascadeFragmentSelector::selectCascade(0.3f, kSplits), 2);
    EXPECT_EQ(CascadeFragmentSelector::selectCascade(0.6f, kSplits), 3);
    EXPECT_EQ(CascadeFragmentSelector::selectCascade(0.99f, kSplits), 3);
}

TEST(CascadeFragmentSelectorTest, OutOfRangeDepthsAreClampedToEndCascades)
{
    EXPECT_EQ(CascadeFragmentSelector::selectCascade(-0.5f, kSplits), 0);
    EXPECT_EQ(CascadeFragmentSelector::selectCascade(1.0f, kSplits), 3);
    EXPECT_EQ(CascadeFragmentSelector::selectCascade(7.0f, kSplits), 3);
}

TEST(CascadeFragmentSelectorTest, SelectionIsTotalAndExclusive)
{
    const std::vector<glm::vec2> intervals = CascadeFragmentSelector::depthIntervals(kSplits);
    ASSERT_EQ(intervals.size(), kSplits.size());

    for (int step = -20; step <= 220; ++step) {
        const float depth = static_cast<float>(step) / 200.0f;
        const int selected = CascadeFragmentSelector::selectCascade(depth, kSplits);
        ASSERT_GE(selected, 0);
        ASSERT_LT(selected, static_cast<int>(kSplits.size()));

        int matches = 0;
        for (std::size_t i = 0; i < intervals.size(); ++i) {
            const bool first = i == 0;
            const bool last = i + 1 == intervals.size();
            const bool aboveStart = first || depth >= intervals[i].x;
            const bool belowEnd = last || depth < intervals[i].y;
            if (aboveStart && belowEnd) {
                ++matches;
                EXPECT_EQ(static_cast<int>(i), selected) << "depth " << depth;
            }
        }
        EXPECT_EQ(matches, 1) << "depth " << depth;
    }
}

TEST(CascadeFragmentSelectorTest, DepthIntervalsChainFromZero)
{
    const std::vector<glm::vec2> intervals = CascadeFragmentSelector::depthIntervals(kSplits);
    EXPECT_FLOAT_EQ(intervals[0].x, 0.0f);
    EXPECT_FLOAT_EQ(intervals[0].y, 0.1f);
    EXPECT_FLOAT_EQ(intervals[2].x, 0.3f);
    EXPECT_FLOAT_EQ(intervals[2].y, 0.6f);
    EXPECT_FLOAT_EQ(intervals[3].y, 1.0f);
    EXPECT_TRUE(CascadeFragmentSelector::depthIntervals({}).empty());
}

TEST(CascadeFragmentSelectorTest, ViewDepthUsesShadowFar)
{
    // Shadow range 1..201: a fragment 50 units out lands at 0.245.
    EXPECT_EQ(CascadeFragmentSelector::selectCascadeForViewDepth(50.0f, 1.0f, 201.0f, kSplits), 1);
    EXPECT_EQ(CascadeFragmentSelector::selectCascadeForViewDepth(0.5f, 1.0f, 201.0f, kSplits), 0);
    EXPECT_EQ(CascadeFragmentSelector::selectCascadeForViewDepth(5000.0f, 1.0f, 201.0f, kSplits), 3);
    EXPECT_EQ(CascadeFragmentSelector::selectCascade(0.5f, { 1.0f }), 0);
}
