// SPDX-License-Identifier: MIT
#include "rendering/ViewFrustum.h"

#include <glm/gtc/matrix_transform.hpp>

#include <gtest/gtest.h>

namespace {

void expectVecNear(const glm::vec3& actual, const glm::vec3& expected, float tolerance)
{
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.z, expected.z, tolerance);
}

ViewFrustum makePerspectiveFrustum(float maxFar)
{
    // 90 degree square frustum: corners sit at |x| = |y| = |z|.
    ViewFrustum frustum;
    EXPECT_TRUE(frustum.setFromProjection(glm::perspective(glm::radians(90.0f), 1.0f, 1.0f, 100.0f), maxFar));
    return frustum;
}

} // namespace

TEST(ViewFrustumTest, PerspectiveCornersFollowRingOrder)
{
    const ViewFrustum frustum = makePerspectiveFrustum(1000.0f);

    expectVecNear(frustum.nearCorner(FrustumCorners::TopRight), glm::vec3(1.0f, 1.0f, -1.0f), 1e-4f);
    expectVecNear(frustum.nearCorner(FrustumCorners::BottomRight), glm::vec3(1.0f, -1.0f, -1.0f), 1e-4f);
    expectVecNear(frustum.nearCorner(FrustumCorners::BottomLeft), glm::vec3(-1.0f, -1.0f, -1.0f), 1e-4f);
    expectVecNear(frustum.nearCorner(FrustumCorners::TopLeft), glm::vec3(-1.0f, 1.0f, -1.0f), 1e-4f);

    expectVecNear(frustum.farCorner(FrustumCorners::TopRight), glm::vec3(100.0f, 100.0f, -100.0f), 0.05f);
    expectVecNear(frustum.farCorner(FrustumCorners::BottomLeft), glm::vec3(-100.0f, -100.0f, -100.0f), 0.05f);
}

TEST(ViewFrustumTest, PerspectiveFarRingIsPulledInAlongRays)
{
    const ViewFrustum frustum = makePerspectiveFrustum(50.0f);
    for (int k = 0; k < FrustumCorners::kRingSize; ++k) {
        const glm::vec3& nearCorner = frustum.nearCorner(k);
        const glm::vec3& farCorner = frustum.farCorner(k);
        EXPECT_NEAR(farCorner.z, -50.0f, 0.05f);
        // Same ray through the origin as the near corner.
        expectVecNear(farCorner, nearCorner * 50.0f, 0.05f);
    }
}

TEST(ViewFrustumTest, OrthographicFarRingOnlyMovesInDepth)
{
    ViewFrustum frustum;
    const glm::mat4 projection = glm::ortho(-2.0f, 2.0f, -3.0f, 3.0f, 1.0f, 100.0f);
    ASSERT_TRUE(ViewFrustum::isOrthographic(projection));
    ASSERT_TRUE(frustum.setFromProjection(projection, 50.0f));

    expectVecNear(frustum.nearCorner(FrustumCorners::TopRight), glm::vec3(2.0f, 3.0f, -1.0f), 1e-4f);
    expectVecNear(frustum.farCorner(FrustumCorners::TopRight), glm::vec3(2.0f, 3.0f, -50.0f), 1e-3f);
    expectVecNear(frustum.farCorner(FrustumCorners::BottomLeft), glm::vec3(-2.0f, -3.0f, -50.0f), 1e-3f);
}

TEST(ViewFrustumTest, FarRingKeptWhenInsideMaxFar)
{
    const ViewFrustum frustum = makePerspectiveFrustum(1000.0f);
    EXPECT_NEAR(frustum.farCorner(FrustumCorners::TopLeft).z, -100.0f, 0.05f);
}

TEST(ViewFrustumTest, DetectsProjectionType)
{
    EXPECT_FALSE(ViewFrustum::isOrthographic(glm::perspective(glm::radians(60.0f), 1.5f, 0.1f, 10.0f)));
    EXPECT_TRUE(ViewFrustum::isOrthographic(glm::ortho(-1.0f, 1.0f, -1.0f, 1.0f, 0.1f, 10.0f)));
}

TEST(ViewFrustumTest, RejectsSingularProjection)
{
    const ViewFrustum reference = makePerspectiveFrustum(1000.0f);
    ViewFrustum frustum = reference;
    EXPECT_FALSE(frustum.setFromProjection(glm::mat4(0.0f), 1000.0f));
    expectVecNear(frustum.farCorner(0), reference.farCorner(0), 0.0f);
}

TEST(ViewFrustumTest, SplitPartitionsDepthWithoutGaps)
{
    const ViewFrustum frustum = makePerspectiveFrustum(1000.0f);
    const std::vector<float> fractions = { 0.1f, 0.4f, 1.0f };
    std::vector<ViewFrustum> cascades;
    frustum.split(fractions, cascades);
    ASSERT_EQ(cascades.size(), fractions.size());

    for (int k = 0; k < FrustumCorners::kRingSize; ++k) {
        expectVecNear(cascades.front().nearCorner(k), frustum.nearCorner(k), 0.0f);
        expectVecNear(cascades.back().farCorner(k), frustum.farCorner(k), 0.0f);
        for (std::size_t i = 0; i + 1 < cascades.size(); ++i)
            expectVecNear(cascades[i].farCorner(k), cascades[i + 1].nearCorner(k), 0.0f);
    }

    // Boundaries are interpolated per corner between the near and far ring.
    const glm::vec3 expected = glm::mix(frustum.nearCorner(FrustumCorners::BottomRight), frustum.farCorner(FrustumCorners::BottomRight), 0.4f);
    expectVecNear(cascades[1].farCorner(FrustumCorners::BottomRight), expected, 1e-4f);
}

TEST(ViewFrustumTest, SingleSliceIsTheWholeFrustum)
{
    const ViewFrustum frustum = makePerspectiveFrustum(1000.0f);
    std::vector<ViewFrustum> cascades(5);
    frustum.split({ 1.0f }, cascades);
    ASSERT_EQ(cascades.size(), 1u);
    for (int k = 0; k < FrustumCorners::kRingSize; ++k) {
        expectVecNear(cascades[0].nearCorner(k), frustum.nearCorner(k), 0.0f);
        expectVecNear(cascades[0].farCorner(k), frustum.farCorner(k), 0.0f);
    }
}

TEST(ViewFrustumTest, ToSpaceTransformsEveryCorner)
{
    const ViewFrustum frustum = makePerspectiveFrustum(1000.0f);
    const glm::mat4 transform = glm::translate(glm::mat4(1.0f), glm::vec3(5.0f, -2.0f, 3.0f));
    ViewFrustum moved;
    frustum.toSpace(transform, moved);
    for (int k = 0; k < FrustumCorners::kRingSize; ++k) {
        expectVecNear(moved.nearCorner(k), frustum.nearCorner(k) + glm::vec3(5.0f, -2.0f, 3.0f), 1e-4f);
        expectVecNear(moved.farCorner(k), frustum.farCorner(k) + glm::vec3(5.0f, -2.0f, 3.0f), 1e-3f);
    }
}

TEST(ViewFrustumTest, BoundsEncloseAllCorners)
{
    FrustumCorners corners;
    corners.nearRing = { glm::vec3(1, 1, -1), glm::vec3(1, -1, -1), glm::vec3(-1, -1, -1), glm::vec3(-1, 1, -1) };
    corners.farRing = { glm::vec3(4, 3, -10), glm::vec3(4, -3, -10), glm::vec3(-4, -3, -10), glm::vec3(-4, 3, -10) };
    const FrustumBounds box = ViewFrustum(corners).bounds();
    expectVecNear(box.min, glm::vec3(-4.0f, -3.0f, -10.0f), 0.0f);
    expectVecNear(box.max, glm::vec3(4.0f, 3.0f, -1.0f), 0.0f);
    expectVecNear(box.center(), glm::vec3(0.0f, 0.0f, -5.5f), 0.0f);
}
