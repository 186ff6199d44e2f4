// SPDX-License-Identifier: MIT
#include "rendering/HeadlessShadowMapAllocator.h"

#include <gtest/gtest.h>

#include <utility>

TEST(ShadowMapTest, ReleasesExactlyOnce)
{
    HeadlessShadowMapAllocator allocator;
    {
        ShadowMap map(allocator, 1024);
        EXPECT_TRUE(map.valid());
        EXPECT_EQ(map.resolution(), 1024);
        EXPECT_TRUE(allocator.isLive(map.texture()));
        map.reset();
        EXPECT_FALSE(map.valid());
        map.reset();
    }
    EXPECT_EQ(allocator.allocationCount(), 1u);
    EXPECT_EQ(allocator.releaseCount(), 1u);
    EXPECT_EQ(allocator.invalidReleaseCount(), 0u);
    EXPECT_EQ(allocator.liveCount(), 0u);
}

TEST(ShadowMapTest, MoveTransfersOwnership)
{
    HeadlessShadowMapAllocator allocator;
    ShadowMap source(allocator, 512);
    const GLuint texture = source.texture();

    ShadowMap moved(std::move(source));
    EXPECT_FALSE(source.valid());
    EXPECT_EQ(moved.texture(), texture);

    ShadowMap other(allocator, 256);
    other = std::move(moved);
    EXPECT_EQ(other.texture(), texture);
    EXPECT_EQ(allocator.liveCount(), 1u);
    EXPECT_EQ(allocator.releaseCount(), 1u);
}

TEST(HeadlessShadowMapAllocatorTest, EnforcesTexelBudget)
{
    HeadlessShadowMapAllocator allocator(2u * 1024u * 1024u);
    ShadowMap first(allocator, 1024);
    ShadowMap second(allocator, 1024);
    EXPECT_EQ(allocator.texelsInUse(), 2u * 1024u * 1024u);
    EXPECT_THROW(ShadowMap(allocator, 32), ShadowMapAllocationError);

    second.reset();
    EXPECT_NO_THROW(ShadowMap(allocator, 512));
}

TEST(HeadlessShadowMapAllocatorTest, RejectsUnsupportedResolutions)
{
    HeadlessShadowMapAllocator allocator;
    EXPECT_THROW((void)allocator.allocate(16), ShadowMapAllocationError);
    EXPECT_THROW((void)allocator.allocate(32768), ShadowMapAllocationError);
    EXPECT_EQ(allocator.liveCount(), 0u);
}

TEST(HeadlessShadowMapAllocatorTest, CountsUnknownReleases)
{
    HeadlessShadowMapAllocator allocator;
    testing::internal::CaptureStderr();
    allocator.release(ShadowMapHandle { 42, 1024 });
    const std::string log = testing::internal::GetCapturedStderr();
    EXPECT_EQ(allocator.invalidReleaseCount(), 1u);
    EXPECT_NE(log.find("[ShadowMaps]"), std::string::npos);
}
