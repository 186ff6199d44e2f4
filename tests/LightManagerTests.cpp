// SPDX-License-Identifier: MIT
#include "rendering/LightManager.h"

#include <glm/geometric.hpp>

#include <gtest/gtest.h>

TEST(LightManagerTest, EnsureLightCreatesOnce)
{
    LightManager lights;
    LightManager::Light& first = lights.ensureLight("CSM Cascade 0");
    first.intensity = 2.0f;

    LightManager::Light& again = lights.ensureLight("CSM Cascade 0");
    EXPECT_EQ(lights.lightCount(), 1u);
    EXPECT_FLOAT_EQ(again.intensity, 2.0f);

    ASSERT_NE(lights.findLightByName("CSM Cascade 0"), nullptr);
    EXPECT_EQ(lights.findLightByName("CSM Cascade 1"), nullptr);
}

TEST(LightManagerTest, RemoveLightDetaches)
{
    LightManager lights;
    lights.ensureLight("a");
    lights.ensureLight("b");
    EXPECT_TRUE(lights.removeLight("a"));
    EXPECT_FALSE(lights.removeLight("a"));
    EXPECT_EQ(lights.lightCount(), 1u);
    EXPECT_EQ(lights.lights().front().name, "b");
}

TEST(LightManagerTest, DirtyFlagTracksChanges)
{
    LightManager lights;
    EXPECT_TRUE(lights.consumeDirty());
    EXPECT_FALSE(lights.consumeDirty());

    const std::uint64_t revision = lights.revision();
    lights.ensureLight("sun");
    EXPECT_TRUE(lights.dirty());
    EXPECT_GT(lights.revision(), revision);
    EXPECT_TRUE(lights.consumeDirty());
    EXPECT_FALSE(lights.dirty());
}

TEST(LightManagerTest, UpVectorAvoidsParallelDirections)
{
    EXPECT_EQ(LightManager::upVectorFor(glm::vec3(0.0f, -1.0f, 0.0f)), glm::vec3(0.0f, 0.0f, 1.0f));
    EXPECT_EQ(LightManager::upVectorFor(glm::vec3(1.0f, -1.0f, 0.5f)), glm::vec3(0.0f, 1.0f, 0.0f));
}

TEST(LightManagerTest, ViewProjectionMapsTargetToCenter)
{
    LightManager::Light light;
    light.position = glm::vec3(10.0f, 50.0f, -5.0f);
    light.target = light.position + glm::normalize(glm::vec3(-0.3f, -1.0f, 0.5f));
    light.shadowCamera.left = -20.0f;
    light.shadowCamera.right = 20.0f;
    light.shadowCamera.bottom = -20.0f;
    light.shadowCamera.top = 20.0f;
    light.shadowCamera.nearPlane = 1.0f;
    light.shadowCamera.farPlane = 200.0f;

    const glm::vec3 ahead = light.position + light.direction() * 100.0f;
    const glm::vec4 clip = light.viewProjection() * glm::vec4(ahead, 1.0f);
    EXPECT_NEAR(clip.x, 0.0f, 1e-4f);
    EXPECT_NEAR(clip.y, 0.0f, 1e-4f);
    EXPECT_GT(clip.z, -1.0f);
    EXPECT_LT(clip.z, 1.0f);
}
