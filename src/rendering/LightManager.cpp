// SPDX-License-Identifier: MIT
#include "rendering/LightManager.h"

#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/norm.hpp>

#include <algorithm>

namespace {

constexpr glm::vec3 kWorldUp(0.0f, 1.0f, 0.0f);
constexpr glm::vec3 kFallbackUp(0.0f, 0.0f, 1.0f);

[[nodiscard]] glm::vec3 sanitizeDirection(const glm::vec3& dir)
{
    glm::vec3 result = dir;
    if (glm::length(result) < 1e-4f)
        result = glm::vec3(0.0f, -1.0f, 0.0f);
    return glm::normalize(result);
}

} // namespace

glm::vec3 LightManager::upVectorFor(const glm::vec3& direction)
{
    const glm::vec3 dir = sanitizeDirection(direction);
    if (glm::length2(glm::cross(dir, kWorldUp)) < 1e-8f)
        return kFallbackUp;
    return kWorldUp;
}

glm::vec3 LightManager::Light::direction() const
{
    return sanitizeDirection(target - position);
}

glm::mat4 LightManager::Light::viewMatrix() const
{
    const glm::vec3 dir = direction();
    return glm::lookAt(position, position + dir, upVectorFor(dir));
}

glm::mat4 LightManager::Light::projectionMatrix() const
{
    return glm::ortho(shadowCamera.left, shadowCamera.right, shadowCamera.bottom, shadowCamera.top,
        shadowCamera.nearPlane, shadowCamera.farPlane);
}

glm::mat4 LightManager::Light::viewProjection() const
{
    return projectionMatrix() * viewMatrix();
}

LightManager::Light* LightManager::findLightByName(const std::string& name)
{
    auto it = std::find_if(m_lights.begin(), m_lights.end(), [&name](const Light& light) {
        return light.name == name;
    });
    if (it == m_lights.end())
        return nullptr;
    return &(*it);
}

const LightManager::Light* LightManager::findLightByName(const std::string& name) const
{
    auto it = std::find_if(m_lights.begin(), m_lights.end(), [&name](const Light& light) {
        return light.name == name;
    });
    if (it == m_lights.end())
        return nullptr;
    return &(*it);
}

LightManager::Light& LightManager::ensureLight(const std::string& name)
{
    if (Light* existing = findLightByName(name))
        return *existing;

    Light light;
    light.name = name;
    m_lights.push_back(light);
    markDirty();
    return m_lights.back();
}

bool LightManager::removeLight(const std::string& name)
{
    auto it = std::find_if(m_lights.begin(), m_lights.end(), [&name](const Light& light) {
        return light.name == name;
    });
    if (it == m_lights.end())
        return false;

    m_lights.erase(it);
    markDirty();
    return true;
}

void LightManager::markDirty()
{
    m_dirty = true;
    ++m_revision;
}

bool LightManager::consumeDirty()
{
    const bool wasDirty = m_dirty;
    m_dirty = false;
    return wasDirty;
}
