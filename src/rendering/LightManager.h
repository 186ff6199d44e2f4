// SPDX-License-Identifier: MIT
#pragma once

#include <framework/opengl_includes.h>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Scene-side registry of directional lights. Shadow-casting systems attach their lights here
// and detach them on teardown; the renderer reads positions, targets and shadow cameras back.
class LightManager {
public:
    struct ShadowCamera {
        float left { -1.0f };
        float right { 1.0f };
        float top { 1.0f };
        float bottom { -1.0f };
        float nearPlane { 0.5f };
        float farPlane { 500.0f };
    };

    struct Light {
        std::string name;
        bool enabled { true };
        bool castsShadows { false };
        glm::vec3 color { 1.0f, 1.0f, 1.0f };
        float intensity { 1.0f };
        glm::vec3 position { 0.0f, 1.0f, 0.0f };
        glm::vec3 target { 0.0f, 0.0f, 0.0f };
        ShadowCamera shadowCamera {};
        GLuint shadowMap { 0 };
        int shadowMapResolution { 0 };
        float shadowBias { 0.0f };
        float shadowNormalBias { 0.0f };
        float shadowRadius { 1.0f };
        // Set when position/target/bounds change; cleared by whoever rebuilds the light matrices.
        bool transformsDirty { true };

        [[nodiscard]] glm::vec3 direction() const;
        [[nodiscard]] glm::mat4 viewMatrix() const;
        [[nodiscard]] glm::mat4 projectionMatrix() const;
        [[nodiscard]] glm::mat4 viewProjection() const;
    };

    LightManager() = default;

    [[nodiscard]] const std::vector<Light>& lights() const { return m_lights; }
    [[nodiscard]] std::size_t lightCount() const { return m_lights.size(); }

    [[nodiscard]] Light* findLightByName(const std::string& name);
    [[nodiscard]] const Light* findLightByName(const std::string& name) const;
    [[nodiscard]] Light& ensureLight(const std::string& name);
    bool removeLight(const std::string& name);

    void markDirty();
    [[nodiscard]] bool dirty() const { return m_dirty; }
    // Returns whether anything changed since the last call and clears the flag.
    bool consumeDirty();
    [[nodiscard]] std::uint64_t revision() const { return m_revision; }

    [[nodiscard]] static glm::vec3 upVectorFor(const glm::vec3& direction);

private:
    std::vector<Light> m_lights;
    bool m_dirty { true };
    std::uint64_t m_revision { 0 };
};
