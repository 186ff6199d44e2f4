// SPDX-License-Identifier: MIT
#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

constexpr int kMaxShadowCascades = 8;

// std140 layout of CascadeShadowBlock in shaders/csm_fragment.glsl.
struct alignas(16) CascadeUniformBlock {
    std::array<glm::mat4, kMaxShadowCascades> cascadeViewProj {};
    std::array<glm::vec4, kMaxShadowCascades> cascadeIntervals {}; // start, end, texel size, unused
    glm::vec4 cascadeParams { 0.0f };                              // cameraNear, shadowFar, opacity, count
    glm::vec4 lightDirection { 0.0f };
};

// Cascade parameters for the materials that opted into cascaded shadows. Each material owns its
// own block and defines preamble; nothing is written into shared shader state.
class CascadeMaterialBindings {
public:
    using MaterialId = std::uint64_t;

    struct FrameState {
        std::vector<glm::vec2> intervals;
        std::vector<glm::mat4> viewProjections;
        std::vector<float> texelSizes;
        float cameraNear { 0.0f };
        float shadowFar { 0.0f };
        float shadowOpacity { 1.0f };
        glm::vec3 lightDirection { 0.0f, -1.0f, 0.0f };
        bool fade { false };
    };

    struct MaterialParams {
        std::string preamble;
        CascadeUniformBlock block {};
        int cascadeCount { 0 };
        bool fade { false };
        bool needsRecompile { true };
    };

    CascadeMaterialBindings() = default;

    // Registers the material (or returns the existing entry) with the current cascade state.
    const MaterialParams& setupMaterial(MaterialId id);
    bool releaseMaterial(MaterialId id);
    void clear();

    // Pushes the latest cascade state into every registered material.
    void update(const FrameState& state);

    [[nodiscard]] const MaterialParams* find(MaterialId id) const;
    // Returns whether the material's preamble changed since it was last compiled and clears the flag.
    bool consumeRecompile(MaterialId id);
    [[nodiscard]] std::size_t materialCount() const { return m_materials.size(); }
    [[nodiscard]] const FrameState& frameState() const { return m_state; }

    [[nodiscard]] static std::string buildPreamble(int cascadeCount, bool fade);
    [[nodiscard]] static CascadeUniformBlock buildBlock(const FrameState& state);

private:
    void apply(MaterialParams& params) const;

    FrameState m_state {};
    std::unordered_map<MaterialId, MaterialParams> m_materials;
};
