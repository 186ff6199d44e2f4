// SPDX-License-Identifier: MIT
#pragma once

#include <glm/vec2.hpp>

#include <vector>

// CPU mirror of the cascade choice made in shaders/csm_fragment.glsl.
namespace CascadeFragmentSelector {

// x = start, y = end of each cascade's share of [0, 1].
[[nodiscard]] std::vector<glm::vec2> depthIntervals(const std::vector<float>& splits);

// viewDepth is the positive distance along the view direction (-viewSpace.z).
[[nodiscard]] float linearDepth(float viewDepth, float cameraNear, float shadowFar);

// Cascade i covers [splits[i-1], splits[i]); the last one is open to the right and depths below
// zero fall into the first, so every depth maps to exactly one cascade.
[[nodiscard]] int selectCascade(float linearDepth, const std::vector<float>& splits);
[[nodiscard]] int selectCascadeForViewDepth(float viewDepth, float cameraNear, float shadowFar, const std::vector<float>& splits);

} // namespace CascadeFragmentSelector
