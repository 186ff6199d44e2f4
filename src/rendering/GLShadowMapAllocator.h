// SPDX-License-Identifier: MIT
#pragma once

#include "rendering/ShadowMapAllocator.h"

// Depth-texture allocator for a current OpenGL 4.5 context.
class GLShadowMapAllocator : public ShadowMapAllocator {
public:
    static constexpr int kMinResolution = 32;

    GLShadowMapAllocator() = default;
    GLShadowMapAllocator(const GLShadowMapAllocator&) = delete;
    GLShadowMapAllocator& operator=(const GLShadowMapAllocator&) = delete;

    [[nodiscard]] ShadowMapHandle allocate(int resolution) override;
    void release(const ShadowMapHandle& handle) override;
};
