// SPDX-License-Identifier: MIT
#include "rendering/GLShadowMapAllocator.h"

#include <fmt/format.h>

#include <glm/gtc/type_ptr.hpp>
#include <glm/vec4.hpp>

#include <algorithm>

namespace {

constexpr glm::vec4 kShadowBorderColor(1.0f, 1.0f, 1.0f, 1.0f);

void drainGlErrors()
{
    while (glGetError() != GL_NO_ERROR) {
    }
}

} // namespace

ShadowMapHandle GLShadowMapAllocator::allocate(int resolution)
{
    resolution = std::max(resolution, kMinResolution);

    GLint maxSize = 0;
    glGetIntegerv(GL_MAX_TEXTURE_SIZE, &maxSize);
    if (maxSize > 0 && resolution > maxSize)
        throw ShadowMapAllocationError(fmt::format("Shadow map resolution {} exceeds GL_MAX_TEXTURE_SIZE {}", resolution, maxSize));

    drainGlErrors();

    GLuint texture = 0;
    glGenTextures(1, &texture);
    if (texture == 0)
        throw ShadowMapAllocationError("glGenTextures returned no shadow map texture");

    glBindTexture(GL_TEXTURE_2D, texture);
    glTexImage2D(GL_TEXTURE_2D,
        0,
        GL_DEPTH_COMPONENT24,
        resolution,
        resolution,
        0,
        GL_DEPTH_COMPONENT,
        GL_UNSIGNED_INT,
        nullptr);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_BORDER);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_BORDER);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_COMPARE_MODE, GL_COMPARE_REF_TO_TEXTURE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_COMPARE_FUNC, GL_LEQUAL);
    glTexParameterfv(GL_TEXTURE_2D, GL_TEXTURE_BORDER_COLOR, glm::value_ptr(kShadowBorderColor));
    glBindTexture(GL_TEXTURE_2D, 0);

    const GLenum error = glGetError();
    if (error != GL_NO_ERROR) {
        glDeleteTextures(1, &texture);
        throw ShadowMapAllocationError(fmt::format("Failed to allocate {}x{} shadow map (GL error 0x{:X})", resolution, resolution, error));
    }

    return ShadowMapHandle { texture, resolution };
}

void GLShadowMapAllocator::release(const ShadowMapHandle& handle)
{
    if (handle.texture == 0)
        return;
    GLuint texture = handle.texture;
    glDeleteTextures(1, &texture);
}
