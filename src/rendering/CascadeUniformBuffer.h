// SPDX-License-Identifier: MIT
#pragma once

#include "rendering/CascadeMaterialBindings.h"

#include <framework/opengl_includes.h>

// GL uniform buffer holding one CascadeUniformBlock.
class CascadeUniformBuffer {
public:
    static constexpr GLuint kCascadeBlockBinding = 3;

    CascadeUniformBuffer() = default;
    CascadeUniformBuffer(const CascadeUniformBuffer&) = delete;
    CascadeUniformBuffer(CascadeUniformBuffer&& other) noexcept;
    ~CascadeUniformBuffer();

    CascadeUniformBuffer& operator=(const CascadeUniformBuffer&) = delete;
    CascadeUniformBuffer& operator=(CascadeUniformBuffer&& other) noexcept;

    void upload(const CascadeUniformBlock& block);
    void bind(GLuint binding = kCascadeBlockBinding) const;

    [[nodiscard]] GLuint id() const { return m_buffer; }

private:
    void destroy();

    GLuint m_buffer { 0 };
};
